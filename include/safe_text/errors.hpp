#pragma once
#include <exception>
#include <stdexcept>
#include <string>
#include <string_view>

namespace st {

enum class ErrorKind {
  NotFound,
  PermissionDenied,
  AlreadyExists,   // write side only; never raised by the reader
  DecodingError,
  EncodingError,
  OsError,
  ParameterError,
  UnknownError
};

const char* error_kind_name(ErrorKind k) noexcept;

// Every failure leaving the reader is an st::Error. The low-level failure that
// caused it (std::system_error, std::bad_alloc, ...) is kept in original().
class Error : public std::runtime_error {
public:
  Error(ErrorKind kind, std::string error_code, const std::string& message,
        std::string details = {}, std::exception_ptr original = nullptr);

  ErrorKind kind() const noexcept { return kind_; }
  const std::string& error_code() const noexcept { return code_; }
  const std::string& details() const noexcept { return details_; }
  std::exception_ptr original() const noexcept { return original_; }
  bool has_original() const noexcept { return static_cast<bool>(original_); }

private:
  ErrorKind kind_;
  std::string code_;
  std::string details_;
  std::exception_ptr original_;
};

// Map an errno value from an OS call on `path` onto the taxonomy.
Error error_from_errno(int err, std::string_view what, const std::string& path);

// Used at the facade boundary: rethrows st::Error untouched, wraps anything
// else as UnknownError. Must be called from inside a catch block.
[[noreturn]] void rethrow_mapped(const std::string& path);

}
