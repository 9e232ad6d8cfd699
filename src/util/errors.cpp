#include "safe_text/errors.hpp"
#include <cerrno>
#include <new>
#include <system_error>

namespace st {

const char* error_kind_name(ErrorKind k) noexcept {
  switch (k) {
    case ErrorKind::NotFound:         return "NotFound";
    case ErrorKind::PermissionDenied: return "PermissionDenied";
    case ErrorKind::AlreadyExists:    return "AlreadyExists";
    case ErrorKind::DecodingError:    return "DecodingError";
    case ErrorKind::EncodingError:    return "EncodingError";
    case ErrorKind::OsError:          return "OsError";
    case ErrorKind::ParameterError:   return "ParameterError";
    case ErrorKind::UnknownError:     return "UnknownError";
  }
  return "UnknownError";
}

Error::Error(ErrorKind kind, std::string error_code, const std::string& message,
             std::string details, std::exception_ptr original)
  : std::runtime_error(message),
    kind_(kind),
    code_(std::move(error_code)),
    details_(std::move(details)),
    original_(std::move(original)) {}

Error error_from_errno(int err, std::string_view what, const std::string& path) {
  if (err == 0) err = EIO;
  auto orig = std::make_exception_ptr(
      std::system_error(err, std::generic_category(), std::string(what)));
  const std::string msg = std::string(what) + " failed: " + path;
  const std::string detail = std::generic_category().message(err);
  switch (err) {
    case ENOENT:
    case ENOTDIR:
      return Error(ErrorKind::NotFound, "file-not-found", msg, detail, orig);
    case EACCES:
    case EPERM:
      return Error(ErrorKind::PermissionDenied, "permission-denied", msg, detail, orig);
    case EEXIST:
      return Error(ErrorKind::AlreadyExists, "file-exists", msg, detail, orig);
    default:
      return Error(ErrorKind::OsError, "os-error", msg, detail, orig);
  }
}

void rethrow_mapped(const std::string& path) {
  try {
    throw;
  } catch (const Error&) {
    throw;
  } catch (const std::bad_alloc&) {
    throw Error(ErrorKind::UnknownError, "out-of-memory",
                "allocation failed while reading: " + path, {},
                std::current_exception());
  } catch (const std::system_error& e) {
    throw Error(ErrorKind::OsError, "os-error", "I/O failure while reading: " + path,
                e.what(), std::current_exception());
  } catch (const std::exception& e) {
    throw Error(ErrorKind::UnknownError, "unknown", "unexpected failure while reading: " + path,
                e.what(), std::current_exception());
  } catch (...) {
    throw Error(ErrorKind::UnknownError, "unknown", "unexpected failure while reading: " + path,
                {}, std::current_exception());
  }
}

}
