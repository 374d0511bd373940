#include "strata/utils/ErrorHandling.hh"
#include "strata/core/Log.hh"

namespace strata {

StrataException::StrataException(const std::string &message, ErrorCode code)
    : message_(message), code_(code) {}

const char *StrataException::what() const noexcept { return message_.c_str(); }

void throwError(const std::string &message) {
  throwError(ErrorCode::InvalidState, message);
}

void throwError(ErrorCode code, const std::string &message) {
  STRATA_LOG_ERROR("StrataException [{}]: {}", errorCodeToString(code), message);
  throw StrataException(message, code);
}

std::string_view errorCodeToString(ErrorCode code) {
  switch (code) {
  case ErrorCode::Ok:
    return "Ok";
  case ErrorCode::InvalidState:
    return "InvalidState";
  case ErrorCode::NotFound:
    return "NotFound";
  case ErrorCode::AlreadyExists:
    return "AlreadyExists";
  case ErrorCode::ResourceExhausted:
    return "ResourceExhausted";
  case ErrorCode::TypeMismatch:
    return "TypeMismatch";
  case ErrorCode::OutOfRange:
    return "OutOfRange";
  case ErrorCode::ParseError:
    return "ParseError";
  }
  return "Unknown";
}

} // namespace strata
