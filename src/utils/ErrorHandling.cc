#include "ledge/utils/ErrorHandling.hh"
#include "ledge/core/Log.hh"

namespace ledge {

LedgeException::LedgeException(const std::string &message)
    : message(message) {}

const char *LedgeException::what() const noexcept { return message.c_str(); }

void throwError(const std::string &message) {
  LEDGE_LOG_ERROR("LedgeException: {}", message);
  throw LedgeException(message);
}

std::string_view errorCodeToString(ErrorCode code) {
  switch (code) {
  case ErrorCode::Ok:
    return "Ok";
  case ErrorCode::InvalidArgument:
    return "InvalidArgument";
  case ErrorCode::InvalidState:
    return "InvalidState";
  case ErrorCode::NotFound:
    return "NotFound";
  case ErrorCode::ParseError:
    return "ParseError";
  case ErrorCode::Internal:
    return "Internal";
  }
  return "Unknown";
}

} // namespace ledge
