#include "zw/common.hpp"

#include <sstream>

#ifndef ZW_VERSION_MAJOR
#define ZW_VERSION_MAJOR 0
#define ZW_VERSION_MINOR 1
#define ZW_VERSION_PATCH 0
#endif

namespace zw {

std::string_view errorCodeToString(ErrorCode code) {
  switch (code) {
    case ErrorCode::kSuccess:
      return "Success";
    case ErrorCode::kInvalidArgument:
      return "Invalid argument";
    case ErrorCode::kFileReadError:
      return "File read error";
    case ErrorCode::kFileWriteError:
      return "File write error";
    case ErrorCode::kFileError:
      return "File error";
    case ErrorCode::kValidationError:
      return "Validation error";
    case ErrorCode::kConfigError:
      return "Configuration error";
    case ErrorCode::kInvalidState:
      return "Invalid state";
    case ErrorCode::kNotFound:
      return "Not found";
    case ErrorCode::kUnknownError:
      return "Unknown error";
  }
  return "Unknown error";
}

std::string Error::describe() const {
  std::string result(errorCodeToString(code_));
  if (!message_.empty()) {
    result += ": ";
    result += message_;
  }
  return result;
}

std::string Version::toString() const {
  std::ostringstream oss;
  oss << major << "." << minor << "." << patch;
  if (!build.empty()) {
    oss << "+" << build;
  }
  return oss.str();
}

Version getVersion() {
#ifdef ZW_VERSION_BUILD
  return Version{ZW_VERSION_MAJOR, ZW_VERSION_MINOR, ZW_VERSION_PATCH, ZW_VERSION_BUILD};
#else
  return Version{ZW_VERSION_MAJOR, ZW_VERSION_MINOR, ZW_VERSION_PATCH, ""};
#endif
}

}  // namespace zw
