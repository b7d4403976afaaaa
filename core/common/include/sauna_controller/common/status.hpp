#pragma once

#include <string>

namespace sauna_controller {

enum class ErrorKind {
  kNone,
  kResolution,
  kConnection,
  kTransport,
  kValidation,
  kUnsupported,
  kBusy,
  kConfig,
};

inline const char* errorKindName(ErrorKind kind) {
  switch (kind) {
    case ErrorKind::kNone: return "none";
    case ErrorKind::kResolution: return "resolution";
    case ErrorKind::kConnection: return "connection";
    case ErrorKind::kTransport: return "transport";
    case ErrorKind::kValidation: return "validation";
    case ErrorKind::kUnsupported: return "unsupported";
    case ErrorKind::kBusy: return "busy";
    case ErrorKind::kConfig: return "config";
  }
  return "unknown";
}

struct Status {
  bool ok = true;
  std::string message;
  ErrorKind kind = ErrorKind::kNone;
};

inline Status okStatus(const std::string& message = "ok") {
  return Status{true, message, ErrorKind::kNone};
}

inline Status errorStatus(ErrorKind kind, const std::string& message) {
  return Status{false, message, kind};
}

}  // namespace sauna_controller
