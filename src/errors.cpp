#include "procrt/errors.hpp"

namespace procrt {

std::string_view to_string(ErrorKind e) {
    switch (e) {
    case ErrorKind::None:              return "none";
    case ErrorKind::ResourceExhausted: return "resource_exhausted";
    case ErrorKind::InvalidProcess:    return "invalid_process";
    case ErrorKind::PermissionDenied:  return "permission_denied";
    case ErrorKind::StoreUnavailable:  return "store_unavailable";
    }
    return "unknown";
}

} // namespace procrt
