#pragma once
#include <stdexcept>
#include <string>
#include <string_view>

namespace procrt {

enum class ErrorKind { None, ResourceExhausted, InvalidProcess, PermissionDenied, StoreUnavailable };

std::string_view to_string(ErrorKind e);

/// Raised inside the store when a transaction cannot be made durable or would
/// break a pool invariant. Components turn it into ErrorKind::StoreUnavailable.
class StoreError : public std::runtime_error {
public:
    explicit StoreError(const std::string& what) : std::runtime_error(what) {}
};

} // namespace procrt
