#pragma once

#include <optional>
#include <string>
#include <string_view>

namespace hubxfer {

// Errors reported by a hub backend for a single call
enum class HubError {
    NotFound,
    AlreadyExists,
    AuthRequired,
    PermissionDenied,
    NetworkError,
    Timeout,
    WriteError,
    ServerError,
    ParseError,
    ChecksumMismatch,
    Cancelled
};

struct HubErrorInfo {
    HubError error;
    std::string message;
    int status_code = 0;
};

// Session-level taxonomy; Authentication and NotFound carry dedicated exit codes
enum class TransferError {
    DependencyMissing,
    Authentication,
    PermissionDenied,
    NotFound,
    AlreadyExists,
    InvalidArgument,
    Network,
    Timeout,
    Server,
    Protocol,
    Cancelled
};

struct TransferErrorInfo {
    TransferError error;
    std::string message;
    std::optional<int> status_code;
};

std::string_view to_string(HubError error);
std::string_view type_name(TransferError error);

// Network faults and timeouts are worth another attempt; everything else is final
bool is_transient(HubError error);

TransferError to_transfer_error(HubError error);
TransferErrorInfo to_transfer_error(const HubErrorInfo& info);

int exit_code(TransferError error);
std::string_view remediation_hint(TransferError error);

} // namespace hubxfer
