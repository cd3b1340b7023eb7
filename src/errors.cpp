#include "hubxfer/errors.hpp"

namespace hubxfer {

std::string_view to_string(HubError error) {
    switch (error) {
        case HubError::NotFound: return "not found";
        case HubError::AlreadyExists: return "already exists";
        case HubError::AuthRequired: return "authentication required";
        case HubError::PermissionDenied: return "permission denied";
        case HubError::NetworkError: return "network error";
        case HubError::Timeout: return "timeout";
        case HubError::WriteError: return "write rejected";
        case HubError::ServerError: return "server error";
        case HubError::ParseError: return "malformed response";
        case HubError::ChecksumMismatch: return "checksum mismatch";
        case HubError::Cancelled: return "cancelled";
    }
    return "error";
}

std::string_view type_name(TransferError error) {
    switch (error) {
        case TransferError::DependencyMissing: return "DependencyMissing";
        case TransferError::Authentication: return "AuthenticationError";
        case TransferError::PermissionDenied: return "AuthorizationError";
        case TransferError::NotFound: return "NotFoundError";
        case TransferError::AlreadyExists: return "AlreadyExistsError";
        case TransferError::InvalidArgument: return "ValidationError";
        case TransferError::Network: return "NetworkError";
        case TransferError::Timeout: return "TimeoutError";
        case TransferError::Server: return "ServerError";
        case TransferError::Protocol: return "ProtocolError";
        case TransferError::Cancelled: return "Cancelled";
    }
    return "Error";
}

bool is_transient(HubError error) {
    return error == HubError::NetworkError || error == HubError::Timeout;
}

TransferError to_transfer_error(HubError error) {
    switch (error) {
        case HubError::NotFound: return TransferError::NotFound;
        case HubError::AlreadyExists: return TransferError::AlreadyExists;
        case HubError::AuthRequired: return TransferError::Authentication;
        case HubError::PermissionDenied: return TransferError::PermissionDenied;
        case HubError::NetworkError: return TransferError::Network;
        case HubError::Timeout: return TransferError::Timeout;
        case HubError::ServerError: return TransferError::Server;
        case HubError::Cancelled: return TransferError::Cancelled;
        case HubError::WriteError:
        case HubError::ParseError:
        case HubError::ChecksumMismatch:
            break;
    }
    return TransferError::Protocol;
}

TransferErrorInfo to_transfer_error(const HubErrorInfo& info) {
    TransferErrorInfo out{to_transfer_error(info.error), info.message, std::nullopt};
    if (info.status_code != 0) out.status_code = info.status_code;
    return out;
}

int exit_code(TransferError error) {
    switch (error) {
        case TransferError::Authentication: return 3;
        case TransferError::NotFound: return 7;
        default: return 1;
    }
}

std::string_view remediation_hint(TransferError error) {
    switch (error) {
        case TransferError::DependencyMissing:
            return "Rebuild with HUBXFER_WITH_REFERENCE_HUB=ON or choose a self-hosted endpoint";
        case TransferError::Authentication:
            return "Pass --src-token/--target-token/--hf-token/--token or set HF_TOKEN";
        case TransferError::PermissionDenied:
            return "Check that the token has write access to the destination namespace";
        case TransferError::NotFound:
            return "Check the repository id, --repo-type and --src-endpoint";
        case TransferError::AlreadyExists:
            return "Use --force to upload into the existing repository";
        case TransferError::InvalidArgument:
            return "Repository ids must be in format 'namespace/name'";
        case TransferError::Network:
        case TransferError::Timeout:
            return "Check connectivity to both endpoints and retry";
        default:
            return "";
    }
}

} // namespace hubxfer
