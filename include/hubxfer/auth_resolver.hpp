#pragma once

#include "errors.hpp"
#include "types.hpp"
#include <expected>
#include <optional>
#include <string>

namespace hubxfer {

enum class Side {
    Source,
    Target
};

enum class Access {
    Read,
    Write
};

std::string_view to_string(Side side);

// Effective token for one side of a session:
// side token, then --hf-token (reference hub only), then the fallback token.
// Empty strings count as absent.
std::optional<std::string> resolve_token(const TransferSession& session, Side side);

// As resolve_token, but a write without any credential fails up front
std::expected<std::optional<std::string>, TransferErrorInfo> require_token(
    const TransferSession& session,
    Side side,
    Access access
);

// Copy of the side's endpoint carrying its resolved token
Endpoint authenticated_endpoint(const TransferSession& session, Side side);

} // namespace hubxfer
