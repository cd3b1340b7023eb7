#include "hubxfer/auth_resolver.hpp"
#include <format>

namespace hubxfer {

namespace {

const std::optional<std::string>& present(const std::optional<std::string>& token) {
    static const std::optional<std::string> none;
    return (token && !token->empty()) ? token : none;
}

const RepoSide& side_of(const TransferSession& session, Side side) {
    return side == Side::Source ? session.source : session.dest;
}

} // namespace

std::string_view to_string(Side side) {
    return side == Side::Source ? "source" : "target";
}

std::optional<std::string> resolve_token(const TransferSession& session, Side side) {
    const auto& creds = session.credentials;
    const auto& own = side == Side::Source ? creds.src_token : creds.target_token;

    if (present(own)) return own;
    if (side_of(session, side).endpoint.kind == EndpointKind::ReferenceHub && present(creds.reference_hub_token)) {
        return creds.reference_hub_token;
    }
    if (present(creds.fallback_token)) return creds.fallback_token;
    return std::nullopt;
}

std::expected<std::optional<std::string>, TransferErrorInfo> require_token(
    const TransferSession& session,
    Side side,
    Access access
) {
    auto token = resolve_token(session, side);
    if (!token && access == Access::Write) {
        const auto& endpoint = side_of(session, side).endpoint;
        return std::unexpected(TransferErrorInfo{
            TransferError::Authentication,
            std::format("No token available for writing to {} endpoint {}", to_string(side), endpoint.display_name()),
            std::nullopt
        });
    }
    return token;
}

Endpoint authenticated_endpoint(const TransferSession& session, Side side) {
    Endpoint ep = side_of(session, side).endpoint;
    ep.auth_token = resolve_token(session, side);
    return ep;
}

} // namespace hubxfer
