#include "hubxfer/hub_backend.hpp"
#include <format>

namespace hubxfer {

std::string_view to_string(EndpointKind kind) {
    return kind == EndpointKind::ReferenceHub ? "reference-hub" : "self-hosted";
}

void BackendRegistry::add(EndpointKind kind, BackendFactory factory) {
    factories_[kind] = std::move(factory);
}

bool BackendRegistry::has(EndpointKind kind) const {
    return factories_.contains(kind);
}

std::expected<std::unique_ptr<HubBackend>, TransferErrorInfo> BackendRegistry::create(
    const Endpoint& endpoint,
    const BackendOptions& options
) const {
    auto it = factories_.find(endpoint.kind);
    if (it == factories_.end()) {
        return std::unexpected(TransferErrorInfo{
            TransferError::DependencyMissing,
            std::format("No {} adapter available for {} (requires repo_info, list_files, download, upload, create)",
                        to_string(endpoint.kind), endpoint.base_url),
            std::nullopt
        });
    }
    return it->second(endpoint, options);
}

} // namespace hubxfer
