#include "hubxfer/types.hpp"
#include <algorithm>

namespace hubxfer {

std::string_view to_string(RepoKind kind) {
    switch (kind) {
        case RepoKind::Model: return "model";
        case RepoKind::Dataset: return "dataset";
        case RepoKind::Space: return "space";
        case RepoKind::Unknown: break;
    }
    return "unknown";
}

std::optional<RepoKind> parse_repo_kind(std::string_view s) {
    if (s == "model") return RepoKind::Model;
    if (s == "dataset") return RepoKind::Dataset;
    if (s == "space") return RepoKind::Space;
    return std::nullopt;
}

Endpoint Endpoint::from_spec(std::string_view spec) {
    Endpoint ep;
    std::string url(spec == "hf" ? kReferenceHubUrl : spec);
    while (!url.empty() && url.back() == '/') url.pop_back();
    ep.base_url = url;
    ep.kind = (url == kReferenceHubUrl) ? EndpointKind::ReferenceHub : EndpointKind::SelfHosted;
    return ep;
}

std::string Endpoint::display_name() const {
    return kind == EndpointKind::ReferenceHub ? std::string("HuggingFace Hub") : base_url;
}

std::optional<RepoRef> RepoRef::parse(std::string_view repo_id) {
    if (repo_id.empty() || repo_id.front() == '/' || repo_id.back() == '/') return std::nullopt;
    if (std::count(repo_id.begin(), repo_id.end(), '/') > 1) return std::nullopt;

    RepoRef ref;
    if (auto slash = repo_id.find('/'); slash != std::string_view::npos) {
        ref.owner = std::string(repo_id.substr(0, slash));
        ref.name = std::string(repo_id.substr(slash + 1));
    } else {
        ref.name = std::string(repo_id);
    }
    return ref;
}

} // namespace hubxfer
