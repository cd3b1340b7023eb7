#include "hubxfer/hub_client.hpp"
#include <format>

namespace hubxfer {

ReferenceHub::ReferenceHub(Endpoint endpoint, const BackendOptions& options)
    : HttpHubBackend(std::move(endpoint), options) {}

std::string ReferenceHub::resolve_url(const RepoRef& ref, const std::string& revision, const std::string& path) const {
    std::string id = ref.owner.empty()
        ? url_encode(ref.name)
        : std::format("{}/{}", url_encode(ref.owner), url_encode(ref.name));
    return std::format("{}/{}{}/resolve/{}/{}",
                       endpoint_.base_url, kind_prefix(ref.kind), id, url_encode(revision), url_encode(path, true));
}

HubErrorInfo ReferenceHub::map_status(const HttpResponse& response, std::string_view what) const {
    auto info = HttpHubBackend::map_status(response, what);
    // Private and missing repos are indistinguishable to anonymous callers;
    // the hub tags the latter so they can still be told apart.
    auto code = response.header("x-error-code");
    if (code && (*code == "RepoNotFound" || *code == "EntryNotFound" || *code == "RevisionNotFound")) {
        info.error = HubError::NotFound;
    } else if (code && *code == "GatedRepo") {
        info.error = HubError::PermissionDenied;
    }
    return info;
}

} // namespace hubxfer
