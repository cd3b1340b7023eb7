#include "hubxfer/repo_type_detector.hpp"
#include "hubxfer/log.hpp"
#include <format>

namespace hubxfer {

std::expected<RepoKind, TransferErrorInfo> RepoTypeDetector::detect(
    const RepoRef& ref,
    const std::optional<RepoKind>& override_kind,
    const std::optional<std::string>& revision
) {
    probes_.clear();
    if (override_kind && *override_kind != RepoKind::Unknown) return *override_kind;

    for (RepoKind candidate : kProbeOrder) {
        RepoRef probe = ref;
        probe.kind = candidate;
        probes_.push_back(candidate);

        auto info = source_.repo_info(probe, revision);
        if (info) {
            log::debug("Probe {} '{}': found", to_string(candidate), ref.id());
            return candidate;
        }
        if (info.error().error != HubError::NotFound) {
            return std::unexpected(to_transfer_error(info.error()));
        }
        log::debug("Probe {} '{}': not found", to_string(candidate), ref.id());
    }

    return std::unexpected(TransferErrorInfo{
        TransferError::NotFound,
        std::format("Repository '{}' not found", ref.id()),
        404
    });
}

} // namespace hubxfer
