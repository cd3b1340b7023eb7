#pragma once

#include "errors.hpp"
#include "hub_backend.hpp"
#include "types.hpp"
#include <array>
#include <expected>
#include <optional>
#include <vector>

namespace hubxfer {

// Ordered probe over the source hub's metadata lookup. Most repositories are
// models, so model is tried first; a NotFound advances to the next candidate.
class RepoTypeDetector {
public:
    static constexpr std::array<RepoKind, 2> kProbeOrder{RepoKind::Model, RepoKind::Dataset};

    explicit RepoTypeDetector(HubBackend& source) : source_(source) {}

    // An override is returned as-is without touching the hub
    std::expected<RepoKind, TransferErrorInfo> detect(
        const RepoRef& ref,
        const std::optional<RepoKind>& override_kind,
        const std::optional<std::string>& revision = std::nullopt
    );

    // Kinds queried by the last detect(), in order
    const std::vector<RepoKind>& probes() const { return probes_; }

private:
    HubBackend& source_;
    std::vector<RepoKind> probes_;
};

} // namespace hubxfer
