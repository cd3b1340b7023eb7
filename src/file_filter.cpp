#include "hubxfer/file_filter.hpp"
#include <algorithm>
#include <cctype>

namespace hubxfer {

namespace {

std::vector<std::string_view> split_path(std::string_view path) {
    std::vector<std::string_view> parts;
    while (!path.empty()) {
        auto slash = path.find('/');
        auto part = path.substr(0, slash);
        if (!part.empty()) parts.push_back(part);
        if (slash == std::string_view::npos) break;
        path.remove_prefix(slash + 1);
    }
    return parts;
}

bool contains(const std::vector<std::string>& list, std::string_view s) {
    return std::find(list.begin(), list.end(), s) != list.end();
}

bool iends_with(std::string_view s, std::string_view suffix) {
    if (suffix.size() > s.size()) return false;
    return std::equal(suffix.begin(), suffix.end(), s.end() - suffix.size(), [](char a, char b) {
        return std::tolower(static_cast<unsigned char>(a)) == std::tolower(static_cast<unsigned char>(b));
    });
}

} // namespace

bool FilterRules::excludes(std::string_view path) const {
    auto parts = split_path(path);
    if (parts.empty()) return true;

    std::string_view name = parts.back();
    for (size_t i = 0; i < parts.size(); ++i) {
        std::string_view seg = parts[i];
        bool is_dir = i + 1 < parts.size();
        if (is_dir && (contains(cache_dirs, seg) || contains(vcs_dirs, seg))) return true;
        if (seg.front() == '.' && !(!is_dir && contains(whitelist, seg))) return true;
    }

    if (contains(junk_names, name)) return true;
    return std::any_of(junk_suffixes.begin(), junk_suffixes.end(), [name](const std::string& s) {
        return name.ends_with(s);
    });
}

bool has_large_object_extension(std::string_view path, const std::vector<std::string>& extensions) {
    return std::any_of(extensions.begin(), extensions.end(), [path](const std::string& ext) {
        return iends_with(path, ext);
    });
}

TransferPlan build_plan(
    const std::vector<FileEntry>& entries,
    const TransferOptions& options,
    const FilterRules& rules
) {
    TransferPlan plan;
    for (const auto& entry : entries) {
        if (rules.excludes(entry.relative_path)) {
            plan.excluded.push_back(entry.relative_path);
            continue;
        }

        FileEntry file = entry;
        bool by_extension = has_large_object_extension(file.relative_path, options.large_object_extensions);
        file.is_large_object = file.is_large_object || by_extension
            || file.size_bytes >= options.large_object_threshold_bytes;

        if (!options.include_large_objects && by_extension) {
            plan.skipped.push_back(std::move(file));
        } else {
            plan.transfers.push_back(std::move(file));
        }
    }
    return plan;
}

} // namespace hubxfer
