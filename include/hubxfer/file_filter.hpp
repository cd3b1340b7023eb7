#pragma once

#include "types.hpp"
#include <string>
#include <string_view>
#include <vector>

namespace hubxfer {

struct FilterRules {
    std::vector<std::string> whitelist{".gitattributes"};
    std::vector<std::string> cache_dirs{"__pycache__", ".cache", ".pytest_cache", "node_modules", ".huggingface"};
    std::vector<std::string> vcs_dirs{".git", ".svn", ".hg"};
    std::vector<std::string> junk_names{".DS_Store"};
    std::vector<std::string> junk_suffixes{".lock", ".tmp", ".temp"};

    // Unconditional exclusion: hidden segments, caches, VCS metadata, lock/temp files
    bool excludes(std::string_view path) const;
};

// Immutable result of filtering one enumeration, in enumeration order
struct TransferPlan {
    std::vector<FileEntry> transfers;
    std::vector<FileEntry> skipped;   // large objects left out on request; counted as skipped
    std::vector<std::string> excluded; // never counted

    size_t planned() const { return transfers.size() + skipped.size(); }
};

// Case-insensitive match against the configured large-object extensions
bool has_large_object_extension(std::string_view path, const std::vector<std::string>& extensions);

TransferPlan build_plan(
    const std::vector<FileEntry>& entries,
    const TransferOptions& options,
    const FilterRules& rules = {}
);

} // namespace hubxfer
