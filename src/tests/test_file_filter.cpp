#include "hubxfer/file_filter.hpp"
#include <cassert>
#include <iostream>

using namespace hubxfer;

std::vector<FileEntry> entries(std::initializer_list<std::pair<const char*, size_t>> files) {
    std::vector<FileEntry> out;
    for (const auto& [path, size] : files) out.push_back(FileEntry{path, size, "", false});
    return out;
}

void test_exclusions() {
    std::cout << "Testing unconditional exclusions...\n\n";
    FilterRules rules;

    assert(rules.excludes(".git/HEAD"));
    assert(rules.excludes("sub/.svn/entries"));
    assert(rules.excludes(".hg/store"));
    std::cout << "✓ Test 1 passed: VCS metadata\n";

    assert(rules.excludes("__pycache__/mod.cpython-311.pyc"));
    assert(rules.excludes("src/node_modules/x/index.js"));
    assert(rules.excludes(".cache/huggingface/x"));
    assert(rules.excludes("a/.pytest_cache/v/cache"));
    assert(rules.excludes(".huggingface/metadata"));
    std::cout << "✓ Test 2 passed: Cache directories\n";

    assert(rules.excludes(".env"));
    assert(rules.excludes("dir/.hidden"));
    assert(rules.excludes(".config/settings.json"));
    assert(rules.excludes("docs/.DS_Store"));
    assert(!rules.excludes(".gitattributes"));
    assert(!rules.excludes("sub/.gitattributes"));
    std::cout << "✓ Test 3 passed: Hidden segments with whitelist\n";

    assert(rules.excludes("poetry.lock"));
    assert(rules.excludes("out/run.tmp"));
    assert(rules.excludes("scratch.temp"));
    assert(!rules.excludes("lockfile.txt"));
    assert(!rules.excludes("README.md"));
    assert(!rules.excludes("tokenizer/vocab.json"));
    std::cout << "✓ Test 4 passed: Lock and temp suffixes\n";
}

void test_plan() {
    std::cout << "\nTesting plan construction...\n\n";

    TransferOptions opts;
    auto files = entries({
        {"README.md", 2048},
        {".git/config", 10},
        {"weights.BIN", 500ull * 1024 * 1024},
        {"big.json", 20ull * 1024 * 1024},
        {"model.onnx", 100},
        {"notes.txt", 5},
    });

    auto plan = build_plan(files, opts);
    assert(plan.transfers.size() == 5);
    assert(plan.skipped.empty());
    assert(plan.excluded.size() == 1 && plan.excluded[0] == ".git/config");
    assert(plan.transfers[0].relative_path == "README.md");
    assert(!plan.transfers[0].is_large_object);
    assert(plan.transfers[1].is_large_object);  // extension, case-insensitive
    assert(plan.transfers[2].is_large_object);  // size threshold
    assert(plan.transfers[3].is_large_object);
    assert(!plan.transfers[4].is_large_object);
    std::cout << "✓ Test 5 passed: Large objects flagged by extension and size\n";

    opts.include_large_objects = false;
    plan = build_plan(files, opts);
    assert(plan.transfers.size() == 3);
    assert(plan.skipped.size() == 2);
    assert(plan.skipped[0].relative_path == "weights.BIN");
    assert(plan.skipped[1].relative_path == "model.onnx");
    assert(plan.transfers[1].relative_path == "big.json");
    assert(plan.planned() == 5);
    std::cout << "✓ Test 6 passed: Excluded large objects counted as skipped, size-only files kept\n";

    opts.large_object_extensions = {".json"};
    plan = build_plan(files, opts);
    assert(plan.skipped.size() == 1 && plan.skipped[0].relative_path == "big.json");
    std::cout << "✓ Test 7 passed: Extension set is configurable\n";

    FileEntry lfs{"data/blob.dat", 12, "abc", true};
    plan = build_plan({lfs}, TransferOptions{});
    assert(plan.transfers.size() == 1 && plan.transfers[0].is_large_object);
    std::cout << "✓ Test 8 passed: Backend LFS flag preserved\n";
}

int main() {
    test_exclusions();
    test_plan();
    std::cout << "\n✓ All file filter tests passed\n";
    return 0;
}
