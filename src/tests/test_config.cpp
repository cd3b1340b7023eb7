#include "hubxfer/config.hpp"
#include <cassert>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <unistd.h>

using namespace hubxfer;
namespace fs = std::filesystem;

fs::path write_config(const fs::path& dir, const std::string& content) {
    fs::create_directories(dir);
    auto path = dir / "config.json";
    std::ofstream(path) << content;
    return path;
}

int main() {
    std::cout << "Testing configuration...\n\n";
    auto dir = fs::temp_directory_path() / ("hubxfer-config-test-" + std::to_string(::getpid()));
    ::setenv("HUBXFER_CONFIG_DIR", dir.c_str(), 1);
    ::unsetenv("HF_ENDPOINT");
    ::unsetenv("HF_TOKEN");

    {
        fs::remove_all(dir);
        Config cfg = Config::load();
        assert(cfg.endpoint() == "http://localhost:28080");
        assert(!cfg.token().has_value());
        assert(!cfg.threads().has_value());
        std::cout << "✓ Test 1 passed: Defaults without a file\n";
    }

    {
        write_config(dir, R"({"endpoint":"https://hub.example.com","token":"file-tok","threads":8,
                              "large_object_extensions":[".bin",".pt"]})");
        assert(Config::config_dir() == dir);
        Config cfg = Config::load();
        assert(cfg.endpoint() == "https://hub.example.com");
        assert(cfg.token() == "file-tok");
        assert(cfg.threads() == 8u);
        assert(cfg.large_object_extensions()->size() == 2);
        std::cout << "✓ Test 2 passed: Values read from config.json\n";

        ::setenv("HF_ENDPOINT", "http://env:9000", 1);
        ::setenv("HF_TOKEN", "env-tok", 1);
        assert(cfg.endpoint() == "http://env:9000");
        assert(cfg.token() == "env-tok");
        ::unsetenv("HF_ENDPOINT");
        ::unsetenv("HF_TOKEN");
        std::cout << "✓ Test 3 passed: Environment wins over the file\n";
    }

    {
        auto path = write_config(dir, "{not json");
        auto direct = Config::load_file(path);
        assert(!direct.has_value());
        assert(direct.error().message.find("config.json") != std::string::npos);
        Config cfg = Config::load();
        assert(cfg.endpoint() == "http://localhost:28080");
        std::cout << "✓ Test 4 passed: Malformed file ignored\n";
    }

    fs::remove_all(dir);
    std::cout << "\n✓ All config tests passed\n";
    return 0;
}
