#include "hubxfer/config.hpp"
#include "hubxfer/json.hpp"
#include "hubxfer/log.hpp"
#include <cstdlib>
#include <format>
#include <fstream>
#include <sstream>

namespace hubxfer {

namespace {

std::optional<std::string> env(const char* name) {
    const char* v = std::getenv(name);
    if (!v || !*v) return std::nullopt;
    return std::string(v);
}

} // namespace

std::filesystem::path Config::config_dir() {
    if (auto dir = env("HUBXFER_CONFIG_DIR")) return *dir;
    if (auto home = env("HOME")) return std::filesystem::path(*home) / ".hubxfer";
    return ".hubxfer";
}

std::expected<Config, ConfigError> Config::load_file(const std::filesystem::path& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in) return std::unexpected(ConfigError{std::format("Cannot open {}", path.string())});
    std::stringstream buf;
    buf << in.rdbuf();

    Config cfg;
    try {
        auto doc = json::parse(buf.str());
        if (!doc.is_object()) return std::unexpected(ConfigError{std::format("{}: top level must be an object", path.string())});

        if (doc["endpoint"].is_string() && !doc["endpoint"].as_string().empty()) cfg.endpoint_ = doc["endpoint"].as_string();
        if (doc["token"].is_string() && !doc["token"].as_string().empty()) cfg.token_ = doc["token"].as_string();
        if (doc["threads"].is_number() && doc["threads"].as_number() >= 1) {
            cfg.threads_ = static_cast<size_t>(doc["threads"].as_number());
        }
        if (doc["large_object_extensions"].is_array()) {
            std::vector<std::string> exts;
            for (const auto& e : doc["large_object_extensions"].as_array()) {
                if (e.is_string()) exts.push_back(e.as_string());
            }
            cfg.large_object_extensions_ = std::move(exts);
        }
    } catch (const json::ParseError& e) {
        return std::unexpected(ConfigError{std::format("{}: {}", path.string(), e.what())});
    }
    return cfg;
}

Config Config::load() {
    auto path = config_dir() / "config.json";
    std::error_code ec;
    if (!std::filesystem::exists(path, ec)) return Config{};

    auto cfg = load_file(path);
    if (!cfg) {
        log::warn("Ignoring config file: {}", cfg.error().message);
        return Config{};
    }
    return *cfg;
}

std::string Config::endpoint() const {
    if (auto e = env("HF_ENDPOINT")) return *e;
    return endpoint_.value_or(std::string(kDefaultEndpoint));
}

std::optional<std::string> Config::token() const {
    if (auto t = env("HF_TOKEN")) return t;
    return token_;
}

} // namespace hubxfer
