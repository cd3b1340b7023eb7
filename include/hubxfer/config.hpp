#pragma once

#include <expected>
#include <filesystem>
#include <optional>
#include <string_view>
#include <string>
#include <vector>

namespace hubxfer {

inline constexpr std::string_view kDefaultEndpoint = "http://localhost:28080";

struct ConfigError {
    std::string message;
};

// Read-only view of $HUBXFER_CONFIG_DIR/config.json plus environment overrides.
// Only the CLI consults it; the engine sees a populated TransferSession.
class Config {
public:
    // Loads from the default location; a malformed file is reported and ignored
    static Config load();
    static std::expected<Config, ConfigError> load_file(const std::filesystem::path& path);

    static std::filesystem::path config_dir();

    // HF_ENDPOINT, then the file, then the built-in default
    std::string endpoint() const;
    // HF_TOKEN, then the file
    std::optional<std::string> token() const;
    std::optional<size_t> threads() const { return threads_; }
    const std::optional<std::vector<std::string>>& large_object_extensions() const { return large_object_extensions_; }

private:
    std::optional<std::string> endpoint_;
    std::optional<std::string> token_;
    std::optional<size_t> threads_;
    std::optional<std::vector<std::string>> large_object_extensions_;
};

} // namespace hubxfer
