#pragma once

#include <unistd.h>
#include <atomic>
#include <format>
#include <mutex>
#include <string>
#include <string_view>

namespace hubxfer::log {

enum class Level {
    Quiet,   // errors only
    Normal,
    Verbose
};

// Serialised writer shared by the CLI and every transfer worker
class Writer {
public:
    static void print(std::string_view s) {
        std::lock_guard<std::mutex> lock(get_mutex());
        write_all(STDOUT_FILENO, s);
    }

    static void error(std::string_view s) {
        std::lock_guard<std::mutex> lock(get_mutex());
        write_all(STDERR_FILENO, s);
    }

    static void set_level(Level level) { level_.store(level); }
    static Level level() { return level_.load(); }

private:
    static void write_all(int fd, std::string_view s) {
        while (!s.empty()) {
            ssize_t n = ::write(fd, s.data(), s.size());
            if (n <= 0) return;
            s.remove_prefix(static_cast<size_t>(n));
        }
    }

    static std::mutex& get_mutex() {
        static std::mutex m;
        return m;
    }

    inline static std::atomic<Level> level_{Level::Normal};
};

template<typename... Args>
void info(std::format_string<Args...> fmt, Args&&... args) {
    if (Writer::level() == Level::Quiet) return;
    Writer::print(std::format(fmt, std::forward<Args>(args)...) + "\n");
}

template<typename... Args>
void debug(std::format_string<Args...> fmt, Args&&... args) {
    if (Writer::level() != Level::Verbose) return;
    Writer::print(std::format(fmt, std::forward<Args>(args)...) + "\n");
}

template<typename... Args>
void warn(std::format_string<Args...> fmt, Args&&... args) {
    Writer::error("Warning: " + std::format(fmt, std::forward<Args>(args)...) + "\n");
}

template<typename... Args>
void error(std::format_string<Args...> fmt, Args&&... args) {
    Writer::error(std::format(fmt, std::forward<Args>(args)...) + "\n");
}

} // namespace hubxfer::log
