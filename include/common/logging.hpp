#ifndef USML_LOGGING_HPP
#define USML_LOGGING_HPP

#include <atomic>
#include <iostream>
#include <mutex>
#include <optional>
#include <string>

namespace common::log {

enum class Level {
    Debug,
    Info,
    Warning,
    Error,
    Off
};

namespace detail {
    inline std::atomic<Level>& threshold() {
        static std::atomic<Level> level{Level::Warning};
        return level;
    }

    inline std::mutex& sink_mutex() {
        static std::mutex mutex;
        return mutex;
    }

    inline const char* level_name(Level level) {
        switch (level) {
            case Level::Debug: return "debug";
            case Level::Info: return "info";
            case Level::Warning: return "warning";
            case Level::Error: return "error";
            case Level::Off: break;
        }
        return "off";
    }
}

inline void set_level(Level level) {
    detail::threshold().store(level);
}

inline bool enabled(Level level) {
    return level != Level::Off && level >= detail::threshold().load();
}

// Accepts debug/info/warning/error/off
inline std::optional<Level> parse_level(const std::string& name) {
    if (name == "debug") return Level::Debug;
    if (name == "info") return Level::Info;
    if (name == "warning" || name == "warn") return Level::Warning;
    if (name == "error") return Level::Error;
    if (name == "off") return Level::Off;
    return std::nullopt;
}

inline void write(Level level, const std::string& message) {
    if (!enabled(level)) {
        return;
    }
    std::lock_guard<std::mutex> lock(detail::sink_mutex());
    std::cerr << "[usml] " << detail::level_name(level) << ": " << message << std::endl;
}

inline void debug(const std::string& message) { write(Level::Debug, message); }
inline void info(const std::string& message) { write(Level::Info, message); }
inline void warning(const std::string& message) { write(Level::Warning, message); }
inline void error(const std::string& message) { write(Level::Error, message); }

} // namespace common::log

#endif // USML_LOGGING_HPP
