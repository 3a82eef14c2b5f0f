#pragma once

// AvatarRig Logging
//
// - Severity levels NONE through TRACE
// - Per-module filtering with runtime level changes
// - Timestamped, fmt-formatted output
// - FATAL/ERROR are emitted even at level NONE

#include <iostream>
#include <cstdint>
#include <cstring>
#include <ctime>
#include <chrono>
#include <array>
#include <mutex>
#include <fmt/format.h>

// =============================================================================
// Log Levels
// =============================================================================
// Setting a level enables that level and every level with a lower value.

enum LogLevel {
    LOG_NONE  = 0,  // Quiet - only FATAL/ERROR output
    LOG_FATAL = 1,
    LOG_ERROR = 2,
    LOG_WARN  = 3,  // Unexpected but handled (degenerate model, missing clip)
    LOG_INFO  = 4,  // Setup/teardown milestones
    LOG_DEBUG = 5,
    LOG_TRACE = 6   // Per-tick detail
};

// =============================================================================
// Log Modules
// =============================================================================

enum LogModule {
    MOD_MOVEMENT = 0,   // Movement integration
    MOD_INPUT,          // Keyboard state
    MOD_ANIMATION,      // Clips, mixer, clip selection
    MOD_NORMALIZE,      // Model normalization
    MOD_SYNC,           // Transform synchronization
    MOD_INSTANCE,       // Instance ownership
    MOD_ASSET,          // Asset loading
    MOD_CONFIG,         // Configuration loading/saving
    MOD_DIAG,           // Structured diagnostics
    MOD_MAIN,           // Application / controller lifecycle
    MOD_COUNT           // Must be last
};

inline const char* GetModuleName(LogModule mod) {
    static const char* names[] = {
        "MOVEMENT", "INPUT", "ANIMATION", "NORMALIZE", "SYNC",
        "INSTANCE", "ASSET", "CONFIG", "DIAG", "MAIN"
    };
    if (mod >= 0 && mod < MOD_COUNT) {
        return names[mod];
    }
    return "UNKNOWN";
}

// Unknown names map to MOD_MAIN
inline LogModule ParseModuleName(const char* name) {
    for (int i = 0; i < MOD_COUNT; ++i) {
        LogModule mod = static_cast<LogModule>(i);
        if (strcmp(name, GetModuleName(mod)) == 0) {
            return mod;
        }
    }
    return MOD_MAIN;
}

inline const char* GetLevelName(LogLevel level) {
    switch (level) {
        case LOG_NONE:  return "NONE ";
        case LOG_FATAL: return "FATAL";
        case LOG_ERROR: return "ERROR";
        case LOG_WARN:  return "WARN ";
        case LOG_INFO:  return "INFO ";
        case LOG_DEBUG: return "DEBUG";
        case LOG_TRACE: return "TRACE";
        default:        return "?????";
    }
}

inline LogLevel ParseLevelName(const char* name) {
    if (strcmp(name, "NONE") == 0 || strcmp(name, "OFF") == 0) return LOG_NONE;
    if (strcmp(name, "FATAL") == 0) return LOG_FATAL;
    if (strcmp(name, "ERROR") == 0) return LOG_ERROR;
    if (strcmp(name, "WARN") == 0)  return LOG_WARN;
    if (strcmp(name, "INFO") == 0)  return LOG_INFO;
    if (strcmp(name, "DEBUG") == 0) return LOG_DEBUG;
    if (strcmp(name, "TRACE") == 0) return LOG_TRACE;
    return LOG_NONE;
}

// =============================================================================
// Logging State
// =============================================================================

class LogManager {
public:
    static LogManager& Instance() {
        static LogManager instance;
        return instance;
    }

    int GetGlobalLevel() const { return m_global_level; }
    void SetGlobalLevel(int level) { m_global_level = level; }

    // -1 means "use global level"
    int GetModuleLevel(LogModule mod) const {
        if (mod >= 0 && mod < MOD_COUNT) {
            return m_module_levels[mod];
        }
        return -1;
    }

    void SetModuleLevel(LogModule mod, int level) {
        if (mod >= 0 && mod < MOD_COUNT) {
            m_module_levels[mod] = level;
        }
    }

    bool ShouldLog(LogModule mod, LogLevel level) const {
        int mod_level = (mod >= 0 && mod < MOD_COUNT) ? m_module_levels[mod] : -1;

        // FATAL and ERROR pass unless the module was explicitly set below them
        if (level <= LOG_ERROR) {
            return !(mod_level >= 0 && mod_level < level);
        }

        int effective_level = mod_level >= 0 ? mod_level : m_global_level;
        return level <= effective_level;
    }

    void IncreaseLevel() {
        if (m_global_level < LOG_TRACE) {
            m_global_level++;
        }
    }

    void DecreaseLevel() {
        if (m_global_level > LOG_NONE) {
            m_global_level--;
        }
    }

    std::mutex& GetMutex() { return m_mutex; }

private:
    LogManager() : m_global_level(LOG_NONE) {
        m_module_levels.fill(-1);
    }

    int m_global_level;
    std::array<int, MOD_COUNT> m_module_levels;
    std::mutex m_mutex;
};

inline int GetLogLevel() {
    return LogManager::Instance().GetGlobalLevel();
}

inline void SetLogLevel(int level) {
    LogManager::Instance().SetGlobalLevel(level);
}

inline void SetModuleLogLevel(LogModule mod, int level) {
    LogManager::Instance().SetModuleLevel(mod, level);
}

inline bool ShouldLog(LogModule mod, LogLevel level) {
    return LogManager::Instance().ShouldLog(mod, level);
}

inline void LogLevelIncrease() {
    LogManager::Instance().IncreaseLevel();
}

inline void LogLevelDecrease() {
    LogManager::Instance().DecreaseLevel();
}

// =============================================================================
// Timestamp Formatting
// =============================================================================

inline void FormatTimestamp(char* buffer, size_t size) {
    auto now = std::chrono::system_clock::now();
    auto time_t_now = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()) % 1000;

    struct tm tm_buf;
#ifdef _WIN32
    localtime_s(&tm_buf, &time_t_now);
#else
    localtime_r(&time_t_now, &tm_buf);
#endif

    snprintf(buffer, size, "%04d-%02d-%02d %02d:%02d:%02d.%03d",
        tm_buf.tm_year + 1900, tm_buf.tm_mon + 1, tm_buf.tm_mday,
        tm_buf.tm_hour, tm_buf.tm_min, tm_buf.tm_sec,
        static_cast<int>(ms.count()));
}

// =============================================================================
// Core Logging Macro
// =============================================================================

#define AVR_LOG_WRITE(out, module, level, ...) \
    do { \
        char _ts_buf[32]; \
        FormatTimestamp(_ts_buf, sizeof(_ts_buf)); \
        std::lock_guard<std::mutex> _lock(LogManager::Instance().GetMutex()); \
        try { \
            out << "[" << _ts_buf << "] [" << GetLevelName(level) << "] [" \
                << GetModuleName(module) << "] " << fmt::format(__VA_ARGS__) << std::endl; \
        } catch (const fmt::format_error&) { \
            out << "[" << _ts_buf << "] [" << GetLevelName(level) << "] [" \
                << GetModuleName(module) << "] (format error)" << std::endl; \
        } \
    } while(0)

#ifdef AVR_DEBUG

#define AVR_LOG_IMPL(module, level, ...) \
    do { \
        if (ShouldLog(module, level)) { \
            if (level <= LOG_ERROR) { \
                AVR_LOG_WRITE(std::cerr, module, level, __VA_ARGS__); \
            } else { \
                AVR_LOG_WRITE(std::cout, module, level, __VA_ARGS__); \
            } \
        } \
    } while(0)

#define LOG_FATAL(module, ...) AVR_LOG_IMPL(module, LOG_FATAL, __VA_ARGS__)
#define LOG_ERROR(module, ...) AVR_LOG_IMPL(module, LOG_ERROR, __VA_ARGS__)
#define LOG_WARN(module, ...)  AVR_LOG_IMPL(module, LOG_WARN, __VA_ARGS__)
#define LOG_INFO(module, ...)  AVR_LOG_IMPL(module, LOG_INFO, __VA_ARGS__)
#define LOG_DEBUG(module, ...) AVR_LOG_IMPL(module, LOG_DEBUG, __VA_ARGS__)
#define LOG_TRACE(module, ...) AVR_LOG_IMPL(module, LOG_TRACE, __VA_ARGS__)

// Only evaluate if condition is true AND level enabled
#define LOG_DEBUG_IF(module, condition, ...) \
    do { \
        if ((condition) && ShouldLog(module, LOG_DEBUG)) { \
            AVR_LOG_IMPL(module, LOG_DEBUG, __VA_ARGS__); \
        } \
    } while(0)

#else // !AVR_DEBUG

// Release build - only FATAL/ERROR
#define AVR_LOG_IMPL(module, level, ...) \
    do { \
        if (level <= LOG_ERROR && ShouldLog(module, level)) { \
            AVR_LOG_WRITE(std::cerr, module, level, __VA_ARGS__); \
        } \
    } while(0)

#define LOG_FATAL(module, ...) AVR_LOG_IMPL(module, LOG_FATAL, __VA_ARGS__)
#define LOG_ERROR(module, ...) AVR_LOG_IMPL(module, LOG_ERROR, __VA_ARGS__)
#define LOG_WARN(module, ...)  ((void)0)
#define LOG_INFO(module, ...)  ((void)0)
#define LOG_DEBUG(module, ...) ((void)0)
#define LOG_TRACE(module, ...) ((void)0)

#define LOG_DEBUG_IF(module, condition, ...) ((void)0)

#endif // AVR_DEBUG

// =============================================================================
// Initialization Helpers
// =============================================================================

// --log-level=LEVEL and --log-module=MODULE:LEVEL
inline void InitLogging(int argc, char* argv[]) {
    for (int i = 1; i < argc; i++) {
        const char* arg = argv[i];

        if (strncmp(arg, "--log-level=", 12) == 0) {
            SetLogLevel(ParseLevelName(arg + 12));
        }
        else if (strncmp(arg, "--log-module=", 13) == 0) {
            const char* modArg = arg + 13;
            const char* colon = strchr(modArg, ':');
            if (colon) {
                char modName[32] = {0};
                size_t len = colon - modArg;
                if (len < sizeof(modName)) {
                    strncpy(modName, modArg, len);
                    SetModuleLogLevel(ParseModuleName(modName), ParseLevelName(colon + 1));
                }
            }
        }
    }
}

// Parses the "logging" section of a config file:
// {
//   "logging": {
//     "level": "DEBUG",
//     "modules": { "ANIMATION": "TRACE", "SYNC": "INFO" }
//   }
// }
// Include <json/json.h> before this header to enable it.
#ifdef JSONCPP_VERSION_STRING
inline void InitLoggingFromJson(const Json::Value& config) {
    if (!config.isObject() || !config["logging"].isObject()) {
        return;
    }

    const Json::Value& logging = config["logging"];

    if (logging.isMember("level") && logging["level"].isString()) {
        SetLogLevel(ParseLevelName(logging["level"].asString().c_str()));
    }

    if (logging.isMember("modules") && logging["modules"].isObject()) {
        const Json::Value& modules = logging["modules"];
        for (const auto& modName : modules.getMemberNames()) {
            if (modules[modName].isString()) {
                SetModuleLogLevel(ParseModuleName(modName.c_str()),
                                  ParseLevelName(modules[modName].asString().c_str()));
            }
        }
    }
}
#endif
