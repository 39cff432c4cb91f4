#pragma once

#include <cstdarg>
#include <string_view>

namespace attlog::log {

enum class Level {
    Error = 0,
    Warn,
    Info,
    Debug,
    Verbose,
};

void early_logf(const char* fmt, ...);

#if defined(AL_DEBUG)

void vlogf(Level level, const char* tag, const char* fmt, std::va_list args);
void logf(Level level, const char* tag, const char* fmt, ...);
void log(Level level, const char* tag, std::string_view message);

// Messages less severe than this are dropped. Defaults to Info.
void set_max_level(Level level);
Level max_level();

#else

// Non-debug builds keep direct calls compiling as no-ops.
inline void vlogf(Level, const char*, const char*, std::va_list) {}

template <typename... Args>
inline void logf(Level, const char*, const char*, Args&&...) {}

inline void log(Level, const char*, std::string_view) {}

inline void set_max_level(Level) {}
inline Level max_level() { return Level::Error; }

#endif // AL_DEBUG

} // namespace attlog::log

// ------------------------------------------------------------------
// Convenience macros
// ------------------------------------------------------------------

#define AL_ELOG(fmt, ...) ::attlog::log::early_logf(fmt "\n", ##__VA_ARGS__)

#if defined(AL_DEBUG)

#define AL_LOGE(tag, fmt, ...) \
    ::attlog::log::logf(::attlog::log::Level::Error,   tag, fmt, ##__VA_ARGS__)

#define AL_LOGW(tag, fmt, ...) \
    ::attlog::log::logf(::attlog::log::Level::Warn,    tag, fmt, ##__VA_ARGS__)

#define AL_LOGI(tag, fmt, ...) \
    ::attlog::log::logf(::attlog::log::Level::Info,    tag, fmt, ##__VA_ARGS__)

#define AL_LOGD(tag, fmt, ...) \
    ::attlog::log::logf(::attlog::log::Level::Debug,   tag, fmt, ##__VA_ARGS__)

#define AL_LOGV(tag, fmt, ...) \
    ::attlog::log::logf(::attlog::log::Level::Verbose, tag, fmt, ##__VA_ARGS__)

#else

// The whole invocation, format string included, vanishes at preprocessing time.
#define AL_LOGE(tag, fmt, ...) ((void)0)
#define AL_LOGW(tag, fmt, ...) ((void)0)
#define AL_LOGI(tag, fmt, ...) ((void)0)
#define AL_LOGD(tag, fmt, ...) ((void)0)
#define AL_LOGV(tag, fmt, ...) ((void)0)

#endif // AL_DEBUG
