#include "attlog/core/logging.h"

#include <atomic>
#include <cstdarg>
#include <cstdio>

namespace attlog::log {

void early_logf(const char* fmt, ...)
{
    if (!fmt) {
        return;
    }

    std::va_list args;
    va_start(args, fmt);
    std::vfprintf(stderr, fmt, args);
    va_end(args);
}

#if defined(AL_DEBUG)

static std::atomic<Level> g_max_level{Level::Info};

void set_max_level(Level level)
{
    g_max_level.store(level);
}

Level max_level()
{
    return g_max_level.load();
}

static bool enabled(Level level)
{
    return static_cast<int>(level) <= static_cast<int>(g_max_level.load());
}

static const char* level_to_str(Level lvl)
{
    switch (lvl) {
    case Level::Error:   return "E";
    case Level::Warn:    return "W";
    case Level::Info:    return "I";
    case Level::Debug:   return "D";
    case Level::Verbose: return "V";
    }
    return "?";
}

static FILE* stream_for(Level level)
{
    return (level == Level::Error || level == Level::Warn) ? stderr : stdout;
}

void vlogf(Level level, const char* tag, const char* fmt, std::va_list args)
{
    if (!enabled(level)) {
        return;
    }

    FILE* out = stream_for(level);

    std::fprintf(out, "[%s] %s: ", level_to_str(level), tag ? tag : "log");
    std::vfprintf(out, fmt, args);
    std::fputc('\n', out);
}

void logf(Level level, const char* tag, const char* fmt, ...)
{
    std::va_list args;
    va_start(args, fmt);
    vlogf(level, tag, fmt, args);
    va_end(args);
}

void log(Level level, const char* tag, std::string_view message)
{
    if (!enabled(level)) {
        return;
    }

    std::fprintf(stream_for(level), "[%s] %s: %.*s\n",
                 level_to_str(level),
                 tag ? tag : "log",
                 static_cast<int>(message.size()),
                 message.data());
}

#endif // AL_DEBUG

} // namespace attlog::log
