#include <cstdio>

#include "pci_log.hpp"

namespace
{
    log_level g_logLevel = log_level::warning;

    const char* level_name(log_level level)
    {
        switch (level)
        {
            case log_level::error:   return "error";
            case log_level::warning: return "warning";
            case log_level::info:    return "info";
            case log_level::debug:   return "debug";
        }
        return "log";
    }
}

void set_log_level(log_level level)
{
    g_logLevel = level;
}

log_level get_log_level()
{
    return g_logLevel;
}

void log_message(log_level level, const std::string& text)
{
    if (level > g_logLevel)
        return;

    fmt::print(stderr, "pcicrawler: {}: {}\n", level_name(level), text);
}
