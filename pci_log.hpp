#ifndef __PCI_LOG_H__
#define __PCI_LOG_H__

#include <string>
#include <utility>

#ifndef FMT_HEADER_ONLY
#define FMT_HEADER_ONLY
#endif
#include <fmt/format.h>

enum class log_level
{
    error = 0,
    warning,
    info,
    debug,
};

void set_log_level(log_level level);
log_level get_log_level();

void log_message(log_level level, const std::string& text);

template <typename... Args>
void log_error(fmt::format_string<Args...> format, Args&&... args)
{
    log_message(log_level::error, fmt::format(format, std::forward<Args>(args)...));
}

template <typename... Args>
void log_warning(fmt::format_string<Args...> format, Args&&... args)
{
    log_message(log_level::warning, fmt::format(format, std::forward<Args>(args)...));
}

template <typename... Args>
void log_info(fmt::format_string<Args...> format, Args&&... args)
{
    if (get_log_level() >= log_level::info)
        log_message(log_level::info, fmt::format(format, std::forward<Args>(args)...));
}

template <typename... Args>
void log_debug(fmt::format_string<Args...> format, Args&&... args)
{
    if (get_log_level() >= log_level::debug)
        log_message(log_level::debug, fmt::format(format, std::forward<Args>(args)...));
}

#endif
