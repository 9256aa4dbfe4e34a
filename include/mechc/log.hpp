#ifndef MECHC_LOG_HPP
#define MECHC_LOG_HPP

#include <iostream>
#include <string>
#include <cstdio>    // For vsnprintf
#include <cstdarg>   // For va_list
#include <cstdlib>   // For getenv
#include <exception>
#include <algorithm> // For std::max

namespace mechc
{

    // Log levels share the numeric scale of Python's logging module
    enum class MECHC_LogLevel
    {
        CRITICAL = 50,
        ERROR = 40,
        WARNING = 30,
        INFO = 20,
        DEBUG = 10,
        NOTSET = 0
    };

    // --- ANSI Color Definitions ---
    static constexpr const char *MECHC_ANSI_COLOR_RED = "\x1b[31m";
    static constexpr const char *MECHC_ANSI_COLOR_YELLOW = "\x1b[33m";
    static constexpr const char *MECHC_ANSI_COLOR_CYAN = "\x1b[36m";
    static constexpr const char *MECHC_ANSI_COLOR_BLUE = "\x1b[34m";
    static constexpr const char *MECHC_ANSI_COLOR_RESET = "\x1b[0m";
    static constexpr const char *MECHC_ANSI_BOLD_MAGENTA = "\x1b[1;35m";

    /**
     * @brief Determines the minimum configured log level.
     *
     * The environment variable `MECHC_LOG_LEVEL` is read exactly once, on the
     * first call. Unset or unparsable values select CRITICAL.
     *
     * @return The currently configured minimum log level.
     */
    inline MECHC_LogLevel &get_min_level()
    {
        static MECHC_LogLevel level = []() -> MECHC_LogLevel
        {
            if (const char *env_level_str = std::getenv("MECHC_LOG_LEVEL"))
            {
                try
                {
                    int level_val = std::stoi(env_level_str);
                    return static_cast<MECHC_LogLevel>(std::max(0, level_val));
                }
                catch (const std::exception &e)
                {
                    return MECHC_LogLevel::CRITICAL;
                }
            }
            return MECHC_LogLevel::CRITICAL;
        }();
        return level;
    }

    inline const char *level_to_string(MECHC_LogLevel level)
    {
        switch (level)
        {
        case MECHC_LogLevel::CRITICAL:
            return "CRITICAL";
        case MECHC_LogLevel::ERROR:
            return "ERROR";
        case MECHC_LogLevel::WARNING:
            return "WARNING";
        case MECHC_LogLevel::INFO:
            return "INFO";
        case MECHC_LogLevel::DEBUG:
            return "DEBUG";
        default:
            return "NOTSET";
        }
    }

    inline const char *level_to_color(MECHC_LogLevel level)
    {
        switch (level)
        {
        case MECHC_LogLevel::CRITICAL:
            return MECHC_ANSI_BOLD_MAGENTA;
        case MECHC_LogLevel::ERROR:
            return MECHC_ANSI_COLOR_RED;
        case MECHC_LogLevel::WARNING:
            return MECHC_ANSI_COLOR_YELLOW;
        case MECHC_LogLevel::INFO:
            return MECHC_ANSI_COLOR_CYAN;
        case MECHC_LogLevel::DEBUG:
            return MECHC_ANSI_COLOR_BLUE;
        default:
            return MECHC_ANSI_COLOR_RESET;
        }
    }

    /**
     * @brief Formats a printf-style message and writes one colored line to std::cerr.
     */
    inline void log_impl_v(MECHC_LogLevel level, const char *file, int line, const char *func, const char *format, va_list args)
    {
        va_list args_copy;
        va_copy(args_copy, args);
        int size = std::vsnprintf(nullptr, 0, format, args_copy);
        va_end(args_copy);

        if (size < 0)
        {
            std::cerr << "Log formatting error.\n";
            return;
        }

        std::string message_buffer(size, 0);
        std::vsnprintf(&message_buffer[0], size + 1, format, args);

        std::cerr << level_to_color(level)
                  << level_to_string(level)
                  << MECHC_ANSI_COLOR_RESET << ": "
                  << file << ":" << line
                  << " in " << func << ": "
                  << message_buffer
                  << "\n";
        std::cerr.flush();
    }

    /**
     * @brief User-facing logging function.
     *
     * @param level The log level of the current message.
     * @param file The file name (__FILE__).
     * @param line The line number (__LINE__).
     * @param func The function name (__func__).
     * @param format The printf-style format string.
     * @param ... The arguments for the format string.
     */
    inline void log(MECHC_LogLevel level, const char *file, int line, const char *func, const char *format, ...)
    {
        if (static_cast<int>(level) < static_cast<int>(get_min_level()))
        {
            return;
        }

        va_list args;
        va_start(args, format);
        log_impl_v(level, file, line, func, format, args);
        va_end(args);
    }

}; // namespace mechc

#ifndef MECHC_ENABLE_DEBUG_LOGGING

#define MECHC_DEBUG(format, ...) \
    do                           \
    {                            \
    } while (0)

#else

#define MECHC_DEBUG(format, ...) \
    mechc::log(mechc::MECHC_LogLevel::DEBUG, __FILE__, __LINE__, __func__, format, ##__VA_ARGS__)

#endif // MECHC_ENABLE_DEBUG_LOGGING

#define MECHC_INFO(format, ...) \
    mechc::log(mechc::MECHC_LogLevel::INFO, __FILE__, __LINE__, __func__, format, ##__VA_ARGS__)

#define MECHC_WARN(format, ...) \
    mechc::log(mechc::MECHC_LogLevel::WARNING, __FILE__, __LINE__, __func__, format, ##__VA_ARGS__)

#define MECHC_ERROR(format, ...) \
    mechc::log(mechc::MECHC_LogLevel::ERROR, __FILE__, __LINE__, __func__, format, ##__VA_ARGS__)

#define MECHC_CRITICAL(format, ...) \
    mechc::log(mechc::MECHC_LogLevel::CRITICAL, __FILE__, __LINE__, __func__, format, ##__VA_ARGS__)

#endif // MECHC_LOG_HPP
