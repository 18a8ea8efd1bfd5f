// Copyright (C) 2022 Tycho Softworks.
// This code is licensed under MIT license.

#ifndef OMAP_PRINT_HPP_
#define OMAP_PRINT_HPP_

#include <iostream>
#include <string>
#include <string_view>
#include <type_traits>
#include <mutex>

#if __has_include(<syslog.h>)
#define USE_SYSLOG
#include <syslog.h>
#else
constexpr auto LOG_DAEMON = 0;
constexpr auto LOG_DEBUG = 0;
constexpr auto LOG_INFO = 0;
constexpr auto LOG_NOTICE = 0;
constexpr auto LOG_WARNING = 0;
constexpr auto LOG_ERR = 0;
constexpr auto LOG_NDELAY = 0;
constexpr auto LOG_CONS = 0;
#endif

#if __cplusplus < 202002L
#include <fmt/format.h>

namespace omap {
template<class... Args>
using format_string = fmt::format_string<Args...>;

template<typename T>
constexpr bool is_formattable_v = fmt::is_formattable<T>::value;

template<class... Args>
auto format(format_string<Args...> fmt, Args&&... args) {
    return fmt::format(fmt, std::forward<Args>(args)...);
}
} // end namespace
#else
#include <format>

namespace omap {
template<class... Args>
using format_string = std::format_string<Args...>;

template<typename T>
constexpr bool is_formattable_v = std::is_default_constructible_v<std::formatter<T, char>>;

template<class... Args>
auto format(format_string<Args...> fmt, Args&&... args) {
    return std::format(fmt, std::forward<Args>(args)...);
}
} // end namespace
#endif

namespace omap {
template<class... Args>
void print(std::ostream& out, format_string<Args...> fmt, Args&&... args) {
    out << omap::format(fmt, std::forward<Args>(args)...);
}

template<class... Args>
void println(std::ostream& out, format_string<Args...> fmt, Args&&... args) {
    out << omap::format(fmt, std::forward<Args>(args)...) << std::endl;
}

// Renders a key or value for diagnostics, quoting anything string-like.
template<typename T>
auto inspect(const T& value) -> std::string {
    if constexpr (std::is_convertible_v<const T&, std::string_view>)
        return omap::format("\"{}\"", std::string_view(value));
    else if constexpr (is_formattable_v<T>)
        return omap::format("{}", value);
    else
        return "<unprintable>";
}

class system_logger final {
public:
    using notify_t = void (*)(const std::string&, const char *type);

    system_logger() = default;
    system_logger(const system_logger&) = delete;
    auto operator=(const system_logger&) -> auto& = delete;

    template<class... Args>
    void debug(unsigned level, format_string<Args...> fmt, Args&&... args) {
#ifndef NDEBUG
        if(level <= logging_)
            emit(LOG_DEBUG, "debug", 0, omap::format(fmt, std::forward<Args>(args)...));
#endif
    }

    template<class... Args>
    void info(format_string<Args...> fmt, Args&&... args) {
        emit(LOG_INFO, "info", 2, omap::format(fmt, std::forward<Args>(args)...));
    }

    template<class... Args>
    void notice(format_string<Args...> fmt, Args&&... args) {
        emit(LOG_NOTICE, "notice", 1, omap::format(fmt, std::forward<Args>(args)...));
    }

    template<class... Args>
    void warn(format_string<Args...> fmt, Args&&... args) {
        emit(LOG_WARNING, "warn", 1, omap::format(fmt, std::forward<Args>(args)...));
    }

    template<class... Args>
    void error(format_string<Args...> fmt, Args&&... args) {
        emit(LOG_ERR, "error", 1, omap::format(fmt, std::forward<Args>(args)...));
    }

    void set(unsigned level, notify_t notify = [](const std::string& str, const char *type){}) {
        const std::lock_guard lock(locking_);
        logging_ = level;
        notify_ = notify;
    }

    auto level() const {
        return logging_;
    }

#ifdef  USE_SYSLOG
    void open(const char *id, int level = LOG_INFO, int facility = LOG_DAEMON, int flags = LOG_CONS | LOG_NDELAY) {
        const std::lock_guard lock(locking_);
        ::openlog(id, flags, facility);
        ::setlogmask(LOG_UPTO(level));
        opened_ = true;
    }

    void close() {
        const std::lock_guard lock(locking_);
        ::closelog();
        opened_ = false;
    }
#else
    void open(const char *id, int level = LOG_INFO, int facility = LOG_DAEMON, int flags = 0) {}
    void close() {}
#endif

private:
    std::mutex locking_;
    unsigned logging_{1};
    notify_t notify_{[](const std::string& str, const char *type){}};
#ifdef  USE_SYSLOG
    bool opened_{false};
#endif

    void emit(int priority, const char *type, unsigned verbose, const std::string& msg) {
        const std::lock_guard lock(locking_);
#ifdef  USE_SYSLOG
        if(opened_ && priority != LOG_DEBUG)
            ::syslog(priority, "%s", msg.c_str());
#endif
        notify_(msg, type);
        if(logging_ >= verbose)
            omap::print(std::cerr, "{}: {}\n", type, msg);
    }
};
} // end namespace
#endif
