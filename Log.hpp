/**
 * @file Log.hpp
 * @author ottojo
 * @date 6/14/21
 * Minimal fmt based logging to stderr. Debug output is off until setVerbose(true).
 */

#ifndef SAFEVERBS_LOG_HPP
#define SAFEVERBS_LOG_HPP

#include <cstdio>
#include <utility>
#include <fmt/format.h>

void setVerbose(bool verbose);

bool isVerbose();

template<typename... Args>
void logDebug(fmt::format_string<Args...> format, Args &&...args) {
    if (isVerbose()) {
        fmt::print(stderr, "[safeverbs] {}\n", fmt::format(format, std::forward<Args>(args)...));
    }
}

template<typename... Args>
void logInfo(fmt::format_string<Args...> format, Args &&...args) {
    fmt::print(stderr, "[safeverbs] {}\n", fmt::format(format, std::forward<Args>(args)...));
}

template<typename... Args>
void logWarning(fmt::format_string<Args...> format, Args &&...args) {
    fmt::print(stderr, "[safeverbs] warning: {}\n", fmt::format(format, std::forward<Args>(args)...));
}

#endif //SAFEVERBS_LOG_HPP
