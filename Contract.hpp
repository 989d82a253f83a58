/**
 * @file Contract.hpp
 * @author ottojo
 * @date 6/14/21
 * Caller bugs end the process. Use these instead of IBvException whenever the caller could have known better.
 */

#ifndef SAFEVERBS_CONTRACT_HPP
#define SAFEVERBS_CONTRACT_HPP

#include <cstdio>
#include <exception>
#include <utility>
#include <fmt/format.h>

template<typename... Args>
[[noreturn]] void panic(fmt::format_string<Args...> format, Args &&...args) {
    fmt::print(stderr, "safeverbs: precondition violated: {}\n", fmt::format(format, std::forward<Args>(args)...));
    std::fflush(stderr);
    std::terminate();
}

template<typename... Args>
void expects(bool condition, fmt::format_string<Args...> format, Args &&...args) {
    if (not condition) {
        panic(format, std::forward<Args>(args)...);
    }
}

#endif //SAFEVERBS_CONTRACT_HPP
