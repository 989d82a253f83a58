/**
 * @file utils.cpp
 * @author ottojo
 * @date 5/25/21
 */

#include "utils.hpp"
#include "Log.hpp"

#include <stdexcept>
#include <fmt/format.h>

std::vector<WorkCompletion> pollUntil(IBvCompletionQueue &cq, std::size_t n, std::chrono::milliseconds timeout) {
    auto deadline = std::chrono::steady_clock::now() + timeout;
    std::vector<WorkCompletion> completions;
    while (completions.size() < n) {
        if (std::chrono::steady_clock::now() > deadline) {
            throw std::runtime_error{
                    fmt::format("Timeout: {} of {} completions after {}ms", completions.size(), n, timeout.count())};
        }
        auto polled = cq.poll(n - completions.size());
        completions.insert(completions.end(), polled.begin(), polled.end());
    }
    return completions;
}

Config demoConfig(const std::string &path) {
    Config config;
    if (not path.empty()) {
        config = loadConfig(path);
    }
    setVerbose(config.verbose);
    return config;
}
