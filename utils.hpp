/**
 * @file utils.hpp
 * @author ottojo
 * @date 5/25/21
 * Helpers shared by the demo programs
 */

#ifndef SAFEVERBS_UTILS_HPP
#define SAFEVERBS_UTILS_HPP

#include <chrono>
#include <string>
#include <vector>
#include "Config.hpp"
#include "IBvCompletionQueue.hpp"

/**
 * Polls until n completions arrived.
 * @throws std::runtime_error if they did not arrive within timeout
 */
std::vector<WorkCompletion> pollUntil(IBvCompletionQueue &cq, std::size_t n, std::chrono::milliseconds timeout);

/// Configuration from the given file, defaults if path is empty
Config demoConfig(const std::string &path);

#endif //SAFEVERBS_UTILS_HPP
