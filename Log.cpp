/**
 * @file Log.cpp
 * @author ottojo
 * @date 6/14/21
 */

#include "Log.hpp"

#include <atomic>

namespace {
    std::atomic<bool> verboseLogging{false};
}

void setVerbose(bool verbose) {
    verboseLogging.store(verbose, std::memory_order_relaxed);
}

bool isVerbose() {
    return verboseLogging.load(std::memory_order_relaxed);
}
