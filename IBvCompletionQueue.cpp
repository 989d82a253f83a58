//
// Created by jonas on 09.03.21.
//

#include "IBvCompletionQueue.hpp"
#include "Contract.hpp"
#include "IBvException.hpp"
#include "libibverbs_format.hpp"

#include <algorithm>
#include <array>

namespace {
    /// Entries fetched from the driver per ibv_poll_cq call
    constexpr std::size_t POLL_BATCH = 16;
}

IBvCompletionQueue::IBvCompletionQueue(const IBvContext &context, int capacity) :
        ctx(context),
        cap(capacity),
        completionBudget(std::make_shared<CompletionBudget>(static_cast<std::size_t>(std::max(capacity, 0)))),
        registry(std::make_shared<Registry>()) {
    expects(capacity > 0, "completion queue capacity must be positive, got {}", capacity);
    expects(capacity <= ctx.maxCqe(), "completion queue capacity {} exceeds device maximum {}", capacity,
            ctx.maxCqe());

    auto *raw = ibv_create_cq(ctx.get(), capacity, nullptr, nullptr, 0);
    if (raw == nullptr) {
        throw IBvException(errno, fmt::format("Creating completion queue with {} entries", capacity));
    }
    cq = IBvHandle<ibv_cq>(raw, ibv_destroy_cq, "completion queue");
    logDebug("created completion queue {} with {} entries (requested {})", static_cast<void *>(raw), raw->cqe,
             capacity);
}

struct ibv_cq *IBvCompletionQueue::get() const {
    return cq.get();
}

int IBvCompletionQueue::capacity() const {
    return cap;
}

const IBvContext &IBvCompletionQueue::context() const {
    return ctx;
}

std::vector<WorkCompletion> IBvCompletionQueue::poll(std::size_t n) {
    n = std::min(n, static_cast<std::size_t>(cap));
    if (n == 0) {
        return {};
    }
    std::vector<WorkCompletion> completions(n);
    completions.resize(poll(gsl::span<WorkCompletion>(completions)));
    return completions;
}

std::size_t IBvCompletionQueue::poll(gsl::span<WorkCompletion> into) {
    std::array<ibv_wc, POLL_BATCH> entries;
    std::size_t filled = 0;
    while (filled < into.size()) {
        auto batch = std::min(into.size() - filled, entries.size());
        int polled = ibv_poll_cq(cq.get(), static_cast<int>(batch), entries.data());
        if (polled < 0) {
            // ibv_poll_cq does not set errno
            throw IBvException(ErrorKind::Driver, 0, "Polling completion queue");
        }
        auto count = static_cast<std::size_t>(polled);
        for (std::size_t i = 0; i < count; i++) {
            into[filled + i] = WorkCompletion(entries[i]);
        }
        account(into.subspan(filled, count));
        filled += count;
        if (count < batch) {
            break;
        }
    }
    return filled;
}

std::optional<WorkCompletion> IBvCompletionQueue::pollOne() {
    WorkCompletion completion;
    if (poll(gsl::span<WorkCompletion>(&completion, 1)) == 0) {
        return std::nullopt;
    }
    return completion;
}

const std::shared_ptr<CompletionBudget> &IBvCompletionQueue::budget() const {
    return completionBudget;
}

void IBvCompletionQueue::attach(std::uint32_t qpNum, const std::shared_ptr<QpTracking> &tracking) const {
    std::lock_guard lock(registry->mutex);
    std::erase_if(registry->queuePairs, [](const auto &entry) {
        return entry.second.expired();
    });
    registry->queuePairs[qpNum] = tracking;
}

long IBvCompletionQueue::useCount() const {
    return cq.useCount();
}

bool IBvCompletionQueue::operator==(const IBvCompletionQueue &other) const {
    return cq == other.cq;
}

void IBvCompletionQueue::account(gsl::span<const WorkCompletion> completions) {
    if (completions.empty()) {
        return;
    }
    std::lock_guard lock(registry->mutex);
    for (const auto &wc: completions) {
        auto entry = registry->queuePairs.find(wc.qpNum());
        std::shared_ptr<QpTracking> tracking;
        if (entry != registry->queuePairs.end()) {
            tracking = entry->second.lock();
        }
        if (tracking == nullptr) {
            // Queue pair already destroyed, its reservations were returned with it
            logDebug("completion {} for unknown QP {:#x}", wc.wrId(), wc.qpNum());
            continue;
        }
        if (wc.ok()) {
            if (wc.isReceive()) {
                tracking->receiveCompleted();
            } else {
                tracking->sendCompleted();
            }
            continue;
        }
        tracking->failed(completionBudget.get());
        if (tracking->markError()) {
            logWarning("QP {:#x} moved to ERROR by work request {}: {}", wc.qpNum(), wc.wrId(), wc.status());
        }
    }
}
