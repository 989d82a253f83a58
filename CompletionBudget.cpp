/**
 * @file CompletionBudget.cpp
 * @author ottojo
 * @date 6/15/21
 */

#include "CompletionBudget.hpp"
#include "IBvException.hpp"

#include <algorithm>
#include <utility>
#include <fmt/format.h>
#include <gsl/gsl>

CompletionBudget::CompletionBudget(std::size_t capacity) : cap(capacity) {}

void CompletionBudget::reserve(std::size_t count) {
    auto current = used.load();
    do {
        if (current + count > cap) {
            throw IBvException(ErrorKind::ResourceExhausted, 0,
                               fmt::format("Completion queue full: {} of {} completions outstanding, {} more requested",
                                           current, cap, count));
        }
    } while (not used.compare_exchange_weak(current, current + count));
}

void CompletionBudget::release(std::size_t count) {
    auto before = used.fetch_sub(count);
    Ensures(before >= count);
}

std::size_t CompletionBudget::capacity() const {
    return cap;
}

std::size_t CompletionBudget::outstanding() const {
    return used.load();
}

std::size_t CompletionBudget::available() const {
    return cap - used.load();
}

QpTracking::QpTracking(std::shared_ptr<CompletionBudget> sendBudget, std::shared_ptr<CompletionBudget> recvBudget) {
    Expects(sendBudget != nullptr and recvBudget != nullptr);
    send.budget = std::move(sendBudget);
    recv.budget = std::move(recvBudget);
}

QpTracking::~QpTracking() {
    for (auto *side : {&send, &recv}) {
        if (side->outstanding > 0) {
            side->budget->release(side->outstanding);
        }
    }
}

void QpTracking::reserveSend(bool signaled) {
    std::lock_guard lock(mutex);
    send.budget->reserve(1);
    send.outstanding++;
    if (signaled) {
        unsignaledAhead.push_back(unsignaledTail);
        unsignaledTail = 0;
    } else {
        unsignaledTail++;
    }
}

void QpTracking::reserveRecv(std::size_t count) {
    std::lock_guard lock(mutex);
    recv.budget->reserve(count);
    recv.outstanding += count;
}

void QpTracking::cancelSend(bool signaled) {
    std::lock_guard lock(mutex);
    if (signaled) {
        Expects(not unsignaledAhead.empty());
        unsignaledTail = unsignaledAhead.back();
        unsignaledAhead.pop_back();
    } else {
        Expects(unsignaledTail > 0);
        unsignaledTail--;
    }
    retire(send, 1);
}

void QpTracking::cancelRecv(std::size_t count) {
    std::lock_guard lock(mutex);
    Expects(recv.outstanding >= count);
    retire(recv, count);
}

void QpTracking::sendCompleted() {
    std::lock_guard lock(mutex);
    std::size_t count = 1;
    if (not unsignaledAhead.empty()) {
        count += unsignaledAhead.front();
        unsignaledAhead.pop_front();
    }
    retire(send, count);
}

void QpTracking::receiveCompleted() {
    std::lock_guard lock(mutex);
    retire(recv, 1);
}

void QpTracking::failed(const CompletionBudget *budget) {
    std::lock_guard lock(mutex);
    Expects(send.budget.get() == budget or recv.budget.get() == budget);
    // On a shared CQ both sides draw from the same budget, which side gives the slot back does not matter
    if (send.budget.get() == budget and send.outstanding > 0) {
        retire(send, 1);
    } else if (recv.budget.get() == budget) {
        retire(recv, 1);
    }
}

std::size_t QpTracking::outstanding(const CompletionBudget *budget) const {
    std::lock_guard lock(mutex);
    std::size_t count = 0;
    for (const auto *side : {&send, &recv}) {
        if (side->budget.get() == budget) {
            count += side->outstanding;
        }
    }
    return count;
}

QpState QpTracking::state() const {
    return currentState.load();
}

void QpTracking::setState(QpState state) {
    currentState.store(state);
}

bool QpTracking::markError() {
    return currentState.exchange(QpState::Error) != QpState::Error;
}

void QpTracking::retire(Side &side, std::size_t count) {
    count = std::min(count, side.outstanding);
    if (count == 0) {
        return;
    }
    side.outstanding -= count;
    side.budget->release(count);
}
