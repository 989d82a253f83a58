//
// Created by jonas on 15.06.21.
//

#include <memory>
#include <thread>
#include <vector>
#include <gtest/gtest.h>
#include "CompletionBudget.hpp"
#include "IBvException.hpp"

TEST(CompletionBudget, ReserveAndRelease) {
    CompletionBudget budget(4);
    budget.reserve(3);
    EXPECT_EQ(budget.outstanding(), 3u);
    EXPECT_EQ(budget.available(), 1u);
    budget.release(2);
    EXPECT_EQ(budget.outstanding(), 1u);
    EXPECT_EQ(budget.capacity(), 4u);
}

TEST(CompletionBudget, FullBudgetThrowsResourceExhausted) {
    CompletionBudget budget(2);
    budget.reserve(2);
    try {
        budget.reserve(1);
        FAIL() << "expected IBvException";
    } catch (const IBvException &e) {
        EXPECT_EQ(e.kind(), ErrorKind::ResourceExhausted);
    }
    // A failed reservation takes nothing
    EXPECT_EQ(budget.outstanding(), 2u);
}

TEST(CompletionBudget, ConcurrentReservationsNeverOvershoot) {
    CompletionBudget budget(1000);
    std::atomic<int> granted{0};
    std::vector<std::thread> threads;
    for (int t = 0; t < 8; t++) {
        threads.emplace_back([&] {
            for (int i = 0; i < 200; i++) {
                try {
                    budget.reserve(1);
                    granted++;
                } catch (const IBvException &) {
                }
            }
        });
    }
    for (auto &thread: threads) {
        thread.join();
    }
    EXPECT_EQ(granted.load(), 1000);
    EXPECT_EQ(budget.outstanding(), 1000u);
}

TEST(QpTracking, SharedCompletionQueue) {
    auto cq = std::make_shared<CompletionBudget>(8);
    QpTracking tracking(cq, cq);
    tracking.reserveSend(true);
    tracking.reserveSend(true);
    tracking.reserveRecv(3);
    EXPECT_EQ(cq->outstanding(), 5u);
    EXPECT_EQ(tracking.outstanding(cq.get()), 5u);

    tracking.receiveCompleted();
    EXPECT_EQ(cq->outstanding(), 4u);
    tracking.sendCompleted();
    EXPECT_EQ(cq->outstanding(), 3u);
    EXPECT_EQ(tracking.outstanding(cq.get()), 3u);
}

TEST(QpTracking, SeparateCompletionQueues) {
    auto sendCq = std::make_shared<CompletionBudget>(8);
    auto recvCq = std::make_shared<CompletionBudget>(8);
    QpTracking tracking(sendCq, recvCq);
    tracking.reserveSend(true);
    tracking.reserveRecv(4);
    EXPECT_EQ(sendCq->outstanding(), 1u);
    EXPECT_EQ(recvCq->outstanding(), 4u);

    tracking.receiveCompleted();
    EXPECT_EQ(recvCq->outstanding(), 3u);
    EXPECT_EQ(sendCq->outstanding(), 1u);

    tracking.failed(recvCq.get());
    EXPECT_EQ(recvCq->outstanding(), 2u);
    EXPECT_EQ(sendCq->outstanding(), 1u);
}

TEST(QpTracking, UnsignaledSendsHoldSlotsUntilNextSignaledCompletion) {
    auto cq = std::make_shared<CompletionBudget>(8);
    QpTracking tracking(cq, cq);
    tracking.reserveSend(false);
    tracking.reserveSend(false);
    tracking.reserveSend(true);
    tracking.reserveSend(false);
    tracking.reserveSend(true);
    EXPECT_EQ(cq->outstanding(), 5u);

    // The first signaled completion covers the two unsignaled sends before it
    tracking.sendCompleted();
    EXPECT_EQ(cq->outstanding(), 2u);
    tracking.sendCompleted();
    EXPECT_EQ(cq->outstanding(), 0u);
    EXPECT_EQ(tracking.outstanding(cq.get()), 0u);
}

TEST(QpTracking, FailedUnsignaledSendKeepsReceiveReserved) {
    // One receive and one unsignaled send on a CQ with room for both
    auto cq = std::make_shared<CompletionBudget>(2);
    QpTracking tracking(cq, cq);
    tracking.reserveRecv(1);
    tracking.reserveSend(false);
    EXPECT_EQ(cq->available(), 0u);

    // Error entry of the send, the receive is still going to be flushed
    tracking.failed(cq.get());
    EXPECT_EQ(cq->outstanding(), 1u);

    // Another queue pair on the same CQ can not take the flush entry's slot
    QpTracking other(cq, cq);
    other.reserveRecv(1);
    EXPECT_THROW(other.reserveRecv(1), IBvException);

    tracking.failed(cq.get());
    EXPECT_EQ(tracking.outstanding(cq.get()), 0u);
    EXPECT_EQ(cq->outstanding(), 1u);
}

TEST(QpTracking, CancelReturnsReservation) {
    auto cq = std::make_shared<CompletionBudget>(4);
    QpTracking tracking(cq, cq);
    tracking.reserveSend(false);
    tracking.reserveSend(true);
    tracking.cancelSend(true);
    EXPECT_EQ(cq->outstanding(), 1u);

    // The unsignaled send is still ahead of the next signaled one
    tracking.reserveSend(true);
    tracking.sendCompleted();
    EXPECT_EQ(cq->outstanding(), 0u);
    EXPECT_EQ(tracking.outstanding(cq.get()), 0u);
}

TEST(QpTracking, ExtraCompletionsAreIgnored) {
    auto cq = std::make_shared<CompletionBudget>(4);
    cq->reserve(1);
    QpTracking tracking(cq, cq);
    tracking.reserveRecv(1);
    tracking.failed(cq.get());
    // More flushed entries than reservations
    tracking.failed(cq.get());
    tracking.receiveCompleted();
    EXPECT_EQ(cq->outstanding(), 1u);
}

TEST(QpTracking, DestructionReturnsOutstanding) {
    auto sendCq = std::make_shared<CompletionBudget>(4);
    auto recvCq = std::make_shared<CompletionBudget>(4);
    {
        QpTracking tracking(sendCq, recvCq);
        tracking.reserveSend(true);
        tracking.reserveSend(false);
        tracking.reserveSend(false);
        tracking.reserveRecv(2);
    }
    EXPECT_EQ(sendCq->outstanding(), 0u);
    EXPECT_EQ(recvCq->outstanding(), 0u);
}

TEST(QpTracking, ErrorIsSticky) {
    auto cq = std::make_shared<CompletionBudget>(4);
    QpTracking tracking(cq, cq);
    EXPECT_EQ(tracking.state(), QpState::Reset);
    tracking.setState(QpState::ReadyToSend);
    EXPECT_TRUE(tracking.markError());
    EXPECT_FALSE(tracking.markError());
    EXPECT_EQ(tracking.state(), QpState::Error);
}
