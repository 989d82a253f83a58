/**
 * @file CompletionBudget.hpp
 * @author ottojo
 * @date 6/15/21
 * Bookkeeping that keeps completion queues from overflowing.
 */

#ifndef SAFEVERBS_COMPLETIONBUDGET_HPP
#define SAFEVERBS_COMPLETIONBUDGET_HPP

#include <atomic>
#include <cstddef>
#include <deque>
#include <memory>
#include <mutex>
#include "QpState.hpp"

/**
 * Number of completions a completion queue can still take. Every completion generating work request reserves one
 * slot before it is handed to the adapter, polling gives the slot back. An overflowing CQ is a fatal asynchronous
 * error on the adapter, reserving turns it into a recoverable error on the posting call instead.
 */
class CompletionBudget {
    public:
        explicit CompletionBudget(std::size_t capacity);

        CompletionBudget(const CompletionBudget &) = delete;

        CompletionBudget &operator=(const CompletionBudget &) = delete;

        /**
         * @throws IBvException of kind ResourceExhausted if less than count slots are free. Nothing is reserved then.
         */
        void reserve(std::size_t count);

        void release(std::size_t count);

        [[nodiscard]] std::size_t capacity() const;

        [[nodiscard]] std::size_t outstanding() const;

        [[nodiscard]] std::size_t available() const;

    private:
        const std::size_t cap;
        std::atomic<std::size_t> used{0};
};

/**
 * Per queue pair view of the budgets of its send and receive completion queue, shared by the queue pair and the
 * completion queues. Also carries the connection state, so a CQ can move a queue pair to ERROR while polling.
 *
 * Every posted send takes a slot, signaled or not: the adapter writes an entry for a failed unsignaled request and
 * flushes everything behind it. Unsignaled sends are retired together with the next signaled send completion of the
 * queue pair, since send queues complete in order.
 *
 * Whatever is still outstanding when the queue pair is gone is returned to the budgets on destruction.
 */
class QpTracking {
    public:
        /// Both budgets may be the same object if the queue pair uses one CQ for both directions
        QpTracking(std::shared_ptr<CompletionBudget> sendBudget, std::shared_ptr<CompletionBudget> recvBudget);

        ~QpTracking();

        QpTracking(const QpTracking &) = delete;

        QpTracking &operator=(const QpTracking &) = delete;

        /// Reserves the slot of one send work request
        void reserveSend(bool signaled);

        void reserveRecv(std::size_t count);

        /// Undoes the last reservation, for a work request the driver refused
        void cancelSend(bool signaled);

        void cancelRecv(std::size_t count);

        /// A successful signaled send completion: retires it and the unsignaled sends posted before it
        void sendCompleted();

        void receiveCompleted();

        /**
         * A failed completion polled from the CQ owning the given budget. Its opcode is undefined, so one request of
         * either direction on that CQ is retired. Entries beyond what was reserved are ignored.
         */
        void failed(const CompletionBudget *budget);

        /// Requests of this queue pair holding slots of the given budget
        [[nodiscard]] std::size_t outstanding(const CompletionBudget *budget) const;

        [[nodiscard]] QpState state() const;

        void setState(QpState state);

        /// @return true if the queue pair was not in ERROR before
        bool markError();

    private:
        struct Side {
            std::shared_ptr<CompletionBudget> budget;
            std::size_t outstanding = 0;
        };

        static void retire(Side &side, std::size_t count);

        std::atomic<QpState> currentState{QpState::Reset};
        mutable std::mutex mutex;
        Side send;
        Side recv;
        /// Unsignaled sends posted ahead of each outstanding signaled send, oldest first
        std::deque<std::size_t> unsignaledAhead;
        /// Unsignaled sends posted after the newest signaled one
        std::size_t unsignaledTail = 0;
};

#endif //SAFEVERBS_COMPLETIONBUDGET_HPP
