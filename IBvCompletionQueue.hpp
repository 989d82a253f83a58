//
// Created by jonas on 09.03.21.
//

#ifndef SAFEVERBS_IBVCOMPLETIONQUEUE_HPP
#define SAFEVERBS_IBVCOMPLETIONQUEUE_HPP

#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <vector>
#include <gsl/gsl>
#include <infiniband/verbs.h>
#include "CompletionBudget.hpp"
#include "Config.hpp"
#include "IBvContext.hpp"
#include "IBvHandle.hpp"
#include "WorkCompletion.hpp"

/**
 * Completion queue with a fixed capacity. Polling never blocks, callers loop with their own deadline.
 *
 * Polling is not synchronized, concurrent pollers of the same queue have to lock themselves.
 */
class IBvCompletionQueue {
    public:
        /**
         * Terminates if the capacity is not positive or larger than the device supports.
         * @throws IBvException if the driver can not create the queue
         */
        explicit IBvCompletionQueue(const IBvContext &context, int capacity = DEFAULT_CQ_DEPTH);

        [[nodiscard]] struct ibv_cq *get() const;

        [[nodiscard]] int capacity() const;

        [[nodiscard]] const IBvContext &context() const;

        /**
         * Returns between 0 and n completions, whatever is ready right now. n is capped at the capacity.
         * Failed completions are returned like successful ones, their queue pair is moved to ERROR.
         * @throws IBvException if the driver reports an error while polling
         */
        std::vector<WorkCompletion> poll(std::size_t n);

        /**
         * Fills the front of into with whatever is ready right now, without allocating.
         * @return number of completions written, the rest of into is untouched
         * @throws IBvException if the driver reports an error while polling
         */
        std::size_t poll(gsl::span<WorkCompletion> into);

        std::optional<WorkCompletion> pollOne();

        [[nodiscard]] const std::shared_ptr<CompletionBudget> &budget() const;

        /// Routes completions carrying the given QP number to tracking
        void attach(std::uint32_t qpNum, const std::shared_ptr<QpTracking> &tracking) const;

        [[nodiscard]] long useCount() const;

        bool operator==(const IBvCompletionQueue &other) const;

    private:
        struct Registry {
            std::mutex mutex;
            std::map<std::uint32_t, std::weak_ptr<QpTracking>> queuePairs;
        };

        void account(gsl::span<const WorkCompletion> completions);

        IBvContext ctx;
        IBvHandle<ibv_cq> cq;
        int cap;
        std::shared_ptr<CompletionBudget> completionBudget;
        std::shared_ptr<Registry> registry;
};

#endif //SAFEVERBS_IBVCOMPLETIONQUEUE_HPP
