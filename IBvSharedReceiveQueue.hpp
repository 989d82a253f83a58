/**
 * @file IBvSharedReceiveQueue.hpp
 * @author ottojo
 * @date 6/17/21
 * Receive queue feeding DC targets
 */

#ifndef SAFEVERBS_IBVSHAREDRECEIVEQUEUE_HPP
#define SAFEVERBS_IBVSHAREDRECEIVEQUEUE_HPP

#include <cstdint>
#include <memory>
#include <infiniband/verbs.h>
#include <gsl/gsl>
#include "CompletionBudget.hpp"
#include "IBvCompletionQueue.hpp"
#include "IBvHandle.hpp"
#include "IBvMemoryRegion.hpp"
#include "IBvProtectionDomain.hpp"
#include "WorkCompletion.hpp"

/**
 * Receive completions of all targets using this queue end up in the completion queue given here, which is why a
 * target has to be created with the same completion queue.
 */
class IBvSharedReceiveQueue {
    public:
        /**
         * @throws IBvException if the driver can not create the queue
         */
        IBvSharedReceiveQueue(const IBvProtectionDomain &pd, const IBvCompletionQueue &cq, std::uint32_t maxWr = 128,
                              std::uint32_t maxSge = 16);

        [[nodiscard]] struct ibv_srq *get() const;

        [[nodiscard]] const IBvCompletionQueue &completionQueue() const;

        [[nodiscard]] const IBvProtectionDomain &protectionDomain() const;

        /// Budget tracking of the posted receives, routed to by every target attached to this queue
        [[nodiscard]] const std::shared_ptr<QpTracking> &tracking() const;

        void postReceive(WrId id, const MrSlice &buffer);

        /**
         * @throws IBvException of kind ResourceExhausted if the completion queue is full or the driver is out of
         * receive slots
         */
        void postReceive(WrId id, gsl::span<const MrSlice> buffers);

    private:
        IBvProtectionDomain pd;
        IBvCompletionQueue cq;
        IBvHandle<ibv_srq> srq;
        std::uint32_t maxSge;
        std::shared_ptr<QpTracking> receives;
};

#endif //SAFEVERBS_IBVSHAREDRECEIVEQUEUE_HPP
