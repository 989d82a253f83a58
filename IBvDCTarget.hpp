/**
 * @file IBvDCTarget.hpp
 * @author ottojo
 * @date 6/17/21
 * Dynamically connected target (mlx5)
 */

#ifndef SAFEVERBS_IBVDCTARGET_HPP
#define SAFEVERBS_IBVDCTARGET_HPP

#include <cstdint>
#include <infiniband/verbs.h>
#include "EndpointInfo.hpp"
#include "IBvCompletionQueue.hpp"
#include "IBvHandle.hpp"
#include "IBvProtectionDomain.hpp"
#include "IBvSharedReceiveQueue.hpp"

/// Access key shared by all DC targets and initiators
constexpr std::uint64_t DC_ACCESS_KEY = 0x1919810;

/**
 * Passive endpoint of the dynamically connected transport. Any DC initiator that knows the target's endpoint info
 * can send to it, RDMA write to or read from memory registered in the same protection domain. Incoming sends
 * consume receives of the shared receive queue.
 *
 * Ready (RTR) right after construction. There is nothing to post on a target itself.
 */
class IBvDCTarget {
    public:
        /**
         * Terminates if the context lacks the dynamically connected transport, or if srq belongs to another
         * protection domain or completion queue.
         * @throws IBvException if the driver can not create or connect the target
         */
        IBvDCTarget(const IBvProtectionDomain &pd, const IBvCompletionQueue &cq, const IBvSharedReceiveQueue &srq);

        [[nodiscard]] struct ibv_qp *get() const;

        /// DCT number, addresses the target together with LID / GID
        [[nodiscard]] std::uint32_t dctNum() const;

        [[nodiscard]] const EndpointInfo &localInfo() const;

        [[nodiscard]] QpState queryState() const;

    private:
        void modify(struct ibv_qp_attr &attr, int mask, QpState to);

        IBvProtectionDomain pd;
        IBvCompletionQueue cq;
        IBvSharedReceiveQueue srq;
        IBvHandle<ibv_qp> qp;
        EndpointInfo local;
};

#endif //SAFEVERBS_IBVDCTARGET_HPP
