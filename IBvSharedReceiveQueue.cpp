/**
 * @file IBvSharedReceiveQueue.cpp
 * @author ottojo
 * @date 6/17/21
 */

#include "IBvSharedReceiveQueue.hpp"
#include "IBvException.hpp"

#include <fmt/format.h>

IBvSharedReceiveQueue::IBvSharedReceiveQueue(const IBvProtectionDomain &pd, const IBvCompletionQueue &cq,
                                             std::uint32_t maxWr, std::uint32_t maxSge) :
        pd(pd),
        cq(cq),
        maxSge(maxSge),
        receives(std::make_shared<QpTracking>(cq.budget(), cq.budget())) {
    struct ibv_srq_init_attr attr{
            .srq_context = nullptr,
            .attr = {
                    .max_wr = maxWr,
                    .max_sge = maxSge,
                    .srq_limit = 0,
            },
    };
    auto *raw = ibv_create_srq(pd.get(), &attr);
    if (raw == nullptr) {
        throw IBvException(errno, fmt::format("Creating shared receive queue with {} entries", maxWr));
    }
    srq = IBvHandle<ibv_srq>(raw, ibv_destroy_srq, "shared receive queue");
    receives->setState(QpState::ReadyToReceive);
}

struct ibv_srq *IBvSharedReceiveQueue::get() const {
    return srq.get();
}

const IBvCompletionQueue &IBvSharedReceiveQueue::completionQueue() const {
    return cq;
}

const IBvProtectionDomain &IBvSharedReceiveQueue::protectionDomain() const {
    return pd;
}

const std::shared_ptr<QpTracking> &IBvSharedReceiveQueue::tracking() const {
    return receives;
}

void IBvSharedReceiveQueue::postReceive(WrId id, const MrSlice &buffer) {
    postReceive(id, gsl::span<const MrSlice>(&buffer, 1));
}

void IBvSharedReceiveQueue::postReceive(WrId id, gsl::span<const MrSlice> buffers) {
    auto sges = toSgeList(pd, buffers, maxSge);
    struct ibv_recv_wr wr{
            .wr_id = id,
            .next = nullptr,
            .sg_list = sges.data(),
            .num_sge = static_cast<int>(sges.size()),
    };
    struct ibv_recv_wr *bad = nullptr;

    receives->reserveRecv(1);
    auto error = ibv_post_srq_recv(srq.get(), &wr, &bad);
    if (error != 0) {
        receives->cancelRecv(1);
        throw IBvException(error, fmt::format("Posting shared receive {}", id));
    }
}
