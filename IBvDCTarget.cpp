/**
 * @file IBvDCTarget.cpp
 * @author ottojo
 * @date 6/17/21
 */

#include "IBvDCTarget.hpp"
#include "Contract.hpp"
#include "IBvException.hpp"
#include "libibverbs_format.hpp"

#include <infiniband/mlx5dv.h>
#include <gsl/gsl>

IBvDCTarget::IBvDCTarget(const IBvProtectionDomain &pd, const IBvCompletionQueue &cq,
                         const IBvSharedReceiveQueue &srq) : pd(pd), cq(cq), srq(srq) {
    const auto &ctx = pd.context();
    ctx.capabilities().require(Capability::DynamicallyConnected);
    expects(srq.protectionDomain() == pd, "shared receive queue belongs to a different protection domain");
    expects(srq.completionQueue() == cq, "shared receive queue reports to a different completion queue");
    expects(cq.context().get() == ctx.get(), "completion queue belongs to a different device context");

    struct ibv_qp_init_attr_ex attr{};
    attr.send_cq = cq.get();
    attr.recv_cq = cq.get();
    attr.srq = srq.get();
    attr.qp_type = IBV_QPT_DRIVER;
    attr.comp_mask = IBV_QP_INIT_ATTR_PD;
    attr.pd = pd.get();

    struct mlx5dv_qp_init_attr dvAttr{};
    dvAttr.comp_mask = MLX5DV_QP_INIT_ATTR_MASK_DC;
    dvAttr.dc_init_attr.dc_type = MLX5DV_DCTYPE_DCT;
    dvAttr.dc_init_attr.dct_access_key = DC_ACCESS_KEY;

    auto *raw = mlx5dv_create_qp(ctx.get(), &attr, &dvAttr);
    if (raw == nullptr) {
        throw IBvException(errno, "Creating DC target");
    }
    qp = IBvHandle<ibv_qp>(raw, ibv_destroy_qp, "DC target");
    cq.attach(raw->qp_num, srq.tracking());

    local = EndpointInfo{
            .localLID = ctx.lid(),
            .queuePairNumber = raw->qp_num,
            .packetSequenceNumber = 0,
            .gid = ctx.gid(),
            .portNum = ctx.port(),
            .pathMtu = ctx.activeMtu(),
    };

    struct ibv_qp_attr init{};
    init.qp_state = IBV_QPS_INIT;
    init.pkey_index = 0;
    init.port_num = ctx.port();
    init.qp_access_flags = IBV_ACCESS_REMOTE_WRITE | IBV_ACCESS_REMOTE_READ | IBV_ACCESS_REMOTE_ATOMIC;
    modify(init, IBV_QP_STATE | IBV_QP_PKEY_INDEX | IBV_QP_PORT | IBV_QP_ACCESS_FLAGS, QpState::Init);

    struct ibv_qp_attr rtr{};
    rtr.qp_state = IBV_QPS_RTR;
    rtr.path_mtu = ctx.activeMtu();
    rtr.min_rnr_timer = 12;
    rtr.ah_attr.port_num = ctx.port();
    if (ctx.isRoCE()) {
        rtr.ah_attr.is_global = 1;
        rtr.ah_attr.grh.sgid_index = ctx.gidIndex();
        rtr.ah_attr.grh.hop_limit = 0xFF;
    }
    modify(rtr, IBV_QP_STATE | IBV_QP_MIN_RNR_TIMER | IBV_QP_AV | IBV_QP_PATH_MTU, QpState::ReadyToReceive);

    logDebug("DC target {:#x} ready on {} port {}", raw->qp_num, ctx.deviceName(), ctx.port());
}

struct ibv_qp *IBvDCTarget::get() const {
    return qp.get();
}

std::uint32_t IBvDCTarget::dctNum() const {
    return qp->qp_num;
}

const EndpointInfo &IBvDCTarget::localInfo() const {
    return local;
}

QpState IBvDCTarget::queryState() const {
    struct ibv_qp_attr attr{};
    struct ibv_qp_init_attr initAttr{};
    throwIfError(ibv_query_qp(qp.get(), &attr, IBV_QP_STATE, &initAttr), "Querying DC target state");
    return fromIbv(attr.qp_state);
}

void IBvDCTarget::modify(struct ibv_qp_attr &attr, int mask, QpState to) {
    throwIfError(ibv_modify_qp(qp.get(), &attr, mask), fmt::format("Moving DC target to {}", to));
    Ensures(queryState() == to);
}
