//
// Created by jonas on 09.03.21.
//

#include "IBvQueuePair.hpp"
#include "Contract.hpp"
#include "IBvDCTarget.hpp"
#include "IBvException.hpp"
#include "libibverbs_format.hpp"

#include <algorithm>
#include <numeric>
#include <utility>
#include <vector>
#include <arpa/inet.h>
#include <infiniband/mlx5dv.h>

namespace {
    constexpr std::uint8_t MAX_RD_ATOMIC = 16;
    constexpr std::uint8_t MIN_RNR_TIMER = 12;
    constexpr std::uint8_t TIMEOUT = 14;
    constexpr std::uint8_t RETRY_COUNT = 6;
    constexpr std::uint8_t RNR_RETRY = 6;

    std::uint64_t totalLength(gsl::span<const MrSlice> slices) {
        return std::accumulate(slices.begin(), slices.end(), std::uint64_t{0}, [](auto sum, const MrSlice &slice) {
            return sum + slice.size();
        });
    }

    void checkRemote(const RemoteMemory &remote, std::uint64_t length) {
        expects(length <= remote.length, "{} bytes do not fit remote region of {} bytes at {:#x}", length,
                remote.length, remote.addr);
    }

    void checkAtomicTarget(const MrSlice &result, const RemoteMemory &target) {
        expects(target.addr % sizeof(std::uint64_t) == 0, "atomic target {:#x} not 8 byte aligned", target.addr);
        checkRemote(target, sizeof(std::uint64_t));
        expects(result.size() >= sizeof(std::uint64_t), "atomic result buffer of {} bytes, need 8", result.size());
    }

    std::uint64_t sendOpsFlags(QpType type) {
        switch (type) {
            case QpType::UnreliableDatagram:
                return IBV_QP_EX_WITH_SEND | IBV_QP_EX_WITH_SEND_WITH_IMM;
            case QpType::ReliableConnected:
            case QpType::DynamicConnectInitiator:
                return IBV_QP_EX_WITH_SEND | IBV_QP_EX_WITH_SEND_WITH_IMM | IBV_QP_EX_WITH_RDMA_WRITE |
                       IBV_QP_EX_WITH_RDMA_WRITE_WITH_IMM | IBV_QP_EX_WITH_RDMA_READ |
                       IBV_QP_EX_WITH_ATOMIC_CMP_AND_SWP | IBV_QP_EX_WITH_ATOMIC_FETCH_AND_ADD;
        }
        return 0;
    }
}

const char *toString(QpType type) {
    switch (type) {
        case QpType::ReliableConnected:
            return "RC";
        case QpType::UnreliableDatagram:
            return "UD";
        case QpType::DynamicConnectInitiator:
            return "DCI";
    }
    return "unknown";
}

IBvQueuePair::IBvQueuePair(const IBvProtectionDomain &pd, const IBvCompletionQueue &sendCq,
                           const IBvCompletionQueue &recvCq, QpType type, const QpCaps &caps, bool signalAll,
                           std::set<AtomicWidth> extendedAtomics) :
        pd(pd),
        sendCq(sendCq),
        recvCq(recvCq),
        tracking(std::make_shared<QpTracking>(sendCq.budget(), recvCq.budget())),
        qpType(type),
        qpCaps(caps),
        signalAll(signalAll),
        extendedAtomics(std::move(extendedAtomics)) {
    const auto &ctx = pd.context();

    struct ibv_qp_init_attr_ex attr{};
    attr.send_cq = sendCq.get();
    attr.recv_cq = recvCq.get();
    attr.srq = nullptr;
    attr.cap = {
            .max_send_wr = caps.maxSendWr,
            .max_recv_wr = caps.maxRecvWr,
            .max_send_sge = caps.maxSendSge,
            .max_recv_sge = caps.maxRecvSge,
            .max_inline_data = caps.maxInlineData,
    };
    attr.qp_type = type == QpType::UnreliableDatagram ? IBV_QPT_UD : IBV_QPT_RC;
    attr.sq_sig_all = signalAll ? 1 : 0;
    attr.comp_mask = IBV_QP_INIT_ATTR_PD | IBV_QP_INIT_ATTR_SEND_OPS_FLAGS;
    attr.pd = pd.get();
    attr.send_ops_flags = sendOpsFlags(type);

    struct ibv_qp *raw = nullptr;
    bool directVerbs = type == QpType::DynamicConnectInitiator or not this->extendedAtomics.empty();
    if (directVerbs) {
        struct mlx5dv_qp_init_attr dvAttr{};
        if (type == QpType::DynamicConnectInitiator) {
            attr.qp_type = IBV_QPT_DRIVER;
            dvAttr.comp_mask |= MLX5DV_QP_INIT_ATTR_MASK_DC;
            dvAttr.dc_init_attr.dc_type = MLX5DV_DCTYPE_DCI;
        }
        if (not this->extendedAtomics.empty()) {
            dvAttr.comp_mask |= MLX5DV_QP_INIT_ATTR_MASK_SEND_OPS_FLAGS;
            dvAttr.send_ops_flags = MLX5DV_QP_EX_WITH_RAW_WQE;
        }
        raw = mlx5dv_create_qp(ctx.get(), &attr, &dvAttr);
    } else {
        raw = ibv_create_qp_ex(ctx.get(), &attr);
    }
    if (raw == nullptr) {
        throw IBvException(errno, fmt::format("Creating {} queue pair", toString(type)));
    }
    qp = IBvHandle<ibv_qp>(raw, ibv_destroy_qp, "queue pair");

    qpx = ibv_qp_to_qp_ex(raw);
    Expects(qpx != nullptr);
    if (directVerbs) {
        mqpx = mlx5dv_qp_ex_from_ibv_qp_ex(qpx);
        Expects(mqpx != nullptr);
    }

    sendCq.attach(raw->qp_num, tracking);
    if (not(sendCq == recvCq)) {
        recvCq.attach(raw->qp_num, tracking);
    }

    connection = std::make_shared<Connection>(Connection{
            .local = EndpointInfo{
                    .localLID = ctx.lid(),
                    .queuePairNumber = raw->qp_num,
                    .packetSequenceNumber = GLOBAL_INIT_PSN,
                    .gid = ctx.gid(),
                    .portNum = ctx.port(),
                    .pathMtu = ctx.activeMtu(),
            },
            .peer = std::nullopt,
    });

    logDebug("created {} queue pair {:#x} (send wr {}, recv wr {}, send sge {}, recv sge {}, inline {})",
             toString(type), raw->qp_num, attr.cap.max_send_wr, attr.cap.max_recv_wr, attr.cap.max_send_sge,
             attr.cap.max_recv_sge, attr.cap.max_inline_data);
}

struct ibv_qp *IBvQueuePair::get() const {
    return qp.get();
}

QpType IBvQueuePair::type() const {
    return qpType;
}

std::uint32_t IBvQueuePair::qpNum() const {
    return qp->qp_num;
}

const QpCaps &IBvQueuePair::caps() const {
    return qpCaps;
}

QpState IBvQueuePair::state() const {
    return tracking->state();
}

QpState IBvQueuePair::queryState() const {
    struct ibv_qp_attr attr{};
    struct ibv_qp_init_attr initAttr{};
    throwIfError(ibv_query_qp(qp.get(), &attr, IBV_QP_STATE, &initAttr), "Querying queue pair state");
    return fromIbv(attr.qp_state);
}

const EndpointInfo &IBvQueuePair::localInfo() const {
    return connection->local;
}

std::optional<EndpointInfo> IBvQueuePair::peer() const {
    return connection->peer;
}

bool IBvQueuePair::extendedAtomicsEnabled(AtomicWidth width) const {
    return extendedAtomics.contains(width);
}

const IBvProtectionDomain &IBvQueuePair::protectionDomain() const {
    return pd;
}

void IBvQueuePair::initialize() {
    const auto &ctx = pd.context();

    // QP state: RESET -> INIT
    struct ibv_qp_attr attr{};
    attr.qp_state = IBV_QPS_INIT;
    attr.pkey_index = 0;
    attr.port_num = ctx.port();
    int mask = IBV_QP_STATE | IBV_QP_PKEY_INDEX | IBV_QP_PORT;
    switch (qpType) {
        case QpType::ReliableConnected:
            attr.qp_access_flags = IBV_ACCESS_REMOTE_WRITE | IBV_ACCESS_REMOTE_READ | IBV_ACCESS_REMOTE_ATOMIC;
            mask |= IBV_QP_ACCESS_FLAGS;
            break;
        case QpType::UnreliableDatagram:
            attr.qkey = GLOBAL_QKEY;
            mask |= IBV_QP_QKEY;
            break;
        case QpType::DynamicConnectInitiator:
            break;
    }
    transition(QpState::Init, attr, mask);
}

void IBvQueuePair::readyToReceive(const EndpointInfo &peer) {
    expects(qpType == QpType::ReliableConnected, "{} queue pairs are not connected to a peer, use readyToReceive()",
            toString(qpType));
    expects(not connection->peer.has_value(), "queue pair {:#x} is already connected to {:#x}", qpNum(),
            connection->peer ? connection->peer->queuePairNumber : 0);
    peer.validate();

    const auto &ctx = pd.context();

    // QP state: INIT -> RTR
    struct ibv_qp_attr attr{};
    attr.qp_state = IBV_QPS_RTR;
    attr.path_mtu = std::min(ctx.activeMtu(), peer.pathMtu);
    attr.dest_qp_num = peer.queuePairNumber;
    attr.rq_psn = peer.packetSequenceNumber;
    attr.max_dest_rd_atomic = static_cast<std::uint8_t>(
            std::min<int>(MAX_RD_ATOMIC, ctx.deviceAttributes().max_qp_rd_atom));
    attr.min_rnr_timer = MIN_RNR_TIMER;
    attr.ah_attr = makeAddressVector(ctx, peer);
    transition(QpState::ReadyToReceive, attr,
               IBV_QP_STATE | IBV_QP_AV | IBV_QP_PATH_MTU | IBV_QP_DEST_QPN | IBV_QP_RQ_PSN |
               IBV_QP_MAX_DEST_RD_ATOMIC | IBV_QP_MIN_RNR_TIMER);
    connection->peer = peer;
}

void IBvQueuePair::readyToReceive() {
    expects(qpType != QpType::ReliableConnected, "RC queue pair {:#x} needs the peer's endpoint info", qpNum());

    struct ibv_qp_attr attr{};
    attr.qp_state = IBV_QPS_RTR;
    int mask = IBV_QP_STATE;
    if (qpType == QpType::DynamicConnectInitiator) {
        const auto &ctx = pd.context();
        attr.path_mtu = ctx.activeMtu();
        attr.ah_attr.port_num = ctx.port();
        if (ctx.isRoCE()) {
            attr.ah_attr.is_global = 1;
            attr.ah_attr.grh.sgid_index = ctx.gidIndex();
            attr.ah_attr.grh.hop_limit = 0xFF;
        }
        mask |= IBV_QP_PATH_MTU | IBV_QP_AV;
    }
    transition(QpState::ReadyToReceive, attr, mask);
}

void IBvQueuePair::readyToSend() {
    const auto &ctx = pd.context();

    // QP state: RTR -> RTS
    struct ibv_qp_attr attr{};
    attr.qp_state = IBV_QPS_RTS;
    attr.sq_psn = connection->local.packetSequenceNumber;
    int mask = IBV_QP_STATE | IBV_QP_SQ_PSN;
    if (qpType != QpType::UnreliableDatagram) {
        attr.timeout = TIMEOUT;
        attr.retry_cnt = RETRY_COUNT;
        attr.rnr_retry = RNR_RETRY;
        attr.max_rd_atomic = static_cast<std::uint8_t>(
                std::min<int>(MAX_RD_ATOMIC, ctx.deviceAttributes().max_qp_init_rd_atom));
        mask |= IBV_QP_TIMEOUT | IBV_QP_RETRY_CNT | IBV_QP_RNR_RETRY | IBV_QP_MAX_QP_RD_ATOMIC;
    }
    transition(QpState::ReadyToSend, attr, mask);
}

void IBvQueuePair::connect(const EndpointInfo &peer) {
    initialize();
    readyToReceive(peer);
    readyToSend();
}

void IBvQueuePair::bringUp() {
    initialize();
    readyToReceive();
    readyToSend();
}

void IBvQueuePair::transition(QpState to, struct ibv_qp_attr &attr, int mask) {
    auto from = state();
    if (from == QpState::Error) {
        throw IBvException(ErrorKind::BadState, 0, fmt::format("Queue pair {:#x} is in ERROR", qpNum()));
    }
    expects(isValidTransition(from, to), "queue pair {:#x} can not go from {} to {}", qpNum(), from, to);

    throwIfError(ibv_modify_qp(qp.get(), &attr, mask), fmt::format("Moving queue pair {:#x} to {}", qpNum(), to));
    tracking->setState(to);
    logDebug("queue pair {:#x}: {} -> {}", qpNum(), from, to);

    Ensures(queryState() == to);
}

void IBvQueuePair::checkCanSend(const IBvAddressHandle *peer) const {
    auto current = state();
    if (current == QpState::Error) {
        throw IBvException(ErrorKind::BadState, 0, fmt::format("Posting to queue pair {:#x} in ERROR", qpNum()));
    }
    expects(canPostSend(current), "queue pair {:#x} has to be in RTS to send, is in {}", qpNum(), current);
    if (qpType == QpType::ReliableConnected) {
        expects(peer == nullptr, "RC queue pair {:#x} sends to its connected peer only", qpNum());
    } else {
        expects(peer != nullptr, "{} queue pair {:#x} needs a destination for every send", toString(qpType),
                qpNum());
        expects(peer->protectionDomain() == pd, "address handle belongs to a different protection domain");
    }
}

template<typename SetOperation>
void IBvQueuePair::postSendSide(WrId id, SendOptions options, gsl::span<const MrSlice> local,
                                const IBvAddressHandle *peer, SetOperation setOperation) {
    checkCanSend(peer);
    auto sges = toSgeList(pd, local, qpCaps.maxSendSge);
    std::vector<struct ibv_data_buf> inlineData;
    if (options.inlined) {
        auto length = totalLength(local);
        expects(length <= qpCaps.maxInlineData, "{} bytes exceed the inline limit of {}", length,
                qpCaps.maxInlineData);
        for (const auto &slice: local) {
            inlineData.push_back({.addr = slice.data(), .length = slice.size()});
        }
    }

    bool signaled = options.signaled or signalAll;
    tracking->reserveSend(signaled);

    ibv_wr_start(qpx);
    qpx->wr_id = id;
    qpx->wr_flags = (signaled ? IBV_SEND_SIGNALED : 0) | (options.fence ? IBV_SEND_FENCE : 0);
    setOperation(qpx);
    if (peer != nullptr) {
        const auto &destination = peer->peer();
        if (qpType == QpType::UnreliableDatagram) {
            ibv_wr_set_ud_addr(qpx, peer->get(), destination.queuePairNumber, GLOBAL_QKEY);
        } else {
            mlx5dv_wr_set_dc_addr(mqpx, peer->get(), destination.queuePairNumber, DC_ACCESS_KEY);
        }
    }
    if (options.inlined) {
        ibv_wr_set_inline_data_list(qpx, inlineData.size(), inlineData.data());
    } else {
        ibv_wr_set_sge_list(qpx, sges.size(), sges.data());
    }

    auto error = ibv_wr_complete(qpx);
    if (error != 0) {
        tracking->cancelSend(signaled);
        throw IBvException(error, fmt::format("Posting work request {} to queue pair {:#x}", id, qpNum()));
    }
}

void IBvQueuePair::postSend(WrId id, const MrSlice &data, SendOptions options) {
    postSend(id, gsl::span<const MrSlice>(&data, 1), options);
}

void IBvQueuePair::postSend(WrId id, gsl::span<const MrSlice> data, SendOptions options) {
    postSendSide(id, options, data, nullptr, [](ibv_qp_ex *q) {
        ibv_wr_send(q);
    });
}

void IBvQueuePair::postSendImm(WrId id, const MrSlice &data, std::uint32_t imm, SendOptions options) {
    postSendSide(id, options, gsl::span<const MrSlice>(&data, 1), nullptr, [imm](ibv_qp_ex *q) {
        ibv_wr_send_imm(q, htonl(imm));
    });
}

void IBvQueuePair::postWrite(WrId id, const MrSlice &local, const RemoteMemory &remote, SendOptions options) {
    checkRemote(remote, local.size());
    postSendSide(id, options, gsl::span<const MrSlice>(&local, 1), nullptr, [&remote](ibv_qp_ex *q) {
        ibv_wr_rdma_write(q, remote.rkey, remote.addr);
    });
}

void IBvQueuePair::postWriteImm(WrId id, const MrSlice &local, const RemoteMemory &remote, std::uint32_t imm,
                                SendOptions options) {
    checkRemote(remote, local.size());
    postSendSide(id, options, gsl::span<const MrSlice>(&local, 1), nullptr, [&remote, imm](ibv_qp_ex *q) {
        ibv_wr_rdma_write_imm(q, remote.rkey, remote.addr, htonl(imm));
    });
}

void IBvQueuePair::postRead(WrId id, const MrSlice &local, const RemoteMemory &remote, SendOptions options) {
    checkRemote(remote, local.size());
    expects(not options.inlined, "RDMA reads can not be inlined");
    postSendSide(id, options, gsl::span<const MrSlice>(&local, 1), nullptr, [&remote](ibv_qp_ex *q) {
        ibv_wr_rdma_read(q, remote.rkey, remote.addr);
    });
}

void IBvQueuePair::postCompareSwap(WrId id, const MrSlice &result, const RemoteMemory &target,
                                   std::uint64_t compare, std::uint64_t swap, SendOptions options) {
    checkAtomicTarget(result, target);
    expects(not options.inlined, "atomics can not be inlined");
    auto local = result.slice(0, sizeof(std::uint64_t));
    postSendSide(id, options, gsl::span<const MrSlice>(&local, 1), nullptr, [&target, compare, swap](ibv_qp_ex *q) {
        ibv_wr_atomic_cmp_swp(q, target.rkey, target.addr, compare, swap);
    });
}

void IBvQueuePair::postFetchAdd(WrId id, const MrSlice &result, const RemoteMemory &target, std::uint64_t add,
                                SendOptions options) {
    checkAtomicTarget(result, target);
    expects(not options.inlined, "atomics can not be inlined");
    auto local = result.slice(0, sizeof(std::uint64_t));
    postSendSide(id, options, gsl::span<const MrSlice>(&local, 1), nullptr, [&target, add](ibv_qp_ex *q) {
        ibv_wr_atomic_fetch_add(q, target.rkey, target.addr, add);
    });
}

void IBvQueuePair::postExtAtomic(WrId id, AtomicWidth width, SendOptions options, const MrSlice &result,
                                 const std::function<RawWqe(bool signaled)> &build) {
    expects(extendedAtomics.contains(width), "extended atomics with {} byte operands not enabled on queue pair {:#x}",
            byteCount(width), qpNum());
    expects(not options.inlined, "atomics can not be inlined");
    expects(result.region().protectionDomain() == pd,
            "memory region lkey {:#x} belongs to a different protection domain", result.lkey());
    checkCanSend(nullptr);

    bool signaled = options.signaled or signalAll;
    auto wqe = build(signaled);
    tracking->reserveSend(signaled);

    ibv_wr_start(qpx);
    qpx->wr_id = id;
    qpx->wr_flags = signaled ? IBV_SEND_SIGNALED : 0;
    mlx5dv_wr_raw_wqe(mqpx, wqe.bytes.data());
    auto error = ibv_wr_complete(qpx);
    if (error != 0) {
        tracking->cancelSend(signaled);
        throw IBvException(error, fmt::format("Posting extended atomic {} to queue pair {:#x}", id, qpNum()));
    }
}

void IBvQueuePair::postExtCompareSwap(WrId id, const MrSlice &result, const RemoteMemory &target, AtomicWidth width,
                                      gsl::span<const std::byte> compare, gsl::span<const std::byte> swap,
                                      gsl::span<const std::byte> compareMask, gsl::span<const std::byte> swapMask,
                                      SendOptions options) {
    postExtAtomic(id, width, options, result, [&](bool signaled) {
        return buildMaskedCompareSwap(qpNum(), signaled, target, result.sge(), width, compare, swap, compareMask,
                                      swapMask);
    });
}

void IBvQueuePair::postExtFetchAdd(WrId id, const MrSlice &result, const RemoteMemory &target, AtomicWidth width,
                                   gsl::span<const std::byte> add, gsl::span<const std::byte> fieldBoundary,
                                   SendOptions options) {
    postExtAtomic(id, width, options, result, [&](bool signaled) {
        return buildMaskedFetchAdd(qpNum(), signaled, target, result.sge(), width, add, fieldBoundary);
    });
}

void IBvQueuePair::postSendTo(WrId id, const IBvAddressHandle &peer, const MrSlice &data, SendOptions options) {
    postSendSide(id, options, gsl::span<const MrSlice>(&data, 1), &peer, [](ibv_qp_ex *q) {
        ibv_wr_send(q);
    });
}

void IBvQueuePair::postSendImmTo(WrId id, const IBvAddressHandle &peer, const MrSlice &data, std::uint32_t imm,
                                 SendOptions options) {
    postSendSide(id, options, gsl::span<const MrSlice>(&data, 1), &peer, [imm](ibv_qp_ex *q) {
        ibv_wr_send_imm(q, htonl(imm));
    });
}

void IBvQueuePair::postWriteTo(WrId id, const IBvAddressHandle &peer, const MrSlice &local,
                               const RemoteMemory &remote, SendOptions options) {
    expects(qpType == QpType::DynamicConnectInitiator, "RDMA writes need a connected or DC queue pair");
    checkRemote(remote, local.size());
    postSendSide(id, options, gsl::span<const MrSlice>(&local, 1), &peer, [&remote](ibv_qp_ex *q) {
        ibv_wr_rdma_write(q, remote.rkey, remote.addr);
    });
}

void IBvQueuePair::postReadTo(WrId id, const IBvAddressHandle &peer, const MrSlice &local,
                              const RemoteMemory &remote, SendOptions options) {
    expects(qpType == QpType::DynamicConnectInitiator, "RDMA reads need a connected or DC queue pair");
    expects(not options.inlined, "RDMA reads can not be inlined");
    checkRemote(remote, local.size());
    postSendSide(id, options, gsl::span<const MrSlice>(&local, 1), &peer, [&remote](ibv_qp_ex *q) {
        ibv_wr_rdma_read(q, remote.rkey, remote.addr);
    });
}

void IBvQueuePair::postReceive(WrId id, const MrSlice &buffer) {
    postReceive(id, gsl::span<const MrSlice>(&buffer, 1));
}

void IBvQueuePair::postReceive(WrId id, gsl::span<const MrSlice> buffers) {
    expects(qpType != QpType::DynamicConnectInitiator, "DC initiator {:#x} has no receive queue", qpNum());
    auto current = state();
    if (current == QpState::Error) {
        throw IBvException(ErrorKind::BadState, 0, fmt::format("Posting receive to queue pair {:#x} in ERROR",
                                                               qpNum()));
    }
    expects(canPostReceive(current), "queue pair {:#x} has to be initialized before posting receives, is in {}",
            qpNum(), current);

    auto sges = toSgeList(pd, buffers, qpCaps.maxRecvSge);
    struct ibv_recv_wr wr{
            .wr_id = id,
            .next = nullptr,
            .sg_list = sges.data(),
            .num_sge = static_cast<int>(sges.size()),
    };
    struct ibv_recv_wr *bad = nullptr;

    tracking->reserveRecv(1);
    auto error = ibv_post_recv(qp.get(), &wr, &bad);
    if (error != 0) {
        tracking->cancelRecv(1);
        throw IBvException(error, fmt::format("Posting receive {} to queue pair {:#x}", id, qpNum()));
    }
}

long IBvQueuePair::useCount() const {
    return qp.useCount();
}

QueuePairBuilder::QueuePairBuilder(const IBvCompletionQueue &cq) : sendCq(cq), recvCq(cq) {}

QueuePairBuilder &QueuePairBuilder::receiveCompletionQueue(const IBvCompletionQueue &cq) {
    recvCq = cq;
    return *this;
}

QueuePairBuilder &QueuePairBuilder::type(QpType type) {
    if (type == QpType::DynamicConnectInitiator) {
        sendCq.context().capabilities().require(Capability::DynamicallyConnected);
    }
    qpType = type;
    return *this;
}

QueuePairBuilder &QueuePairBuilder::caps(const QpCaps &caps) {
    qpCaps = caps;
    return *this;
}

QueuePairBuilder &QueuePairBuilder::signalAll(bool enabled) {
    all = enabled;
    return *this;
}

QueuePairBuilder &QueuePairBuilder::enableExtendedAtomics(AtomicWidth width) {
    sendCq.context().capabilities().require(width);
    widths.insert(width);
    return *this;
}

IBvQueuePair QueuePairBuilder::build(const IBvProtectionDomain &pd) const {
    const auto &ctx = pd.context();
    expects(sendCq.context().get() == ctx.get() and recvCq.context().get() == ctx.get(),
            "completion queues and protection domain belong to different device contexts");
    expects(widths.empty() or qpType == QpType::ReliableConnected,
            "extended atomics are only available on RC queue pairs, not {}", toString(qpType));
    if (qpType == QpType::DynamicConnectInitiator) {
        ctx.capabilities().require(Capability::DynamicallyConnected);
    }
    for (auto width: widths) {
        ctx.capabilities().require(width);
    }

    auto caps = qpCaps.value_or(qpType == QpType::DynamicConnectInitiator ? QpCaps::forDcInitiator() : QpCaps{});
    if (qpType == QpType::DynamicConnectInitiator) {
        caps.maxRecvWr = 0;
        caps.maxRecvSge = 0;
    }
    return {pd, sendCq, recvCq, qpType, caps, all, widths};
}
