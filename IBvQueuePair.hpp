//
// Created by jonas on 09.03.21.
//

#ifndef SAFEVERBS_IBVQUEUEPAIR_HPP
#define SAFEVERBS_IBVQUEUEPAIR_HPP

#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <set>
#include <infiniband/verbs.h>
#include <gsl/gsl>
#include "CapabilitySet.hpp"
#include "CompletionBudget.hpp"
#include "Config.hpp"
#include "EndpointInfo.hpp"
#include "ExtendedAtomics.hpp"
#include "IBvAddressHandle.hpp"
#include "IBvCompletionQueue.hpp"
#include "IBvHandle.hpp"
#include "IBvMemoryRegion.hpp"
#include "IBvProtectionDomain.hpp"
#include "QpState.hpp"
#include "RemoteMemory.hpp"
#include "WorkCompletion.hpp"

struct mlx5dv_qp_ex;

enum class QpType {
        ReliableConnected,
        UnreliableDatagram,
        /// mlx5 DC initiator, reaches any DC target through an address handle and the target number
        DynamicConnectInitiator
};

const char *toString(QpType type);

/// Q_Key of all datagram queue pairs
constexpr std::uint32_t GLOBAL_QKEY = 0x114514;

/// Starting packet sequence number of every queue pair
constexpr std::uint32_t GLOBAL_INIT_PSN = 0;

/// Datagram receives start with the global route header, receive buffers need this much extra room
constexpr std::size_t UD_GRH_BYTES = 40;

struct SendOptions {
    /**
     * Generate a completion. Always on for queue pairs built with signalAll(). An unsignaled send still holds a slot
     * of the send CQ until a later signaled send of the same queue pair completes.
     */
    bool signaled = true;
    /// Copy the payload into the work request, the buffer may be reused right after posting
    bool inlined = false;
    /// Wait for preceding reads and atomics to finish
    bool fence = false;
};

class QueuePairBuilder;

/**
 * Queue pair. Copies refer to the same hardware queue pair, which keeps its protection domain and completion queues
 * alive.
 *
 * Lifecycle: RESET -> initialize() -> INIT -> readyToReceive() -> RTR -> readyToSend() -> RTS. A polled failed
 * completion moves the queue pair to ERROR, it can not be brought back and has to be recreated.
 *
 * Posting never blocks. Posting to the same queue pair from multiple threads needs external synchronization.
 * Misuse (wrong state, buffers out of range, foreign memory regions, missing peers) terminates, failures of the
 * adapter throw IBvException.
 */
class IBvQueuePair {
    public:
        [[nodiscard]] struct ibv_qp *get() const;

        [[nodiscard]] QpType type() const;

        [[nodiscard]] std::uint32_t qpNum() const;

        [[nodiscard]] const QpCaps &caps() const;

        /// State as tracked by this library, includes ERROR from polled completions
        [[nodiscard]] QpState state() const;

        /// State as reported by the driver
        [[nodiscard]] QpState queryState() const;

        /// Parameters the peer needs to connect to this queue pair
        [[nodiscard]] const EndpointInfo &localInfo() const;

        /// Peer bound in readyToReceive(), connected queue pairs only
        [[nodiscard]] std::optional<EndpointInfo> peer() const;

        [[nodiscard]] bool extendedAtomicsEnabled(AtomicWidth width) const;

        [[nodiscard]] const IBvProtectionDomain &protectionDomain() const;

        /**
         * Changes state from RESET to INIT, binding the context's port
         */
        void initialize();

        /**
         * Changes state from INIT to RTR, connecting to the peer. Reliable connected queue pairs only.
         */
        void readyToReceive(const EndpointInfo &peer);

        /**
         * Changes state from INIT to RTR for queue pairs without a fixed peer (datagram and DC initiator)
         */
        void readyToReceive();

        /**
         * Changes state from RTR to RTS
         */
        void readyToSend();

        /// initialize(), readyToReceive(peer) and readyToSend()
        void connect(const EndpointInfo &peer);

        /// initialize(), readyToReceive() and readyToSend() for datagram and DC initiator queue pairs
        void bringUp();

        void postSend(WrId id, const MrSlice &data, SendOptions options = {});

        void postSend(WrId id, gsl::span<const MrSlice> data, SendOptions options = {});

        /// imm is given in host byte order
        void postSendImm(WrId id, const MrSlice &data, std::uint32_t imm, SendOptions options = {});

        void postWrite(WrId id, const MrSlice &local, const RemoteMemory &remote, SendOptions options = {});

        void postWriteImm(WrId id, const MrSlice &local, const RemoteMemory &remote, std::uint32_t imm,
                          SendOptions options = {});

        void postRead(WrId id, const MrSlice &local, const RemoteMemory &remote, SendOptions options = {});

        /// 8 byte compare-and-swap, the previous remote value is written to result
        void postCompareSwap(WrId id, const MrSlice &result, const RemoteMemory &target, std::uint64_t compare,
                             std::uint64_t swap, SendOptions options = {});

        void postFetchAdd(WrId id, const MrSlice &result, const RemoteMemory &target, std::uint64_t add,
                          SendOptions options = {});

        /**
         * Masked compare-and-swap of the given width. The width has to be enabled with
         * QueuePairBuilder::enableExtendedAtomics(). Operands are big endian, see buildMaskedCompareSwap().
         */
        void postExtCompareSwap(WrId id, const MrSlice &result, const RemoteMemory &target, AtomicWidth width,
                                gsl::span<const std::byte> compare, gsl::span<const std::byte> swap,
                                gsl::span<const std::byte> compareMask, gsl::span<const std::byte> swapMask,
                                SendOptions options = {});

        void postExtFetchAdd(WrId id, const MrSlice &result, const RemoteMemory &target, AtomicWidth width,
                             gsl::span<const std::byte> add, gsl::span<const std::byte> fieldBoundary,
                             SendOptions options = {});

        /// Send to a datagram queue pair or DC target
        void postSendTo(WrId id, const IBvAddressHandle &peer, const MrSlice &data, SendOptions options = {});

        void postSendImmTo(WrId id, const IBvAddressHandle &peer, const MrSlice &data, std::uint32_t imm,
                           SendOptions options = {});

        /// RDMA write through a DC target
        void postWriteTo(WrId id, const IBvAddressHandle &peer, const MrSlice &local, const RemoteMemory &remote,
                         SendOptions options = {});

        void postReadTo(WrId id, const IBvAddressHandle &peer, const MrSlice &local, const RemoteMemory &remote,
                        SendOptions options = {});

        void postReceive(WrId id, const MrSlice &buffer);

        void postReceive(WrId id, gsl::span<const MrSlice> buffers);

        [[nodiscard]] long useCount() const;

    private:
        friend class QueuePairBuilder;

        struct Connection {
            EndpointInfo local;
            std::optional<EndpointInfo> peer;
        };

        IBvQueuePair(const IBvProtectionDomain &pd, const IBvCompletionQueue &sendCq,
                     const IBvCompletionQueue &recvCq, QpType type, const QpCaps &caps, bool signalAll,
                     std::set<AtomicWidth> extendedAtomics);

        void transition(QpState to, struct ibv_qp_attr &attr, int mask);

        void checkCanSend(const IBvAddressHandle *peer) const;

        template<typename SetOperation>
        void postSendSide(WrId id, SendOptions options, gsl::span<const MrSlice> local, const IBvAddressHandle *peer,
                          SetOperation setOperation);

        void postExtAtomic(WrId id, AtomicWidth width, SendOptions options, const MrSlice &result,
                           const std::function<RawWqe(bool signaled)> &build);

        IBvProtectionDomain pd;
        IBvCompletionQueue sendCq;
        IBvCompletionQueue recvCq;
        std::shared_ptr<QpTracking> tracking;
        IBvHandle<ibv_qp> qp;
        struct ibv_qp_ex *qpx = nullptr;
        struct mlx5dv_qp_ex *mqpx = nullptr;
        QpType qpType;
        QpCaps qpCaps;
        bool signalAll;
        std::set<AtomicWidth> extendedAtomics;
        std::shared_ptr<Connection> connection;
};

/**
 * Collects the parameters of a queue pair. Optional features are enabled here, and checked against the
 * capabilities of the context.
 */
class QueuePairBuilder {
    public:
        /// Uses cq for both send and receive completions
        explicit QueuePairBuilder(const IBvCompletionQueue &cq);

        QueuePairBuilder &receiveCompletionQueue(const IBvCompletionQueue &cq);

        /// Terminates for DC initiators if the context lacks the dynamically connected transport
        QueuePairBuilder &type(QpType type);

        QueuePairBuilder &caps(const QpCaps &caps);

        /// Every send side work request generates a completion
        QueuePairBuilder &signalAll(bool enabled = true);

        /// Terminates if the context's capability set lacks the width
        QueuePairBuilder &enableExtendedAtomics(AtomicWidth width);

        /**
         * Terminates if the completion queues belong to another context than pd, or the requested features do not
         * fit the queue pair type.
         * @throws IBvException if the driver can not create the queue pair, e.g. caps beyond the device limits
         */
        [[nodiscard]] IBvQueuePair build(const IBvProtectionDomain &pd) const;

    private:
        IBvCompletionQueue sendCq;
        IBvCompletionQueue recvCq;
        QpType qpType = QpType::ReliableConnected;
        std::optional<QpCaps> qpCaps;
        bool all = false;
        std::set<AtomicWidth> widths;
};

#endif //SAFEVERBS_IBVQUEUEPAIR_HPP
