//
// Created by jonas on 18.06.21.
//

#include <array>
#include <chrono>
#include <cstdint>
#include <cstdlib>
#include <cstring>
#include <future>
#include <optional>
#include <string>
#include <vector>
#include <gtest/gtest.h>
#include "Cluster.hpp"
#include "IBvDCTarget.hpp"
#include "IBvException.hpp"
#include "IBvQueuePair.hpp"
#include "IBvRegisteredBuffer.hpp"

// Everything in here needs an RDMA device (soft-RoCE is enough). Without one, the tests are skipped.
// SAFEVERBS_TEST_CONFIG may point to a configuration file selecting device, port and GID index.

namespace {
    Config testConfig() {
        const char *path = std::getenv("SAFEVERBS_TEST_CONFIG");
        return path == nullptr ? Config{} : loadConfig(path);
    }

    std::vector<WorkCompletion> pollFor(IBvCompletionQueue &cq, std::size_t n) {
        std::vector<WorkCompletion> completions;
        auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(5);
        while (completions.size() < n and std::chrono::steady_clock::now() < deadline) {
            for (auto &wc: cq.poll(n - completions.size())) {
                completions.push_back(wc);
            }
        }
        return completions;
    }

    struct Peer {
        IBvContext context;
        IBvProtectionDomain pd;
        IBvCompletionQueue cq;
        IBvQueuePair qp;
        IBvRegisteredBuffer<char> buffer;

        Peer(const Config &config, QpType type) :
                context(config.context, config.capabilities),
                pd(context),
                cq(context, config.cqDepth),
                qp(QueuePairBuilder(cq).type(type).caps(config.qp).build(pd)),
                buffer(pd, 128) {}
    };
}

class DeviceTest : public testing::Test {
    protected:
        void SetUp() override {
            try {
                config = testConfig();
                context.emplace(config.context, config.capabilities);
            } catch (const IBvException &e) {
                GTEST_SKIP() << "No usable RDMA device: " << e.what();
            }
        }

        Config config;
        std::optional<IBvContext> context;
};

using DeviceDeathTest = DeviceTest;

TEST_F(DeviceTest, PollingEmptyQueueReturnsNothing) {
    IBvCompletionQueue cq(*context, 16);
    EXPECT_TRUE(cq.poll(16).empty());
    EXPECT_TRUE(cq.poll(0).empty());
    EXPECT_FALSE(cq.pollOne().has_value());
    std::array<WorkCompletion, 4> slots;
    EXPECT_EQ(cq.poll(gsl::span<WorkCompletion>(slots)), 0u);
    EXPECT_EQ(cq.budget()->outstanding(), 0u);
}

TEST_F(DeviceTest, CompletionQueueCapacityIsEnforced) {
    IBvProtectionDomain pd(*context);
    IBvCompletionQueue cq(*context, 2);
    auto qp = QueuePairBuilder(cq).build(pd);
    IBvRegisteredBuffer<char> buffer(pd, 48);
    qp.initialize();

    qp.postReceive(1, buffer.slice(0, 16));
    qp.postReceive(2, buffer.slice(16, 16));
    try {
        qp.postReceive(3, buffer.slice(32, 16));
        FAIL() << "expected IBvException";
    } catch (const IBvException &e) {
        EXPECT_EQ(e.kind(), ErrorKind::ResourceExhausted);
    }
    EXPECT_EQ(cq.budget()->outstanding(), 2u);
}

TEST_F(DeviceTest, DestroyedQueuePairReturnsReservations) {
    IBvProtectionDomain pd(*context);
    IBvCompletionQueue cq(*context, 4);
    IBvRegisteredBuffer<char> buffer(pd, 64);
    {
        auto qp = QueuePairBuilder(cq).build(pd);
        qp.initialize();
        qp.postReceive(1, buffer.slice(0, 32));
        qp.postReceive(2, buffer.slice(32, 32));
        EXPECT_EQ(cq.budget()->outstanding(), 2u);
    }
    EXPECT_EQ(cq.budget()->outstanding(), 0u);
}

TEST_F(DeviceTest, ResourcesOutliveTheirCreators) {
    std::optional<IBvProtectionDomain> pd(std::in_place, *context);
    std::optional<IBvCompletionQueue> cq(std::in_place, *context, 16);
    auto qp = QueuePairBuilder(*cq).build(*pd);
    IBvRegisteredBuffer<char> buffer(*pd, 64);

    // Dropping every handle but the queue pair and the buffer keeps the verbs objects alive
    context.reset();
    cq.reset();
    pd.reset();
    EXPECT_GE(qp.protectionDomain().useCount(), 2);
    EXPECT_GE(qp.protectionDomain().context().useCount(), 3);

    qp.initialize();
    EXPECT_EQ(qp.queryState(), QpState::Init);
    qp.postReceive(1, buffer.whole());
}

TEST_F(DeviceTest, StateMachine) {
    IBvProtectionDomain pd(*context);
    IBvCompletionQueue cq(*context, 16);
    auto qp = QueuePairBuilder(cq).build(pd);
    EXPECT_EQ(qp.state(), QpState::Reset);
    EXPECT_EQ(qp.queryState(), QpState::Reset);
    EXPECT_NE(qp.qpNum(), 0u);

    // Connected to itself
    qp.connect(qp.localInfo());
    EXPECT_EQ(qp.state(), QpState::ReadyToSend);
    EXPECT_EQ(qp.queryState(), QpState::ReadyToSend);
    ASSERT_TRUE(qp.peer().has_value());
    EXPECT_EQ(qp.peer()->queuePairNumber, qp.qpNum());
}

TEST_F(DeviceTest, SendBetweenContexts) {
    Peer a(config, QpType::ReliableConnected);
    Peer b(config, QpType::ReliableConnected);
    a.qp.connect(b.qp.localInfo());
    b.qp.connect(a.qp.localInfo());

    b.qp.postReceive(3, b.buffer.slice(0, 64));
    std::strncpy(a.buffer.data(), "ping", 64);
    a.qp.postSend(7, a.buffer.slice(0, 64));

    auto received = pollFor(b.cq, 1);
    ASSERT_EQ(received.size(), 1u);
    EXPECT_TRUE(received[0].ok());
    EXPECT_EQ(received[0].wrId(), 3u);
    EXPECT_EQ(received[0].byteLength(), 64u);
    EXPECT_TRUE(received[0].isReceive());
    EXPECT_STREQ(b.buffer.data(), "ping");

    auto sent = pollFor(a.cq, 1);
    ASSERT_EQ(sent.size(), 1u);
    EXPECT_TRUE(sent[0].ok());
    EXPECT_EQ(sent[0].wrId(), 7u);
    EXPECT_FALSE(sent[0].isReceive());

    EXPECT_EQ(a.cq.budget()->outstanding(), 0u);
    EXPECT_EQ(b.cq.budget()->outstanding(), 0u);
}

TEST_F(DeviceTest, UnsignaledSendRetiredBySignaledCompletion) {
    Peer a(config, QpType::ReliableConnected);
    Peer b(config, QpType::ReliableConnected);
    a.qp.connect(b.qp.localInfo());
    b.qp.connect(a.qp.localInfo());

    b.qp.postReceive(1, b.buffer.slice(0, 64));
    b.qp.postReceive(2, b.buffer.slice(64, 64));
    a.qp.postSend(3, a.buffer.slice(0, 8), {.signaled = false});
    EXPECT_EQ(a.cq.budget()->outstanding(), 1u);
    a.qp.postSend(4, a.buffer.slice(8, 8));
    EXPECT_EQ(a.cq.budget()->outstanding(), 2u);

    ASSERT_EQ(pollFor(b.cq, 2).size(), 2u);
    auto sent = pollFor(a.cq, 1);
    ASSERT_EQ(sent.size(), 1u);
    EXPECT_EQ(sent[0].wrId(), 4u);
    EXPECT_EQ(a.cq.budget()->outstanding(), 0u);
}

TEST_F(DeviceTest, PollIntoCallerBuffer) {
    Peer a(config, QpType::ReliableConnected);
    Peer b(config, QpType::ReliableConnected);
    a.qp.connect(b.qp.localInfo());
    b.qp.connect(a.qp.localInfo());

    // More completions than one driver batch
    constexpr std::size_t messages = 20;
    for (std::size_t i = 0; i < messages; i++) {
        b.qp.postReceive(i, b.buffer.slice(0, 4));
    }
    for (std::size_t i = 0; i < messages; i++) {
        a.qp.postSend(100 + i, a.buffer.slice(0, 4));
    }

    std::array<WorkCompletion, 32> slots;
    std::size_t filled = 0;
    auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(5);
    while (filled < messages and std::chrono::steady_clock::now() < deadline) {
        filled += b.cq.poll(gsl::span<WorkCompletion>(slots).subspan(filled));
    }
    ASSERT_EQ(filled, messages);
    for (std::size_t i = 0; i < messages; i++) {
        EXPECT_TRUE(slots[i].ok());
        EXPECT_EQ(slots[i].wrId(), i);
    }
    EXPECT_EQ(b.cq.budget()->outstanding(), 0u);
    ASSERT_EQ(pollFor(a.cq, messages).size(), messages);
}

TEST_F(DeviceTest, ConnectAllOverLoopback) {
    // Two members on this host, each with its own context
    auto member = [this](std::size_t rank) {
        Peer self(config, QpType::ReliableConnected);
        Cluster cluster({"127.0.0.1", "127.0.0.1"}, rank);
        auto connected = connectAll(cluster, self.pd, QueuePairBuilder(self.cq).caps(config.qp), 2, 23471, 23472);
        EXPECT_EQ(connected.size(), 1u);
        EXPECT_EQ(connected.count(1 - rank), 1u);
        std::vector<std::uint32_t> remoteQpns;
        for (const auto &qp: connected.at(1 - rank)) {
            EXPECT_EQ(qp.state(), QpState::ReadyToSend);
            remoteQpns.push_back(qp.peer()->queuePairNumber);
        }
        return remoteQpns;
    };
    auto second = std::async(std::launch::async, member, 1);
    auto first = member(0);
    auto other = second.get();
    EXPECT_EQ(first.size(), 2u);
    EXPECT_EQ(other.size(), 2u);
}

TEST_F(DeviceTest, WriteWithImmediate) {
    Peer a(config, QpType::ReliableConnected);
    Peer b(config, QpType::ReliableConnected);
    a.qp.connect(b.qp.localInfo());
    b.qp.connect(a.qp.localInfo());

    b.qp.postReceive(10, b.buffer.slice(0, 1));
    std::strncpy(a.buffer.data(), "written", 128);
    a.qp.postWriteImm(11, a.buffer.slice(0, 8), b.buffer.region().remote().slice(64, 8), 0xc0ffee);

    auto received = pollFor(b.cq, 1);
    ASSERT_EQ(received.size(), 1u);
    EXPECT_TRUE(received[0].ok());
    EXPECT_EQ(received[0].opcode(), IBV_WC_RECV_RDMA_WITH_IMM);
    ASSERT_TRUE(received[0].immData().has_value());
    EXPECT_EQ(*received[0].immData(), 0xc0ffeeu);
    EXPECT_STREQ(b.buffer.data() + 64, "written");
    ASSERT_EQ(pollFor(a.cq, 1).size(), 1u);
}

TEST_F(DeviceTest, ReadAndAtomics) {
    Peer a(config, QpType::ReliableConnected);
    IBvProtectionDomain pd(*context);
    IBvCompletionQueue cq(*context, 16);
    auto qp = QueuePairBuilder(cq).build(pd);
    IBvRegisteredBuffer<std::uint64_t> counter(pd, 1);
    counter.at(0) = 40;
    a.qp.connect(qp.localInfo());
    qp.connect(a.qp.localInfo());

    IBvRegisteredBuffer<std::uint64_t> result(a.pd, 2);
    a.qp.postFetchAdd(1, result.slice(0, 1), counter.region().remote(), 2);
    auto added = pollFor(a.cq, 1);
    ASSERT_EQ(added.size(), 1u);
    added[0].expectSuccess();
    EXPECT_EQ(result.at(0), 40u);

    a.qp.postCompareSwap(2, result.slice(0, 1), counter.region().remote(), 42, 7);
    ASSERT_EQ(pollFor(a.cq, 1).size(), 1u);
    EXPECT_EQ(result.at(0), 42u);

    a.qp.postRead(3, result.slice(1, 1), counter.region().remote());
    ASSERT_EQ(pollFor(a.cq, 1).size(), 1u);
    EXPECT_EQ(result.at(1), 7u);
}

TEST_F(DeviceTest, RemoteAccessErrorMovesQueuePairToError) {
    Peer a(config, QpType::ReliableConnected);
    Peer b(config, QpType::ReliableConnected);
    a.qp.connect(b.qp.localInfo());
    b.qp.connect(a.qp.localInfo());

    auto remote = b.buffer.region().remote();
    remote.rkey ^= 0xff;
    a.qp.postWrite(1, a.buffer.slice(0, 8), remote);

    auto failed = pollFor(a.cq, 1);
    ASSERT_EQ(failed.size(), 1u);
    EXPECT_FALSE(failed[0].ok());
    EXPECT_EQ(failed[0].errorKind(), ErrorKind::RemoteAccess);
    EXPECT_EQ(a.qp.state(), QpState::Error);

    try {
        a.qp.postSend(2, a.buffer.whole());
        FAIL() << "expected IBvException";
    } catch (const IBvException &e) {
        EXPECT_EQ(e.kind(), ErrorKind::BadState);
    }
    EXPECT_THROW(a.qp.postReceive(3, a.buffer.whole()), IBvException);
    EXPECT_EQ(a.cq.budget()->outstanding(), 0u);
}

TEST_F(DeviceTest, DatagramSend) {
    Peer a(config, QpType::UnreliableDatagram);
    Peer b(config, QpType::UnreliableDatagram);
    a.qp.bringUp();
    b.qp.bringUp();
    EXPECT_EQ(a.qp.state(), QpState::ReadyToSend);

    b.qp.postReceive(5, b.buffer.slice(0, UD_GRH_BYTES + 32));
    std::strncpy(a.buffer.data(), "datagram", 32);
    IBvAddressHandle toB(a.pd, b.qp.localInfo());
    a.qp.postSendTo(6, toB, a.buffer.slice(0, 32));

    auto received = pollFor(b.cq, 1);
    ASSERT_EQ(received.size(), 1u);
    received[0].expectSuccess();
    EXPECT_EQ(received[0].wrId(), 5u);
    EXPECT_EQ(received[0].byteLength(), UD_GRH_BYTES + 32);
    EXPECT_STREQ(b.buffer.data() + UD_GRH_BYTES, "datagram");
    ASSERT_EQ(pollFor(a.cq, 1).size(), 1u);
}

TEST_F(DeviceDeathTest, SendBeforeReadyToSend) {
    IBvProtectionDomain pd(*context);
    IBvCompletionQueue cq(*context, 16);
    auto qp = QueuePairBuilder(cq).build(pd);
    IBvRegisteredBuffer<char> buffer(pd, 16);

    EXPECT_DEATH(qp.postSend(1, buffer.whole()), "has to be in RTS");
    qp.initialize();
    EXPECT_DEATH(qp.postSend(1, buffer.whole()), "has to be in RTS");
}

TEST_F(DeviceDeathTest, ReceiveBeforeInit) {
    IBvProtectionDomain pd(*context);
    IBvCompletionQueue cq(*context, 16);
    auto qp = QueuePairBuilder(cq).build(pd);
    IBvRegisteredBuffer<char> buffer(pd, 16);
    EXPECT_DEATH(qp.postReceive(1, buffer.whole()), "has to be initialized");
}

TEST_F(DeviceDeathTest, ConnectToQueuePairZero) {
    IBvProtectionDomain pd(*context);
    IBvCompletionQueue cq(*context, 16);
    auto qp = QueuePairBuilder(cq).build(pd);
    qp.initialize();

    auto peer = qp.localInfo();
    peer.queuePairNumber = 0;
    EXPECT_DEATH(qp.readyToReceive(peer), "queue pair number 0");
}

TEST_F(DeviceDeathTest, SkippingStates) {
    IBvProtectionDomain pd(*context);
    IBvCompletionQueue cq(*context, 16);
    auto qp = QueuePairBuilder(cq).build(pd);
    EXPECT_DEATH(qp.readyToSend(), "can not go from RESET to RTS");
}

TEST_F(DeviceDeathTest, ExtendedAtomicsNeedCapability) {
    IBvCompletionQueue cq(*context, 16);
    QueuePairBuilder builder(cq);
    EXPECT_DEATH(builder.enableExtendedAtomics(AtomicWidth::Bytes8), "not available");
}

TEST_F(DeviceTest, ExtendedAtomicsWithCapability) {
    Config withAtomics = config;
    withAtomics.capabilities.withExtendedAtomics(AtomicWidth::Bytes8);
    IBvContext atomicContext(withAtomics.context, withAtomics.capabilities);
    IBvProtectionDomain pd(atomicContext);
    IBvCompletionQueue cq(atomicContext, 16);

    std::optional<IBvQueuePair> qp;
    try {
        qp.emplace(QueuePairBuilder(cq).enableExtendedAtomics(AtomicWidth::Bytes8).build(pd));
    } catch (const IBvException &e) {
        GTEST_SKIP() << "Adapter has no mlx5 raw WQE support: " << e.what();
    }
    EXPECT_TRUE(qp->extendedAtomicsEnabled(AtomicWidth::Bytes8));
    EXPECT_FALSE(qp->extendedAtomicsEnabled(AtomicWidth::Bytes16));

    IBvRegisteredBuffer<std::uint64_t> target(pd, 2);
    qp->connect(qp->localInfo());
    EXPECT_EQ(qp->state(), QpState::ReadyToSend);

    auto add = toOperand(1);
    auto boundary = toOperand(0);
    qp->postExtFetchAdd(1, target.slice(1, 1), target.slice(0, 1).remote(), AtomicWidth::Bytes8, add, boundary);
    auto completions = pollFor(cq, 1);
    ASSERT_EQ(completions.size(), 1u);
    EXPECT_EQ(completions[0].wrId(), 1u);
}

TEST_F(DeviceDeathTest, SliceOutOfRange) {
    IBvProtectionDomain pd(*context);
    IBvRegisteredBuffer<char> buffer(pd, 16);
    EXPECT_DEATH((void) buffer.region().slice(8, 9), "outside of memory region");
    EXPECT_DEATH((void) buffer.at(16), "out of range");
}

TEST_F(DeviceDeathTest, ForeignMemoryRegion) {
    IBvProtectionDomain pd(*context);
    IBvProtectionDomain otherPd(*context);
    IBvCompletionQueue cq(*context, 16);
    auto qp = QueuePairBuilder(cq).build(pd);
    IBvRegisteredBuffer<char> foreign(otherPd, 16);
    qp.initialize();
    EXPECT_DEATH(qp.postReceive(1, foreign.whole()), "protection domain");
}

TEST_F(DeviceDeathTest, DcInitiatorNeedsCapability) {
    IBvCompletionQueue cq(*context, 16);
    QueuePairBuilder builder(cq);
    EXPECT_DEATH(builder.type(QpType::DynamicConnectInitiator), "dynamically connected transport");
}

TEST_F(DeviceTest, DynamicallyConnectedSend) {
    Config withDc = config;
    withDc.capabilities.withDynamicallyConnected();
    IBvContext dcContext(withDc.context, withDc.capabilities);
    IBvProtectionDomain pd(dcContext);
    IBvCompletionQueue targetCq(dcContext, 16);
    IBvCompletionQueue initiatorCq(dcContext, 16);

    std::optional<IBvSharedReceiveQueue> srq;
    std::optional<IBvDCTarget> target;
    std::optional<IBvQueuePair> initiator;
    try {
        srq.emplace(pd, targetCq);
        target.emplace(pd, targetCq, *srq);
        initiator.emplace(QueuePairBuilder(initiatorCq).type(QpType::DynamicConnectInitiator).build(pd));
    } catch (const IBvException &e) {
        GTEST_SKIP() << "Adapter has no DC transport: " << e.what();
    }
    EXPECT_EQ(target->queryState(), QpState::ReadyToReceive);
    EXPECT_EQ(target->localInfo().queuePairNumber, target->dctNum());

    IBvRegisteredBuffer<char> buffer(pd, 64);
    srq->postReceive(1, buffer.slice(0, 32));
    initiator->bringUp();

    std::strncpy(buffer.data() + 32, "dc", 32);
    IBvAddressHandle toTarget(pd, target->localInfo());
    initiator->postSendTo(2, toTarget, buffer.slice(32, 32));

    auto sent = pollFor(initiatorCq, 1);
    ASSERT_EQ(sent.size(), 1u);
    sent[0].expectSuccess();

    auto received = pollFor(targetCq, 1);
    ASSERT_EQ(received.size(), 1u);
    received[0].expectSuccess();
    EXPECT_EQ(received[0].wrId(), 1u);
    EXPECT_STREQ(buffer.data(), "dc");
    EXPECT_EQ(targetCq.budget()->outstanding(), 0u);
}
