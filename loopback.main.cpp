//
// Created by jonas on 16.06.21.
//

#include <cstring>
#include <string>
#include <fmt/format.h>

#include "IBvException.hpp"
#include "IBvQueuePair.hpp"
#include "IBvRegisteredBuffer.hpp"
#include "libibverbs_format.hpp"
#include "utils.hpp"

constexpr std::size_t MESSAGE_SIZE = 64;
constexpr WrId SEND_ID = 7;
constexpr WrId RECV_ID = 3;

/// One side of the loopback connection, with its own context
struct Peer {
    IBvContext context;
    IBvProtectionDomain pd;
    IBvCompletionQueue cq;
    IBvQueuePair qp;
    IBvRegisteredBuffer<char> buffer;

    explicit Peer(const Config &config) :
            context(config.context, config.capabilities),
            pd(context),
            cq(context, config.cqDepth),
            qp(QueuePairBuilder(cq).caps(config.qp).build(pd)),
            buffer(pd, MESSAGE_SIZE) {}
};

int main(int argc, char *argv[]) {
    try {
        auto config = demoConfig(argc > 1 ? argv[1] : "");

        Peer a(config);
        Peer b(config);
        fmt::print("Device {}, port {}, capabilities: {}\n", a.context.deviceName(), a.context.port(),
                   a.context.capabilities().describe());

        // Both sides know each other's endpoint without a side channel here
        a.qp.connect(b.qp.localInfo());
        b.qp.connect(a.qp.localInfo());

        b.qp.postReceive(RECV_ID, b.buffer.whole());

        std::string message = "Hello from the other queue pair!";
        std::strncpy(a.buffer.data(), message.c_str(), MESSAGE_SIZE);
        a.qp.postSend(SEND_ID, a.buffer.whole());

        auto received = pollUntil(b.cq, 1, std::chrono::seconds(5));
        const auto &wc = received.front();
        wc.expectSuccess();
        fmt::print("Receive completion: id {}, status {}, {} bytes: \"{}\"\n", wc.wrId(), wc.status(),
                   wc.byteLength(), b.buffer.data());

        auto sent = pollUntil(a.cq, 1, std::chrono::seconds(5));
        sent.front().expectSuccess();
        fmt::print("Send completion: id {}\n", sent.front().wrId());

        return wc.wrId() == RECV_ID and wc.byteLength() == MESSAGE_SIZE ? 0 : 1;
    } catch (const IBvException &e) {
        fmt::print(stderr, "{} ({})\n", e.what(), e.kind());
        return 1;
    } catch (const std::exception &e) {
        fmt::print(stderr, "{}\n", e.what());
        return 1;
    }
}
