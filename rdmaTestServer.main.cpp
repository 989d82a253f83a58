//
// Created by jonas on 08.04.21.
//

#include <string>
#include <fmt/format.h>

#include "IBvException.hpp"
#include "IBvQueuePair.hpp"
#include "IBvRegisteredBuffer.hpp"
#include "EndpointExchange.hpp"
#include "libibverbs_format.hpp"
#include "utils.hpp"

constexpr std::size_t BUFFER_SIZE = 4096;

int main(int argc, char *argv[]) {
    if (argc < 2) {
        fmt::print("Usage: {} <port> [config.json]\n", argv[0]);
        return 1;
    }

    try {
        auto config = demoConfig(argc > 2 ? argv[2] : "");
        auto port = static_cast<unsigned short>(std::stoi(argv[1]));

        IBvContext context(config.context, config.capabilities);
        IBvProtectionDomain pd(context);
        IBvCompletionQueue cq(context, config.cqDepth);
        auto qp = QueuePairBuilder(cq).caps(config.qp).build(pd);

        IBvRegisteredBuffer<char> recvBuffer(pd, BUFFER_SIZE, Permission::LocalWrite);
        IBvRegisteredBuffer<char> writeTarget(pd, BUFFER_SIZE, Permission::LocalWrite | Permission::RemoteWrite);

        // Receives may be posted from INIT on, so they are in place before the client can send
        qp.initialize();
        qp.postReceive(1, recvBuffer.whole());

        ConnectionInfo myInfo{qp.localInfo(), {writeTarget.whole().remote()}};
        auto theirInfo = serveConnectionInfo(port, myInfo);
        fmt::print("Connecting to QP {:#x}, LID {:#x}\n", theirInfo.endpoint.queuePairNumber,
                   theirInfo.endpoint.localLID);
        qp.readyToReceive(theirInfo.endpoint);
        qp.readyToSend();

        auto completions = pollUntil(cq, 1, std::chrono::seconds(30));
        const auto &wc = completions.front();
        wc.expectSuccess();

        // The client writes before it sends, on an RC connection the write is visible once the send arrived
        fmt::print("Received {} bytes: \"{}\"\n", wc.byteLength(), std::string(recvBuffer.data(), wc.byteLength()));
        fmt::print("Written by client: \"{}\"\n", writeTarget.data());
        return 0;
    } catch (const IBvException &e) {
        fmt::print(stderr, "{} ({})\n", e.what(), e.kind());
        return 1;
    } catch (const std::exception &e) {
        fmt::print(stderr, "{}\n", e.what());
        return 1;
    }
}
