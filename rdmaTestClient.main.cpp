//
// Created by jonas on 08.04.21.
//

#include <cstring>
#include <string>
#include <fmt/format.h>
#include <fmt/chrono.h>

#include "IBvException.hpp"
#include "IBvQueuePair.hpp"
#include "IBvRegisteredBuffer.hpp"
#include "EndpointExchange.hpp"
#include "libibverbs_format.hpp"
#include "utils.hpp"

constexpr std::size_t BUFFER_SIZE = 4096;

int main(int argc, char *argv[]) {
    if (argc < 3) {
        fmt::print("Usage: {} <server-address> <server-port> [config.json]\n", argv[0]);
        return 1;
    }

    try {
        auto config = demoConfig(argc > 3 ? argv[3] : "");

        IBvContext context(config.context, config.capabilities);
        IBvProtectionDomain pd(context);
        IBvCompletionQueue cq(context, config.cqDepth);
        auto qp = QueuePairBuilder(cq).caps(config.qp).build(pd);

        IBvRegisteredBuffer<char> sendBuffer(pd, BUFFER_SIZE, Permission::LocalWrite);
        IBvRegisteredBuffer<char> writeBuffer(pd, BUFFER_SIZE, Permission::LocalWrite);

        auto theirInfo = requestConnectionInfo(argv[1], argv[2], ConnectionInfo{qp.localInfo(), {}});
        if (theirInfo.regions.empty()) {
            fmt::print(stderr, "Server advertised no memory\n");
            return 1;
        }
        qp.connect(theirInfo.endpoint);

        std::string written = "Written with RDMA write";
        std::strncpy(writeBuffer.data(), written.c_str(), BUFFER_SIZE);
        std::string message = "Hello via send!";
        std::strncpy(sendBuffer.data(), message.c_str(), BUFFER_SIZE);

        auto start = std::chrono::steady_clock::now();
        qp.postWrite(1, writeBuffer.slice(0, written.size() + 1), theirInfo.regions.front());
        qp.postSend(2, sendBuffer.slice(0, message.size()));

        for (const auto &wc: pollUntil(cq, 2, std::chrono::seconds(30))) {
            wc.expectSuccess();
            fmt::print("Work request {} completed\n", wc.wrId());
        }
        std::chrono::duration<double, std::milli> duration = std::chrono::steady_clock::now() - start;
        fmt::print("Write and send took {}\n", duration);
        return 0;
    } catch (const IBvException &e) {
        fmt::print(stderr, "{} ({})\n", e.what(), e.kind());
        return 1;
    } catch (const std::exception &e) {
        fmt::print(stderr, "{}\n", e.what());
        return 1;
    }
}
