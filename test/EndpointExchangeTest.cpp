//
// Created by jonas on 21.06.21.
//

#include <chrono>
#include <future>
#include <string>
#include <thread>
#include <boost/asio/ip/tcp.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <gtest/gtest.h>
#include "EndpointExchange.hpp"

namespace beast = boost::beast;
namespace http = beast::http;
namespace net = boost::asio;
using tcp = net::ip::tcp;

namespace {
    constexpr unsigned short EXCHANGE_TEST_PORT = 23451;

    ConnectionInfo infoFor(std::uint32_t qpn) {
        ConnectionInfo info;
        info.endpoint.localLID = 1;
        info.endpoint.queuePairNumber = qpn;
        info.endpoint.portNum = 1;
        info.endpoint.pathMtu = IBV_MTU_1024;
        info.regions.push_back({.addr = 0x1000, .length = 64, .rkey = qpn + 1});
        return info;
    }

    /// Connects to the local exchange server, retrying until it listens
    tcp::socket connectLocal(net::io_context &ioc) {
        tcp::socket socket{ioc};
        auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(5);
        while (true) {
            beast::error_code ec;
            socket.connect({net::ip::make_address("127.0.0.1"), EXCHANGE_TEST_PORT}, ec);
            if (not ec or std::chrono::steady_clock::now() > deadline) {
                return socket;
            }
            socket.close();
            std::this_thread::sleep_for(std::chrono::milliseconds(20));
        }
    }

    http::status post(const std::string &target, const std::string &body) {
        net::io_context ioc;
        auto socket = connectLocal(ioc);
        http::request<http::string_body> req{http::verb::post, target, 11};
        req.set(http::field::host, "localhost");
        req.body() = body;
        req.prepare_payload();
        http::write(socket, req);

        beast::flat_buffer buffer;
        http::response<http::string_body> res;
        http::read(socket, buffer, res);
        return res.result();
    }

    std::string endpointBody(const std::string &field, const nlohmann::json &value) {
        nlohmann::json body = infoFor(7);
        body["endpoint"][field] = value;
        return body.dump();
    }
}

TEST(EndpointExchange, ParsesOnlyConnectionInfo) {
    nlohmann::json good = infoFor(7);
    auto parsed = parseConnectionInfo(good.dump());
    ASSERT_TRUE(parsed.has_value());
    EXPECT_EQ(parsed->endpoint, infoFor(7).endpoint);
    EXPECT_EQ(parsed->regions, infoFor(7).regions);

    EXPECT_FALSE(parseConnectionInfo(endpointBody("gid", "zz")).has_value());
    EXPECT_FALSE(parseConnectionInfo(endpointBody("pathMtu", 1500)).has_value());
    EXPECT_FALSE(parseConnectionInfo(endpointBody("queuePairNumber", "seven")).has_value());
    EXPECT_FALSE(parseConnectionInfo("{\"endpoint\": ").has_value());
    EXPECT_FALSE(parseConnectionInfo("[]").has_value());
}

TEST(EndpointExchange, ServerSurvivesBadRequests) {
    auto served = std::async(std::launch::async, [] {
        return serveConnectionInfo(EXCHANGE_TEST_PORT, infoFor(0x11));
    });

    {
        // Gone before sending anything
        net::io_context ioc;
        auto socket = connectLocal(ioc);
        socket.close();
    }
    EXPECT_EQ(post(EXCHANGE_PATH, endpointBody("gid", "zz")), http::status::bad_request);
    EXPECT_EQ(post(EXCHANGE_PATH, endpointBody("pathMtu", 1500)), http::status::bad_request);
    EXPECT_EQ(post("/elsewhere", nlohmann::json(infoFor(0x22)).dump()), http::status::not_found);

    auto answer = requestConnectionInfo("127.0.0.1", std::to_string(EXCHANGE_TEST_PORT), infoFor(0x22));
    EXPECT_EQ(answer.endpoint.queuePairNumber, 0x11u);

    ASSERT_EQ(served.wait_for(std::chrono::seconds(5)), std::future_status::ready);
    auto theirs = served.get();
    EXPECT_EQ(theirs.endpoint.queuePairNumber, 0x22u);
    EXPECT_EQ(theirs.regions, infoFor(0x22).regions);
}
