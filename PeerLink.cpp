/**
 * @file PeerLink.cpp
 * @author ottojo
 * @date 6/21/21
 */

#include "PeerLink.hpp"
#include "Contract.hpp"
#include "IBvException.hpp"
#include "Log.hpp"

#include <array>
#include <cstdint>
#include <string>
#include <thread>
#include <endian.h>
#include <boost/asio/connect.hpp>
#include <boost/asio/read.hpp>
#include <boost/asio/write.hpp>
#include <fmt/format.h>

namespace net = boost::asio;
using tcp = net::ip::tcp;

namespace {
    constexpr auto RETRY_INTERVAL = std::chrono::milliseconds(100);
}

tcp::socket dial(net::io_context &ioc, const std::string &host, unsigned short port,
                 std::chrono::milliseconds timeout) {
    tcp::resolver resolver(ioc);
    tcp::socket socket(ioc);
    auto deadline = std::chrono::steady_clock::now() + timeout;
    while (true) {
        boost::system::error_code ec;
        auto endpoints = resolver.resolve(host, std::to_string(port), ec);
        if (not ec) {
            net::connect(socket, endpoints, ec);
        }
        if (not ec) {
            return socket;
        }
        if (std::chrono::steady_clock::now() >= deadline) {
            throw boost::system::system_error(ec, fmt::format("Connecting to {}:{}", host, port));
        }
        std::this_thread::sleep_for(RETRY_INTERVAL);
    }
}

PeerLink::PeerLink(const Cluster &cluster, std::size_t peer, unsigned short port,
                   std::chrono::milliseconds connectTimeout) :
        myRank(cluster.rank()),
        peerRank(peer),
        socket(ioc) {
    expects(peer < cluster.size() and peer != myRank, "rank {} is no peer of rank {} in a cluster of {}", peer,
            myRank, cluster.size());
    if (myRank < peerRank) {
        socket = dial(ioc, cluster.host(peer), port, connectTimeout);
    } else {
        tcp::acceptor acceptor(ioc, tcp::endpoint(tcp::v4(), port));
        acceptor.accept(socket);
    }
    logDebug("rank {} linked to rank {} ({})", myRank, peerRank, cluster.host(peer));
}

std::size_t PeerLink::peer() const {
    return peerRank;
}

std::vector<EndpointInfo> PeerLink::exchange(const std::vector<EndpointInfo> &mine) {
    // The dialing side listens first, so both sides never block in a write at the same time
    if (myRank < peerRank) {
        auto theirs = receive().get<std::vector<EndpointInfo>>();
        send(mine);
        return theirs;
    }
    send(mine);
    return receive().get<std::vector<EndpointInfo>>();
}

void PeerLink::connectMany(gsl::span<IBvQueuePair> queuePairs) {
    std::vector<EndpointInfo> mine;
    mine.reserve(queuePairs.size());
    for (const auto &qp: queuePairs) {
        mine.push_back(qp.localInfo());
    }
    auto theirs = exchange(mine);
    if (theirs.size() != mine.size()) {
        throw IBvException(ErrorKind::InvalidRequest, 0,
                           fmt::format("Rank {} offered {} queue pairs, rank {} has {}", peerRank, theirs.size(),
                                       myRank, mine.size()));
    }
    for (std::size_t i = 0; i < theirs.size(); i++) {
        queuePairs[i].connect(theirs[i]);
    }
}

void PeerLink::sendRemote(const RemoteMemory &memory) {
    send(memory);
}

RemoteMemory PeerLink::receiveRemote() {
    return receive().get<RemoteMemory>();
}

void PeerLink::send(const nlohmann::json &message) {
    auto body = message.dump();
    std::uint64_t length = htobe64(body.size());
    std::array<net::const_buffer, 2> buffers{net::buffer(&length, sizeof(length)), net::buffer(body)};
    net::write(socket, buffers);
}

nlohmann::json PeerLink::receive() {
    std::uint64_t length = 0;
    net::read(socket, net::buffer(&length, sizeof(length)));
    length = be64toh(length);
    if (length > MAX_MESSAGE_BYTES) {
        throw IBvException(ErrorKind::InvalidRequest, 0,
                           fmt::format("Message of {} bytes from rank {} exceeds the limit of {}", length, peerRank,
                                       MAX_MESSAGE_BYTES));
    }
    std::string body(length, '\0');
    net::read(socket, net::buffer(body));
    return nlohmann::json::parse(body);
}
