/**
 * @file Cluster.cpp
 * @author ottojo
 * @date 6/21/21
 */

#include "Cluster.hpp"
#include "Contract.hpp"
#include "IBvException.hpp"
#include "Log.hpp"
#include "PeerLink.hpp"

#include <algorithm>
#include <cstdint>
#include <cstring>
#include <fstream>
#include <memory>
#include <utility>
#include <ifaddrs.h>
#include <netinet/in.h>
#include <boost/asio/read.hpp>
#include <boost/asio/write.hpp>
#include <fmt/format.h>

namespace net = boost::asio;
using tcp = net::ip::tcp;

namespace {
    std::vector<net::ip::address> localAddresses() {
        struct ifaddrs *list = nullptr;
        if (getifaddrs(&list) != 0) {
            throw IBvException(errno, "Listing network interfaces");
        }
        std::unique_ptr<struct ifaddrs, decltype(&freeifaddrs)> guard(list, freeifaddrs);

        std::vector<net::ip::address> addresses;
        for (auto *entry = list; entry != nullptr; entry = entry->ifa_next) {
            if (entry->ifa_addr == nullptr) {
                continue;
            }
            if (entry->ifa_addr->sa_family == AF_INET) {
                const auto *in = reinterpret_cast<const sockaddr_in *>(entry->ifa_addr);
                addresses.emplace_back(net::ip::address_v4(ntohl(in->sin_addr.s_addr)));
            } else if (entry->ifa_addr->sa_family == AF_INET6) {
                const auto *in6 = reinterpret_cast<const sockaddr_in6 *>(entry->ifa_addr);
                net::ip::address_v6::bytes_type bytes;
                std::memcpy(bytes.data(), in6->sin6_addr.s6_addr, bytes.size());
                addresses.emplace_back(net::ip::address_v6(bytes, in6->sin6_scope_id));
            }
        }
        return addresses;
    }
}

Cluster::Cluster(std::vector<std::string> hosts, std::size_t rank) : peers(std::move(hosts)), myRank(rank) {
    expects(myRank < peers.size(), "rank {} out of range for a cluster of {}", myRank, peers.size());
}

Cluster Cluster::locate(std::vector<std::string> hosts) {
    auto mine = localAddresses();
    for (std::size_t rank = 0; rank < hosts.size(); rank++) {
        boost::system::error_code ec;
        auto address = net::ip::make_address(hosts[rank], ec);
        if (ec) {
            continue;
        }
        if (std::find(mine.begin(), mine.end(), address) != mine.end()) {
            logDebug("local host is rank {} ({})", rank, hosts[rank]);
            return Cluster(std::move(hosts), rank);
        }
    }
    throw IBvException(ErrorKind::NotFound, 0,
                       fmt::format("None of the {} cluster hosts is a local address", hosts.size()));
}

std::size_t Cluster::rank() const {
    return myRank;
}

std::size_t Cluster::size() const {
    return peers.size();
}

const std::string &Cluster::host(std::size_t rank) const {
    expects(rank < peers.size(), "rank {} out of range for a cluster of {}", rank, peers.size());
    return peers[rank];
}

const std::vector<std::string> &Cluster::hosts() const {
    return peers;
}

Cluster nlohmann::adl_serializer<Cluster>::from_json(const json &j) {
    auto hosts = j.at("hosts").get<std::vector<std::string>>();
    if (not j.contains("rank")) {
        return Cluster::locate(std::move(hosts));
    }
    auto rank = j.at("rank").get<std::size_t>();
    if (rank >= hosts.size()) {
        throw json::other_error::create(503, fmt::format("rank {} out of range for {} hosts", rank, hosts.size()),
                                        &j);
    }
    return Cluster(std::move(hosts), rank);
}

void nlohmann::adl_serializer<Cluster>::to_json(json &j, const Cluster &c) {
    j = json{{"hosts", c.hosts()},
             {"rank",  c.rank()}};
}

Cluster loadCluster(const std::string &path) {
    std::ifstream file(path);
    if (not file) {
        throw IBvException(ErrorKind::NotFound, errno, "Opening cluster file " + path);
    }
    return nlohmann::json::parse(file).get<Cluster>();
}

void barrier(const Cluster &cluster, unsigned short port, std::chrono::milliseconds timeout) {
    if (cluster.size() < 2) {
        return;
    }
    net::io_context ioc;
    std::uint8_t token = 0;
    if (cluster.rank() == 0) {
        tcp::acceptor acceptor(ioc, tcp::endpoint(tcp::v4(), port));
        std::vector<tcp::socket> waiting;
        while (waiting.size() + 1 < cluster.size()) {
            waiting.push_back(acceptor.accept());
        }
        // Nobody released may reach this listener when dialing into the next barrier
        acceptor.close();
        for (auto &member: waiting) {
            net::write(member, net::buffer(&token, sizeof(token)));
        }
    } else {
        auto socket = dial(ioc, cluster.host(0), port, timeout);
        net::read(socket, net::buffer(&token, sizeof(token)));
    }
    logDebug("rank {} passed barrier on port {}", cluster.rank(), port);
}

std::map<std::size_t, std::vector<IBvQueuePair>> connectAll(const Cluster &cluster, const IBvProtectionDomain &pd,
                                                            const QueuePairBuilder &builder, std::size_t links,
                                                            unsigned short connectPort, unsigned short barrierPort) {
    std::size_t rounds = 1;
    while (rounds < cluster.size()) {
        rounds *= 2;
    }

    std::map<std::size_t, std::vector<IBvQueuePair>> connected;
    for (std::size_t round = 1; round < rounds; round++) {
        auto peer = round ^ cluster.rank();
        if (peer < cluster.size()) {
            std::vector<IBvQueuePair> queuePairs;
            queuePairs.reserve(links);
            for (std::size_t i = 0; i < links; i++) {
                queuePairs.push_back(builder.build(pd));
            }
            PeerLink link(cluster, peer, connectPort);
            link.connectMany(queuePairs);
            logDebug("rank {} connected {} queue pairs to rank {}", cluster.rank(), links, peer);
            connected.emplace(peer, std::move(queuePairs));
        }
        barrier(cluster, barrierPort);
    }
    return connected;
}
