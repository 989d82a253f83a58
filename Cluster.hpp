/**
 * @file Cluster.hpp
 * @author ottojo
 * @date 6/21/21
 * Static description of a group of hosts that connect to each other, and the TCP rendezvous helpers built on it.
 */

#ifndef SAFEVERBS_CLUSTER_HPP
#define SAFEVERBS_CLUSTER_HPP

#include <chrono>
#include <cstddef>
#include <map>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "IBvQueuePair.hpp"

/// Default TCP port of PeerLink
constexpr unsigned short CONNECT_PORT = 13337;

/// Default TCP port of barrier()
constexpr unsigned short BARRIER_PORT = 13373;

class Cluster {
    public:
        /// Terminates if rank is not an index into hosts
        Cluster(std::vector<std::string> hosts, std::size_t rank);

        /**
         * Takes the rank of the first host that is an address of a local interface.
         * @throws IBvException of kind NotFound if none is
         */
        static Cluster locate(std::vector<std::string> hosts);

        [[nodiscard]] std::size_t rank() const;

        [[nodiscard]] std::size_t size() const;

        /// Terminates if there is no such rank
        [[nodiscard]] const std::string &host(std::size_t rank) const;

        [[nodiscard]] const std::vector<std::string> &hosts() const;

    private:
        std::vector<std::string> peers;
        std::size_t myRank;
};

namespace nlohmann {
    /// {"hosts": [...], "rank": n}. Without "rank", the local host is looked up with Cluster::locate().
    template<>
    struct adl_serializer<Cluster> {
        static Cluster from_json(const json &j);

        static void to_json(json &j, const Cluster &c);
    };
}

/**
 * @throws IBvException of kind NotFound if the file can not be opened, nlohmann::json::exception if it is malformed
 */
Cluster loadCluster(const std::string &path);

/**
 * Returns once every member of the cluster called it with the same port. Rank 0 collects a connection from every
 * other member, then releases all of them.
 * @throws boost::system::system_error on network failure, or if rank 0 does not show up within timeout
 */
void barrier(const Cluster &cluster, unsigned short port = BARRIER_PORT,
             std::chrono::milliseconds timeout = std::chrono::minutes(10));

/**
 * Connects links queue pairs built by builder to every other member of the cluster. Pairs are formed in rounds
 * (partner = round xor rank), each round ends with a barrier, so all members have to call this together.
 * @return the connected queue pairs by peer rank, all in RTS
 * @throws boost::system::system_error on network failure, IBvException if a queue pair can not be created or
 * connected
 */
std::map<std::size_t, std::vector<IBvQueuePair>> connectAll(const Cluster &cluster, const IBvProtectionDomain &pd,
                                                            const QueuePairBuilder &builder, std::size_t links,
                                                            unsigned short connectPort = CONNECT_PORT,
                                                            unsigned short barrierPort = BARRIER_PORT);

#endif //SAFEVERBS_CLUSTER_HPP
