/**
 * @file PeerLink.hpp
 * @author ottojo
 * @date 6/21/21
 */

#ifndef SAFEVERBS_PEERLINK_HPP
#define SAFEVERBS_PEERLINK_HPP

#include <chrono>
#include <cstddef>
#include <string>
#include <vector>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <gsl/gsl>
#include <nlohmann/json.hpp>
#include "Cluster.hpp"
#include "EndpointInfo.hpp"
#include "IBvQueuePair.hpp"
#include "RemoteMemory.hpp"

/**
 * Connects to host:port, retrying while nobody listens there yet.
 * @throws boost::system::system_error with the last error once the timeout has passed
 */
boost::asio::ip::tcp::socket dial(boost::asio::io_context &ioc, const std::string &host, unsigned short port,
                                  std::chrono::milliseconds timeout);

/**
 * TCP connection to one other member of a cluster, used to swap endpoints and memory descriptors before RDMA
 * traffic starts. The lower rank dials, the higher rank listens. Messages are JSON, prefixed with their length as a
 * big endian 64 bit integer.
 */
class PeerLink {
    public:
        /// Bound to a single message, anything longer is a protocol violation
        static constexpr std::size_t MAX_MESSAGE_BYTES = 1 << 20;

        /**
         * Terminates if peer is not a different member of the cluster.
         * @throws boost::system::system_error if the peer can not be reached within connectTimeout
         */
        PeerLink(const Cluster &cluster, std::size_t peer, unsigned short port = CONNECT_PORT,
                 std::chrono::milliseconds connectTimeout = std::chrono::seconds(30));

        [[nodiscard]] std::size_t peer() const;

        /**
         * Sends mine and returns what the peer sent. Both sides have to call this at the same time.
         * @throws boost::system::system_error on network failure, nlohmann::json::exception on a malformed answer
         */
        std::vector<EndpointInfo> exchange(const std::vector<EndpointInfo> &mine);

        /**
         * Exchanges the endpoints of queuePairs with the peer and connects them pairwise, in order.
         * @throws IBvException of kind InvalidRequest if the peer offers a different number of queue pairs
         */
        void connectMany(gsl::span<IBvQueuePair> queuePairs);

        /// Advertises memory to the peer, matched by receiveRemote() on the other side
        void sendRemote(const RemoteMemory &memory);

        RemoteMemory receiveRemote();

    private:
        void send(const nlohmann::json &message);

        nlohmann::json receive();

        std::size_t myRank;
        std::size_t peerRank;
        boost::asio::io_context ioc;
        boost::asio::ip::tcp::socket socket;
};

#endif //SAFEVERBS_PEERLINK_HPP
