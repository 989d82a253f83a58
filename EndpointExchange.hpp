//
// Created by jonas on 09.03.21.
//

#ifndef SAFEVERBS_ENDPOINTEXCHANGE_HPP
#define SAFEVERBS_ENDPOINTEXCHANGE_HPP

#include <optional>
#include <string>
#include "ConnectionInfo.hpp"

/// Target of the exchange request
constexpr const char *EXCHANGE_PATH = "/connect";

/// Peer's ConnectionInfo from a request body, nothing if the body is not one (the reason is logged)
std::optional<ConnectionInfo> parseConnectionInfo(const std::string &body);

/**
 * Passive side: waits on the TCP port for a POST of the peer's ConnectionInfo to EXCHANGE_PATH, answers with mine and
 * returns the peer's. Requests to other paths or with a body that is no ConnectionInfo are rejected (404 / 400) and
 * the wait continues, as it does when a peer drops the connection mid request.
 * @throws boost::system::system_error if the port can not be listened on
 */
ConnectionInfo serveConnectionInfo(unsigned short port, const ConnectionInfo &mine);

/**
 * Active side: posts mine to a peer in serveConnectionInfo() and returns its answer.
 * @throws boost::system::system_error on network failure or a rejected request, nlohmann::json::exception on a
 * malformed answer
 */
ConnectionInfo requestConnectionInfo(const std::string &host, const std::string &port, const ConnectionInfo &mine);

#endif //SAFEVERBS_ENDPOINTEXCHANGE_HPP
