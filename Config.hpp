/**
 * @file Config.hpp
 * @author ottojo
 * @date 6/16/21
 * Tunables: which adapter port to open, queue depths and the capability set of the installed driver.
 */

#ifndef SAFEVERBS_CONFIG_HPP
#define SAFEVERBS_CONFIG_HPP

#include <cstdint>
#include <string>
#include <nlohmann/json.hpp>
#include "CapabilitySet.hpp"

/**
 * Queue pair capacities. Defaults: 128 outstanding send / receive requests, 16 scatter gather entries each, 64 bytes
 * of inline data. Not every adapter supports that much, creation fails with a recoverable error if it doesn't.
 */
struct QpCaps {
    std::uint32_t maxSendWr = 128;
    std::uint32_t maxRecvWr = 128;
    std::uint32_t maxSendSge = 16;
    std::uint32_t maxRecvSge = 16;
    std::uint32_t maxInlineData = 64;

    /// DC initiators have no receive queue, and ConnectX-5 tops out at about 11 send SGEs
    static QpCaps forDcInitiator();
};

NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE_WITH_DEFAULT(QpCaps, maxSendWr, maxRecvWr, maxSendSge, maxRecvSge, maxInlineData)

struct ContextConfig {
    /// Device name as listed by ibv_devices, empty selects the first device
    std::string device;
    std::uint8_t port = 1;
    std::uint8_t gidIndex = 0;
};

constexpr int DEFAULT_CQ_DEPTH = 128;

struct Config {
    ContextConfig context;
    int cqDepth = DEFAULT_CQ_DEPTH;
    QpCaps qp;
    CapabilitySet capabilities;
    bool verbose = false;
};

void to_json(nlohmann::json &j, const Config &c);

void from_json(const nlohmann::json &j, Config &c);

/**
 * Reads a JSON configuration file. Missing keys keep their defaults.
 * @throws IBvException (NotFound) if the file can not be opened, nlohmann::json::exception on malformed content
 */
Config loadConfig(const std::string &path);

#endif //SAFEVERBS_CONFIG_HPP
