/**
 * @file EndpointInfo.hpp
 * @author ottojo
 * @date 6/15/21
 * Connection parameters of a queue pair (or DC target) as exchanged with the peer out of band.
 */

#ifndef SAFEVERBS_ENDPOINTINFO_HPP
#define SAFEVERBS_ENDPOINTINFO_HPP

#include <array>
#include <cstdint>
#include <string>
#include <infiniband/verbs.h>
#include <nlohmann/json.hpp>

struct Gid {
    std::array<std::uint8_t, 16> raw{};

    [[nodiscard]] bool isZero() const;

    /// Colon separated, 8 groups of 4 hex digits (IPv6 notation without compression)
    [[nodiscard]] std::string toString() const;

    /// Accepts the output of toString(), throws std::invalid_argument otherwise
    static Gid parse(const std::string &text);

    [[nodiscard]] ibv_gid toIbv() const;

    static Gid fromIbv(const ibv_gid &gid);

    bool operator==(const Gid &other) const = default;
};

/// Path MTU in bytes for the verbs enum, 0 for unknown values
int mtuBytes(enum ibv_mtu mtu);

/// Inverse of mtuBytes(), throws std::invalid_argument for anything but 256, 512, 1024, 2048 and 4096
enum ibv_mtu mtuFromBytes(int bytes);

struct EndpointInfo {
    std::uint16_t localLID = 0;
    std::uint32_t queuePairNumber = 0;
    std::uint32_t packetSequenceNumber = 0;
    Gid gid{};
    std::uint8_t portNum = 0;
    enum ibv_mtu pathMtu = IBV_MTU_1024;

    /**
     * Terminates when the endpoint cannot be connected to: QP number 0 or out of the 24 bit range, sequence number
     * out of range, neither LID nor GID set.
     */
    void validate() const;

    /// GID present, the peer is reached through a global route (always the case for RoCE)
    [[nodiscard]] bool isGlobal() const;

    bool operator==(const EndpointInfo &other) const = default;
};

void to_json(nlohmann::json &j, const EndpointInfo &e);

/// A malformed GID or an unsupported path MTU throws nlohmann::json::other_error
void from_json(const nlohmann::json &j, EndpointInfo &e);

#endif //SAFEVERBS_ENDPOINTINFO_HPP
