/**
 * @file EndpointInfo.cpp
 * @author ottojo
 * @date 6/15/21
 */

#include "EndpointInfo.hpp"
#include "Contract.hpp"

#include <cstring>
#include <stdexcept>
#include <fmt/format.h>

namespace {
    constexpr std::uint32_t MAX_24_BIT = 0xFFFFFF;

    int hexValue(char c) {
        if (c >= '0' and c <= '9') {
            return c - '0';
        }
        if (c >= 'a' and c <= 'f') {
            return c - 'a' + 10;
        }
        if (c >= 'A' and c <= 'F') {
            return c - 'A' + 10;
        }
        return -1;
    }
}

bool Gid::isZero() const {
    for (auto byte: raw) {
        if (byte != 0) {
            return false;
        }
    }
    return true;
}

std::string Gid::toString() const {
    std::string text;
    for (std::size_t i = 0; i < raw.size(); i += 2) {
        if (i != 0) {
            text += ':';
        }
        text += fmt::format("{:02x}{:02x}", raw[i], raw[i + 1]);
    }
    return text;
}

Gid Gid::parse(const std::string &text) {
    // 8 groups of 4 digits, 7 separators
    if (text.size() != 39) {
        throw std::invalid_argument{fmt::format("malformed GID \"{}\"", text)};
    }
    Gid gid;
    std::size_t byte = 0;
    for (std::size_t i = 0; i < text.size(); i += 5) {
        if (i + 4 < text.size() and text[i + 4] != ':') {
            throw std::invalid_argument{fmt::format("malformed GID \"{}\"", text)};
        }
        for (std::size_t j = 0; j < 4; j += 2) {
            int high = hexValue(text[i + j]);
            int low = hexValue(text[i + j + 1]);
            if (high < 0 or low < 0) {
                throw std::invalid_argument{fmt::format("malformed GID \"{}\"", text)};
            }
            gid.raw[byte++] = static_cast<std::uint8_t>(high << 4 | low);
        }
    }
    return gid;
}

ibv_gid Gid::toIbv() const {
    ibv_gid gid{};
    std::memcpy(gid.raw, raw.data(), raw.size());
    return gid;
}

Gid Gid::fromIbv(const ibv_gid &gid) {
    Gid g;
    std::memcpy(g.raw.data(), gid.raw, g.raw.size());
    return g;
}

int mtuBytes(enum ibv_mtu mtu) {
    switch (mtu) {
        case IBV_MTU_256:
            return 256;
        case IBV_MTU_512:
            return 512;
        case IBV_MTU_1024:
            return 1024;
        case IBV_MTU_2048:
            return 2048;
        case IBV_MTU_4096:
            return 4096;
    }
    return 0;
}

enum ibv_mtu mtuFromBytes(int bytes) {
    switch (bytes) {
        case 256:
            return IBV_MTU_256;
        case 512:
            return IBV_MTU_512;
        case 1024:
            return IBV_MTU_1024;
        case 2048:
            return IBV_MTU_2048;
        case 4096:
            return IBV_MTU_4096;
        default:
            throw std::invalid_argument{fmt::format("invalid path MTU {}", bytes)};
    }
}

void EndpointInfo::validate() const {
    expects(queuePairNumber != 0, "endpoint has queue pair number 0");
    expects(queuePairNumber <= MAX_24_BIT, "queue pair number {:#x} exceeds 24 bits", queuePairNumber);
    expects(packetSequenceNumber <= MAX_24_BIT, "packet sequence number {:#x} exceeds 24 bits",
            packetSequenceNumber);
    expects(mtuBytes(pathMtu) != 0, "endpoint has invalid path MTU {}", static_cast<int>(pathMtu));
    expects(localLID != 0 or not gid.isZero(), "endpoint has neither a LID nor a GID");
}

bool EndpointInfo::isGlobal() const {
    return not gid.isZero();
}

void to_json(nlohmann::json &j, const EndpointInfo &e) {
    j = nlohmann::json{{"localLID",             e.localLID},
                       {"queuePairNumber",      e.queuePairNumber},
                       {"packetSequenceNumber", e.packetSequenceNumber},
                       {"gid",                  e.gid.toString()},
                       {"portNum",              e.portNum},
                       {"pathMtu",              mtuBytes(e.pathMtu)}};
}

void from_json(const nlohmann::json &j, EndpointInfo &e) {
    j.at("localLID").get_to(e.localLID);
    j.at("queuePairNumber").get_to(e.queuePairNumber);
    j.at("packetSequenceNumber").get_to(e.packetSequenceNumber);
    j.at("portNum").get_to(e.portNum);
    // Malformed fields are reported like any other malformed JSON
    try {
        e.gid = Gid::parse(j.at("gid").get<std::string>());
        e.pathMtu = mtuFromBytes(j.at("pathMtu").get<int>());
    } catch (const std::invalid_argument &error) {
        throw nlohmann::json::other_error::create(502, error.what(), &j);
    }
}
