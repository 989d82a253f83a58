/**
 * @file RemoteMemory.hpp
 * @author ottojo
 * @date 6/16/21
 * Memory of the peer, as advertised by it
 */

#ifndef SAFEVERBS_REMOTEMEMORY_HPP
#define SAFEVERBS_REMOTEMEMORY_HPP

#include <cstdint>
#include <nlohmann/json.hpp>
#include "Contract.hpp"

struct RemoteMemory {
    std::uint64_t addr = 0;
    std::uint64_t length = 0;
    std::uint32_t rkey = 0;

    /// Sub range, terminates if it is not within this one
    [[nodiscard]] RemoteMemory slice(std::uint64_t offset, std::uint64_t sliceLength) const {
        expects(offset <= length and sliceLength <= length - offset,
                "remote range [{}, {}) outside of remote region of {} bytes", offset, offset + sliceLength, length);
        return {addr + offset, sliceLength, rkey};
    }

    bool operator==(const RemoteMemory &other) const = default;
};

NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE(RemoteMemory, addr, length, rkey)

#endif //SAFEVERBS_REMOTEMEMORY_HPP
