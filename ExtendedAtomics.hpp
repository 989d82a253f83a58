/**
 * @file ExtendedAtomics.hpp
 * @author ottojo
 * @date 6/17/21
 * Encoding of masked compare-and-swap and fetch-and-add work requests for mlx5 adapters. libibverbs has no verbs for
 * these, they are posted as raw WQEs through the mlx5 direct verbs.
 */

#ifndef SAFEVERBS_EXTENDEDATOMICS_HPP
#define SAFEVERBS_EXTENDEDATOMICS_HPP

#include <array>
#include <cstddef>
#include <cstdint>
#include <infiniband/verbs.h>
#include <gsl/gsl>
#include "CapabilitySet.hpp"
#include "RemoteMemory.hpp"

/// Control, remote address, four 32 byte operands and one data segment
constexpr std::size_t MAX_EXT_ATOMIC_WQE_SIZE = 16 + 16 + 4 * 32 + 16;

struct RawWqe {
    alignas(64) std::array<std::byte, MAX_EXT_ATOMIC_WQE_SIZE> bytes{};
    std::size_t size = 0;

    [[nodiscard]] gsl::span<const std::byte> used() const {
        return {bytes.data(), size};
    }
};

/// Operand of an 8 byte operation in the big endian layout the adapter expects
std::array<std::byte, 8> toOperand(std::uint64_t value);

/**
 * Masked compare-and-swap: bits selected by compareMask are compared with compare, on match the bits selected by
 * swapMask are replaced with swap. The original remote value is written to result.
 * All operands are big endian and exactly byteCount(width) bytes long, target has to be aligned to the width.
 */
RawWqe buildMaskedCompareSwap(std::uint32_t qpNum, bool signaled, const RemoteMemory &target,
                              const struct ibv_sge &result, AtomicWidth width,
                              gsl::span<const std::byte> compare, gsl::span<const std::byte> swap,
                              gsl::span<const std::byte> compareMask, gsl::span<const std::byte> swapMask);

/**
 * Masked fetch-and-add: adds add to the remote value, carries do not propagate across bits set in fieldBoundary.
 * Writes the original remote value to result.
 */
RawWqe buildMaskedFetchAdd(std::uint32_t qpNum, bool signaled, const RemoteMemory &target,
                           const struct ibv_sge &result, AtomicWidth width,
                           gsl::span<const std::byte> add, gsl::span<const std::byte> fieldBoundary);

#endif //SAFEVERBS_EXTENDEDATOMICS_HPP
