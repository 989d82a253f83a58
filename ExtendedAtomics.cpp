/**
 * @file ExtendedAtomics.cpp
 * @author ottojo
 * @date 6/17/21
 */

#include "ExtendedAtomics.hpp"
#include "Contract.hpp"

#include <algorithm>
#include <cstring>
#include <endian.h>
#include <initializer_list>
#include <infiniband/mlx5dv.h>

namespace {
    /// opmod of masked atomics: extended flag plus log2 of the operand size in bytes, minus 2
    std::uint8_t maskedOpmod(AtomicWidth width) {
        switch (width) {
            case AtomicWidth::Bytes8:
                return 0x08 | 1;
            case AtomicWidth::Bytes16:
                return 0x08 | 2;
            case AtomicWidth::Bytes32:
                return 0x08 | 3;
        }
        panic("invalid atomic width {}", static_cast<int>(width));
    }

    void checkOperands(const RemoteMemory &target, const struct ibv_sge &result, AtomicWidth width,
                       std::initializer_list<gsl::span<const std::byte>> operands) {
        auto bytes = byteCount(width);
        expects(target.addr % bytes == 0, "atomic target {:#x} not aligned to {} bytes", target.addr, bytes);
        expects(target.length >= bytes, "atomic target of {} bytes smaller than operand width {}", target.length,
                bytes);
        expects(result.length >= bytes, "atomic result buffer of {} bytes smaller than operand width {}",
                result.length, bytes);
        for (const auto &operand: operands) {
            expects(operand.size() == bytes, "atomic operand of {} bytes, expected {}", operand.size(), bytes);
        }
    }

    /**
     * Writes control and remote address segment, the operands and the data segment for the result.
     */
    RawWqe build(std::uint8_t opcode, std::uint32_t qpNum, bool signaled, const RemoteMemory &target,
                 const struct ibv_sge &result, AtomicWidth width,
                 std::initializer_list<gsl::span<const std::byte>> operands) {
        RawWqe wqe;
        auto *position = wqe.bytes.data();

        auto operandBytes = operands.size() * byteCount(width);
        wqe.size = sizeof(mlx5_wqe_ctrl_seg) + sizeof(mlx5_wqe_raddr_seg) + operandBytes + sizeof(mlx5_wqe_data_seg);
        Ensures(wqe.size <= wqe.bytes.size() and wqe.size % 16 == 0);

        auto *ctrl = reinterpret_cast<mlx5_wqe_ctrl_seg *>(position);
        // The driver fills in the producer index
        mlx5dv_set_ctrl_seg(ctrl, 0, opcode, maskedOpmod(width), qpNum,
                            signaled ? MLX5_WQE_CTRL_CQ_UPDATE : 0, static_cast<std::uint8_t>(wqe.size / 16), 0, 0);
        position += sizeof(mlx5_wqe_ctrl_seg);

        auto *raddr = reinterpret_cast<mlx5_wqe_raddr_seg *>(position);
        raddr->raddr = htobe64(target.addr);
        raddr->rkey = htobe32(target.rkey);
        raddr->reserved = 0;
        position += sizeof(mlx5_wqe_raddr_seg);

        for (const auto &operand: operands) {
            position = std::copy(operand.begin(), operand.end(), position);
        }

        mlx5dv_set_data_seg(reinterpret_cast<mlx5_wqe_data_seg *>(position), static_cast<std::uint32_t>(byteCount(width)),
                            result.lkey, result.addr);
        return wqe;
    }
}

std::array<std::byte, 8> toOperand(std::uint64_t value) {
    std::array<std::byte, 8> operand{};
    auto bigEndian = htobe64(value);
    std::memcpy(operand.data(), &bigEndian, operand.size());
    return operand;
}

RawWqe buildMaskedCompareSwap(std::uint32_t qpNum, bool signaled, const RemoteMemory &target,
                              const struct ibv_sge &result, AtomicWidth width,
                              gsl::span<const std::byte> compare, gsl::span<const std::byte> swap,
                              gsl::span<const std::byte> compareMask, gsl::span<const std::byte> swapMask) {
    checkOperands(target, result, width, {compare, swap, compareMask, swapMask});
    return build(MLX5_OPCODE_ATOMIC_MASKED_CS, qpNum, signaled, target, result, width,
                 {swap, compare, swapMask, compareMask});
}

RawWqe buildMaskedFetchAdd(std::uint32_t qpNum, bool signaled, const RemoteMemory &target,
                           const struct ibv_sge &result, AtomicWidth width,
                           gsl::span<const std::byte> add, gsl::span<const std::byte> fieldBoundary) {
    checkOperands(target, result, width, {add, fieldBoundary});
    return build(MLX5_OPCODE_ATOMIC_MASKED_FA, qpNum, signaled, target, result, width, {add, fieldBoundary});
}
