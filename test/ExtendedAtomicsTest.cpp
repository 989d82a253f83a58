//
// Created by jonas on 17.06.21.
//

#include <array>
#include <cstring>
#include <endian.h>
#include <vector>
#include <gtest/gtest.h>
#include <infiniband/mlx5dv.h>
#include "ExtendedAtomics.hpp"

namespace {
    const RemoteMemory target{.addr = 0x10000, .length = 64, .rkey = 0x1234};

    ibv_sge resultBuffer(std::uint32_t length) {
        return ibv_sge{.addr = 0x20000, .length = length, .lkey = 0x5678};
    }

    std::vector<std::byte> filled(std::size_t size, std::uint8_t value) {
        return std::vector<std::byte>(size, std::byte{value});
    }

    template<typename Segment>
    Segment segmentAt(const RawWqe &wqe, std::size_t offset) {
        Segment segment{};
        std::memcpy(&segment, wqe.bytes.data() + offset, sizeof(segment));
        return segment;
    }
}

TEST(ExtendedAtomics, OperandIsBigEndian) {
    auto operand = toOperand(0x0102030405060708);
    EXPECT_EQ(operand[0], std::byte{0x01});
    EXPECT_EQ(operand[7], std::byte{0x08});
}

TEST(ExtendedAtomics, CompareSwapLayout) {
    auto compare = filled(16, 0xc0);
    auto swap = filled(16, 0x5a);
    auto compareMask = filled(16, 0xcc);
    auto swapMask = filled(16, 0x55);
    auto wqe = buildMaskedCompareSwap(0xabcd, true, target, resultBuffer(16), AtomicWidth::Bytes16,
                                      compare, swap, compareMask, swapMask);

    ASSERT_EQ(wqe.size, 16u + 16u + 4 * 16u + 16u);
    EXPECT_EQ(wqe.used().size(), wqe.size);

    auto ctrl = segmentAt<mlx5_wqe_ctrl_seg>(wqe, 0);
    auto opmodOpcode = be32toh(ctrl.opmod_idx_opcode);
    EXPECT_EQ(opmodOpcode & 0xff, static_cast<std::uint32_t>(MLX5_OPCODE_ATOMIC_MASKED_CS));
    EXPECT_EQ(opmodOpcode >> 24, 0x08u | 2u);
    auto qpnDs = be32toh(ctrl.qpn_ds);
    EXPECT_EQ(qpnDs >> 8, 0xabcdu);
    EXPECT_EQ(qpnDs & 0xff, wqe.size / 16);
    EXPECT_EQ(ctrl.fm_ce_se & MLX5_WQE_CTRL_CQ_UPDATE, MLX5_WQE_CTRL_CQ_UPDATE);

    auto raddr = segmentAt<mlx5_wqe_raddr_seg>(wqe, 16);
    EXPECT_EQ(be64toh(raddr.raddr), target.addr);
    EXPECT_EQ(be32toh(raddr.rkey), target.rkey);

    // swap, compare, swap mask, compare mask
    const auto *operands = wqe.bytes.data() + 32;
    EXPECT_EQ(operands[0], std::byte{0x5a});
    EXPECT_EQ(operands[16], std::byte{0xc0});
    EXPECT_EQ(operands[32], std::byte{0x55});
    EXPECT_EQ(operands[48], std::byte{0xcc});

    auto data = segmentAt<mlx5_wqe_data_seg>(wqe, 32 + 64);
    EXPECT_EQ(be32toh(data.byte_count), 16u);
    EXPECT_EQ(be32toh(data.lkey), 0x5678u);
    EXPECT_EQ(be64toh(data.addr), 0x20000u);
}

TEST(ExtendedAtomics, FetchAddLayout) {
    auto add = toOperand(1);
    auto boundary = toOperand(0x8000000080000000);
    auto wqe = buildMaskedFetchAdd(7, false, target, resultBuffer(8), AtomicWidth::Bytes8, add, boundary);

    ASSERT_EQ(wqe.size, 16u + 16u + 2 * 8u + 16u);
    auto ctrl = segmentAt<mlx5_wqe_ctrl_seg>(wqe, 0);
    auto opmodOpcode = be32toh(ctrl.opmod_idx_opcode);
    EXPECT_EQ(opmodOpcode & 0xff, static_cast<std::uint32_t>(MLX5_OPCODE_ATOMIC_MASKED_FA));
    EXPECT_EQ(opmodOpcode >> 24, 0x08u | 1u);
    EXPECT_EQ(ctrl.fm_ce_se & MLX5_WQE_CTRL_CQ_UPDATE, 0);

    const auto *operands = wqe.bytes.data() + 32;
    EXPECT_EQ(std::memcmp(operands, add.data(), 8), 0);
    EXPECT_EQ(std::memcmp(operands + 8, boundary.data(), 8), 0);
}

TEST(ExtendedAtomics, LargestWqeFits) {
    auto operand = filled(32, 0xff);
    auto wqe = buildMaskedCompareSwap(1, true, target, resultBuffer(32), AtomicWidth::Bytes32,
                                      operand, operand, operand, operand);
    EXPECT_EQ(wqe.size, MAX_EXT_ATOMIC_WQE_SIZE);
}

TEST(ExtendedAtomicsDeathTest, MisalignedTarget) {
    auto operand = toOperand(0);
    RemoteMemory misaligned{.addr = 0x10004, .length = 64, .rkey = 1};
    EXPECT_DEATH(buildMaskedFetchAdd(1, true, misaligned, resultBuffer(8), AtomicWidth::Bytes8, operand, operand),
                 "not aligned");
}

TEST(ExtendedAtomicsDeathTest, OperandOfWrongWidth) {
    auto small = toOperand(0);
    auto wide = filled(16, 0);
    EXPECT_DEATH(buildMaskedFetchAdd(1, true, target, resultBuffer(16), AtomicWidth::Bytes16, wide, small),
                 "expected 16");
}

TEST(ExtendedAtomicsDeathTest, ResultBufferTooSmall) {
    auto operand = filled(32, 0);
    EXPECT_DEATH(buildMaskedCompareSwap(1, true, target, resultBuffer(8), AtomicWidth::Bytes32,
                                        operand, operand, operand, operand), "result buffer");
}
