/**
 * @file WorkCompletion.cpp
 * @author ottojo
 * @date 6/15/21
 */

#include "WorkCompletion.hpp"
#include "Contract.hpp"
#include "libibverbs_format.hpp"

#include <arpa/inet.h>

WorkCompletion::WorkCompletion(const ibv_wc &wc) : wc(wc) {}

WrId WorkCompletion::wrId() const {
    return wc.wr_id;
}

enum ibv_wc_status WorkCompletion::status() const {
    return wc.status;
}

bool WorkCompletion::ok() const {
    return wc.status == IBV_WC_SUCCESS;
}

std::uint32_t WorkCompletion::byteLength() const {
    return wc.byte_len;
}

enum ibv_wc_opcode WorkCompletion::opcode() const {
    return wc.opcode;
}

bool WorkCompletion::isReceive() const {
    // Driver specific opcodes (e.g. raw WQE completions) share the receive bit, so compare exactly
    return wc.opcode == IBV_WC_RECV or wc.opcode == IBV_WC_RECV_RDMA_WITH_IMM;
}

std::uint32_t WorkCompletion::qpNum() const {
    return wc.qp_num;
}

std::optional<std::uint32_t> WorkCompletion::immData() const {
    if (not ok() or (wc.wc_flags & IBV_WC_WITH_IMM) == 0) {
        return std::nullopt;
    }
    return ntohl(wc.imm_data);
}

ErrorKind WorkCompletion::errorKind() const {
    expects(not ok(), "error kind requested for successful work completion {}", wc.wr_id);
    return classifyStatus(wc.status);
}

void WorkCompletion::expectSuccess() const {
    if (not ok()) {
        throw IBvException(classifyStatus(wc.status), 0,
                           fmt::format("Work request {} on QP {:#x} failed with {}", wc.wr_id, wc.qp_num, wc.status));
    }
}

const ibv_wc &WorkCompletion::raw() const {
    return wc;
}
