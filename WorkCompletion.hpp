/**
 * @file WorkCompletion.hpp
 * @author ottojo
 * @date 6/15/21
 * One polled completion queue entry
 */

#ifndef SAFEVERBS_WORKCOMPLETION_HPP
#define SAFEVERBS_WORKCOMPLETION_HPP

#include <cstdint>
#include <optional>
#include <infiniband/verbs.h>
#include "IBvException.hpp"

/// Caller supplied tag of a work request, returned in its completion
using WrId = std::uint64_t;

class WorkCompletion {
    public:
        /// Empty slot to poll into
        WorkCompletion() = default;

        explicit WorkCompletion(const ibv_wc &wc);

        [[nodiscard]] WrId wrId() const;

        [[nodiscard]] enum ibv_wc_status status() const;

        [[nodiscard]] bool ok() const;

        /**
         * Bytes transferred. Only meaningful for receive completions (and for atomics and reads, where the driver
         * reports the operand size).
         */
        [[nodiscard]] std::uint32_t byteLength() const;

        [[nodiscard]] enum ibv_wc_opcode opcode() const;

        /// Completion of a posted receive (including RDMA write with immediate)
        [[nodiscard]] bool isReceive() const;

        [[nodiscard]] std::uint32_t qpNum() const;

        /// Immediate data in host byte order, if the sender attached any
        [[nodiscard]] std::optional<std::uint32_t> immData() const;

        /// Error class of a failed completion. Terminates if called on a successful one.
        [[nodiscard]] ErrorKind errorKind() const;

        /**
         * @throws IBvException with the classified status if the work request failed
         */
        void expectSuccess() const;

        [[nodiscard]] const ibv_wc &raw() const;

    private:
        ibv_wc wc{};
};

#endif //SAFEVERBS_WORKCOMPLETION_HPP
