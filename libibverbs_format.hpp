//
// Created by jonas on 09.03.21.
//

#ifndef SAFEVERBS_LIBIBVERBS_FORMAT_HPP
#define SAFEVERBS_LIBIBVERBS_FORMAT_HPP

#include <fmt/format.h>
#include <infiniband/verbs.h>
#include "IBvException.hpp"
#include "QpState.hpp"

template<>
struct fmt::formatter<enum ibv_qp_state> : formatter<string_view> {
    // parse is inherited from formatter<string_view>.
    template<typename FormatContext>
    auto format(enum ibv_qp_state s, FormatContext &ctx) const {
        // Send queue drained / error are reported by the driver only, QpState folds them into ERROR
        if (s == IBV_QPS_SQD) {
            return formatter<string_view>::format("SQD", ctx);
        }
        if (s == IBV_QPS_SQE) {
            return formatter<string_view>::format("SQE", ctx);
        }
        if (s == IBV_QPS_UNKNOWN) {
            return formatter<string_view>::format("UNKNOWN", ctx);
        }
        return formatter<string_view>::format(toString(fromIbv(s)), ctx);
    }
};

template<>
struct fmt::formatter<QpState> : formatter<string_view> {
    template<typename FormatContext>
    auto format(QpState s, FormatContext &ctx) const {
        return formatter<string_view>::format(toString(s), ctx);
    }
};

template<>
struct fmt::formatter<enum ibv_wc_status> : formatter<string_view> {
    template<typename FormatContext>
    auto format(enum ibv_wc_status s, FormatContext &ctx) const {
        return formatter<string_view>::format(ibv_wc_status_str(s), ctx);
    }
};

template<>
struct fmt::formatter<ErrorKind> : formatter<string_view> {
    template<typename FormatContext>
    auto format(ErrorKind k, FormatContext &ctx) const {
        return formatter<string_view>::format(toString(k), ctx);
    }
};

#endif //SAFEVERBS_LIBIBVERBS_FORMAT_HPP
