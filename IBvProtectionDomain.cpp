//
// Created by jonas on 09.03.21.
//

#include "IBvProtectionDomain.hpp"
#include "IBvException.hpp"

IBvProtectionDomain::IBvProtectionDomain(const IBvContext &context) : ctx(context) {
    auto *raw = ibv_alloc_pd(ctx.get());
    if (raw == nullptr) {
        throw IBvException(errno, "Allocating protection domain");
    }
    pd = IBvHandle<ibv_pd>(raw, ibv_dealloc_pd, "protection domain");
    logDebug("allocated protection domain {} on {}", static_cast<void *>(raw), ctx.deviceName());
}

ibv_pd *IBvProtectionDomain::get() const {
    return pd.get();
}

const IBvContext &IBvProtectionDomain::context() const {
    return ctx;
}

long IBvProtectionDomain::useCount() const {
    return pd.useCount();
}

bool IBvProtectionDomain::operator==(const IBvProtectionDomain &other) const {
    return pd == other.pd;
}
