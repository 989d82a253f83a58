/**
 * @file IBvAddressHandle.cpp
 * @author ottojo
 * @date 6/16/21
 */

#include "IBvAddressHandle.hpp"
#include "IBvException.hpp"

#include <fmt/format.h>

struct ibv_ah_attr makeAddressVector(const IBvContext &context, const EndpointInfo &peer) {
    struct ibv_ah_attr attr{
            .grh = {},
            .dlid = peer.localLID,
            .sl = 0,
            .src_path_bits = 0,
            .static_rate = 0,
            .is_global = 0,
            .port_num = context.port(),
    };
    if (peer.isGlobal()) {
        attr.is_global = 1;
        attr.grh.dgid = peer.gid.toIbv();
        attr.grh.flow_label = 0;
        attr.grh.sgid_index = context.gidIndex();
        attr.grh.hop_limit = 0xFF;
        attr.grh.traffic_class = 0;
    }
    return attr;
}

IBvAddressHandle::IBvAddressHandle(const IBvProtectionDomain &pd, const EndpointInfo &peer) : pd(pd), remote(peer) {
    remote.validate();
    auto attr = makeAddressVector(pd.context(), remote);
    auto *raw = ibv_create_ah(pd.get(), &attr);
    if (raw == nullptr) {
        throw IBvException(errno, fmt::format("Creating address handle for QP {:#x} (LID {:#x}, GID {})",
                                              remote.queuePairNumber, remote.localLID, remote.gid.toString()));
    }
    ah = IBvHandle<ibv_ah>(raw, ibv_destroy_ah, "address handle");
}

struct ibv_ah *IBvAddressHandle::get() const {
    return ah.get();
}

const EndpointInfo &IBvAddressHandle::peer() const {
    return remote;
}

const IBvProtectionDomain &IBvAddressHandle::protectionDomain() const {
    return pd;
}
