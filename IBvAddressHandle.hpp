/**
 * @file IBvAddressHandle.hpp
 * @author ottojo
 * @date 6/16/21
 * Route to a peer port, needed for datagram and DC sends
 */

#ifndef SAFEVERBS_IBVADDRESSHANDLE_HPP
#define SAFEVERBS_IBVADDRESSHANDLE_HPP

#include <infiniband/verbs.h>
#include "EndpointInfo.hpp"
#include "IBvContext.hpp"
#include "IBvHandle.hpp"
#include "IBvProtectionDomain.hpp"

/**
 * Address vector from the local port to the peer. Uses a global route header whenever the peer has a GID.
 */
struct ibv_ah_attr makeAddressVector(const IBvContext &context, const EndpointInfo &peer);

class IBvAddressHandle {
    public:
        /**
         * Terminates for a peer without LID and GID or with QP number 0.
         * @throws IBvException if the driver can not resolve the route
         */
        IBvAddressHandle(const IBvProtectionDomain &pd, const EndpointInfo &peer);

        [[nodiscard]] struct ibv_ah *get() const;

        [[nodiscard]] const EndpointInfo &peer() const;

        [[nodiscard]] const IBvProtectionDomain &protectionDomain() const;

    private:
        IBvProtectionDomain pd;
        IBvHandle<ibv_ah> ah;
        EndpointInfo remote;
};

#endif //SAFEVERBS_IBVADDRESSHANDLE_HPP
