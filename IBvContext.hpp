/**
 * @file IBvContext.hpp
 * @author ottojo
 * @date 2/24/21
 * Opened RDMA device, bound to one of its ports
 */

#ifndef SAFEVERBS_IBVCONTEXT_HPP
#define SAFEVERBS_IBVCONTEXT_HPP

#include <cstdint>
#include <memory>
#include <string>
#include <infiniband/verbs.h>
#include "CapabilitySet.hpp"
#include "Config.hpp"
#include "EndpointInfo.hpp"
#include "IBvHandle.hpp"

/**
 * Copies refer to the same device context, which is closed once the last copy and every resource created from it
 * are gone. Attributes are queried once on open and never change afterwards.
 */
class IBvContext {
    public:
        /**
         * Opens the configured device (first device for an empty name) and caches its attributes.
         * The capability set describes what the installed driver offers, it is not checked against the hardware.
         * @throws IBvException if the device can not be found or opened
         */
        IBvContext(const ContextConfig &config, CapabilitySet capabilities);

        [[nodiscard]] struct ibv_context *get() const;

        [[nodiscard]] std::string deviceName() const;

        [[nodiscard]] const CapabilitySet &capabilities() const;

        [[nodiscard]] const struct ibv_device_attr &deviceAttributes() const;

        /// Port attributes as of opening the device
        [[nodiscard]] const struct ibv_port_attr &portAttributes() const;

        /// Fresh query of the port attributes, e.g. to check the link state
        [[nodiscard]] struct ibv_port_attr queryPort() const;

        [[nodiscard]] std::uint8_t port() const;

        [[nodiscard]] std::uint8_t gidIndex() const;

        [[nodiscard]] std::uint16_t lid() const;

        [[nodiscard]] const Gid &gid() const;

        [[nodiscard]] enum ibv_mtu activeMtu() const;

        /// Ethernet link layer, peers have to be addressed through their GID
        [[nodiscard]] bool isRoCE() const;

        /// Largest completion queue the device supports
        [[nodiscard]] int maxCqe() const;

        [[nodiscard]] long useCount() const;

    private:
        struct Attributes {
            std::uint8_t port;
            std::uint8_t gidIndex;
            struct ibv_device_attr device;
            struct ibv_port_attr portAttr;
            Gid gid;
            CapabilitySet capabilities;
        };

        IBvHandle<ibv_context> context;
        std::shared_ptr<const Attributes> attributes;
};

#endif //SAFEVERBS_IBVCONTEXT_HPP
