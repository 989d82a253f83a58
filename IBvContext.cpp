/**
 * @file IBvContext.cpp
 * @author ottojo
 * @date 2/24/21
 */

#include "IBvContext.hpp"
#include "Contract.hpp"
#include "IBvDeviceList.hpp"
#include "IBvException.hpp"

#include <utility>
#include <fmt/format.h>
#include <gsl/gsl>

namespace {
    IBvHandle<ibv_context> openDevice(const std::string &name) {
        IBvDeviceList devices;
        auto *device = devices.find(name);
        auto *context = ibv_open_device(device);
        if (context == nullptr) {
            throw IBvException(errno, fmt::format("Opening device {}", ibv_get_device_name(device)));
        }
        logDebug("opened device {}", ibv_get_device_name(device));
        return {context, ibv_close_device, "device context"};
    }
}

IBvContext::IBvContext(const ContextConfig &config, CapabilitySet capabilities) :
        context(openDevice(config.device)) {
    Attributes attr{
            .port = config.port,
            .gidIndex = config.gidIndex,
            .device = {},
            .portAttr = {},
            .gid = {},
            .capabilities = std::move(capabilities),
    };

    throwIfError(ibv_query_device(context.get(), &attr.device), "Querying device attributes");
    expects(config.port >= 1 and config.port <= attr.device.phys_port_cnt,
            "port {} does not exist on {}, which has {} ports", config.port, deviceName(),
            attr.device.phys_port_cnt);

    throwIfError(ibv_query_port(context.get(), config.port, &attr.portAttr), "Querying port attributes");
    expects(config.gidIndex < attr.portAttr.gid_tbl_len, "gid index {} out of range, port {} has {} GIDs",
            config.gidIndex, config.port, attr.portAttr.gid_tbl_len);

    ibv_gid gid{};
    // ibv_query_gid returns -1 and sets errno
    throwIfErrorErrno(ibv_query_gid(context.get(), config.port, config.gidIndex, &gid),
                      fmt::format("Querying GID {} of port {}", config.gidIndex, config.port));
    attr.gid = Gid::fromIbv(gid);

    if (attr.portAttr.state != IBV_PORT_ACTIVE) {
        logWarning("port {} of {} is not active (state {})", config.port, deviceName(),
                   ibv_port_state_str(attr.portAttr.state));
    }
    logDebug("{} port {}: LID {:#x}, GID {}, capabilities: {}", deviceName(), config.port, attr.portAttr.lid,
             attr.gid.toString(), attr.capabilities.describe());

    attributes = std::make_shared<const Attributes>(std::move(attr));
}

struct ibv_context *IBvContext::get() const {
    return context.get();
}

std::string IBvContext::deviceName() const {
    return ibv_get_device_name(context->device);
}

const CapabilitySet &IBvContext::capabilities() const {
    return attributes->capabilities;
}

const struct ibv_device_attr &IBvContext::deviceAttributes() const {
    return attributes->device;
}

const struct ibv_port_attr &IBvContext::portAttributes() const {
    return attributes->portAttr;
}

struct ibv_port_attr IBvContext::queryPort() const {
    struct ibv_port_attr attr{};
    throwIfError(ibv_query_port(context.get(), attributes->port, &attr), "Querying port attributes");
    return attr;
}

std::uint8_t IBvContext::port() const {
    return attributes->port;
}

std::uint8_t IBvContext::gidIndex() const {
    return attributes->gidIndex;
}

std::uint16_t IBvContext::lid() const {
    return attributes->portAttr.lid;
}

const Gid &IBvContext::gid() const {
    return attributes->gid;
}

enum ibv_mtu IBvContext::activeMtu() const {
    return attributes->portAttr.active_mtu;
}

bool IBvContext::isRoCE() const {
    return attributes->portAttr.link_layer == IBV_LINK_LAYER_ETHERNET;
}

int IBvContext::maxCqe() const {
    return attributes->device.max_cqe;
}

long IBvContext::useCount() const {
    return context.useCount();
}
