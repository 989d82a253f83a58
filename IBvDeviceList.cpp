/**
 * @file IBvDeviceList.cpp
 * @author ottojo
 * @date 2/24/21
 */

#include <stdexcept>
#include "IBvDeviceList.hpp"
#include "IBvException.hpp"
#include <fmt/format.h>
#include <gsl/gsl>

IBvDeviceList::IBvDeviceList() : devices{ibv_get_device_list(&list_size)} {
    if (devices == nullptr) {
        throw IBvException(ErrorKind::NotFound, errno, "Listing RDMA devices failed");
    }

    Ensures(static_cast<int>(size()) == list_size);
}

IBvDeviceList::~IBvDeviceList() {
    ibv_free_device_list(devices);
}

IBvDeviceList::devicePtr IBvDeviceList::at(int i) const {
    if (i >= 0 and i < list_size) {
        return devices[i];
    } else {
        throw std::out_of_range{
                fmt::format(FMT_STRING("attempted to access device {} in list of size {}"), i, list_size)};
    }
}

IBvDeviceList::devicePtr IBvDeviceList::operator[](int i) const {
    return at(i);
}

IBvDeviceList::devicePtr IBvDeviceList::find(const std::string &name) const {
    if (list_size == 0) {
        throw IBvException(ErrorKind::NotFound, 0, "No RDMA device present");
    }
    if (name.empty()) {
        return devices[0];
    }
    for (auto device: *this) {
        if (name == ibv_get_device_name(device)) {
            return device;
        }
    }
    throw IBvException(ErrorKind::NotFound, 0, fmt::format("RDMA device \"{}\"", name));
}

IBvDeviceList::iterator IBvDeviceList::begin() const {
    return &devices[0];
}

IBvDeviceList::iterator IBvDeviceList::end() const {
    return &devices[list_size];
}
