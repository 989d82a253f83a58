/**
 * @file IBvDeviceList.hpp
 * @author ottojo
 * @date 2/24/21
 * RDMA devices visible to libibverbs
 */

#ifndef SAFEVERBS_IBVDEVICELIST_HPP
#define SAFEVERBS_IBVDEVICELIST_HPP

#include <string>
#include <infiniband/verbs.h>
#include <boost/stl_interfaces/view_interface.hpp>

class IBvDeviceList : public boost::stl_interfaces::view_interface<IBvDeviceList> {
    public:

        using devicePtr = struct ibv_device *;
        using iterator = devicePtr const *;

        [[nodiscard]] iterator begin() const;

        [[nodiscard]] iterator end() const;

        IBvDeviceList();

        ~IBvDeviceList();

        IBvDeviceList(const IBvDeviceList &) = delete;

        IBvDeviceList &operator=(const IBvDeviceList &) = delete;

        devicePtr at(int i) const;

        devicePtr operator[](int i) const;

        /**
         * Looks up a device by name (e.g. "mlx5_0"), an empty name selects the first device.
         * @throws IBvException of kind NotFound
         */
        devicePtr find(const std::string &name) const;

    private:
        int list_size = 0;
        devicePtr *const devices;
};

#endif //SAFEVERBS_IBVDEVICELIST_HPP
