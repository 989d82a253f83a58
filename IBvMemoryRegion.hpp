//
// Created by jonas on 09.03.21.
//

#ifndef SAFEVERBS_IBVMEMORYREGION_HPP
#define SAFEVERBS_IBVMEMORYREGION_HPP

#include <cstddef>
#include <cstdint>
#include <memory>
#include <vector>
#include <infiniband/verbs.h>
#include <gsl/gsl>
#include "IBvHandle.hpp"
#include "IBvProtectionDomain.hpp"
#include "RemoteMemory.hpp"

/// Access rights of a memory region, combine with |
enum class Permission : int {
        None = 0,
        LocalWrite = IBV_ACCESS_LOCAL_WRITE,
        RemoteWrite = IBV_ACCESS_REMOTE_WRITE,
        RemoteRead = IBV_ACCESS_REMOTE_READ,
        RemoteAtomic = IBV_ACCESS_REMOTE_ATOMIC,
        All = IBV_ACCESS_LOCAL_WRITE | IBV_ACCESS_REMOTE_WRITE | IBV_ACCESS_REMOTE_READ | IBV_ACCESS_REMOTE_ATOMIC
};

constexpr Permission operator|(Permission a, Permission b) {
    return static_cast<Permission>(static_cast<int>(a) | static_cast<int>(b));
}

constexpr bool hasPermission(Permission set, Permission p) {
    return (static_cast<int>(set) & static_cast<int>(p)) == static_cast<int>(p);
}

class MrSlice;

/**
 * Registration of a buffer with the adapter. The buffer is borrowed: it has to stay at the same address until the
 * last copy of the region (and of every slice of it) is gone, unless an owner is handed in that keeps it alive.
 */
class IBvMemoryRegion {
    public:
        /**
         * @param storage optional owner of the buffer, released after deregistration
         * @throws IBvException if the driver refuses the registration (e.g. ENOMEM when pinning fails)
         */
        IBvMemoryRegion(const IBvProtectionDomain &pd, gsl::span<std::byte> buffer,
                        Permission permissions = Permission::All, std::shared_ptr<void> storage = nullptr);

        [[nodiscard]] struct ibv_mr *get() const;

        [[nodiscard]] std::uint32_t lkey() const;

        [[nodiscard]] std::uint32_t rkey() const;

        [[nodiscard]] std::byte *data() const;

        [[nodiscard]] std::size_t size() const;

        [[nodiscard]] gsl::span<std::byte> span() const;

        [[nodiscard]] Permission permissions() const;

        [[nodiscard]] const IBvProtectionDomain &protectionDomain() const;

        /// Sub range without re-registration. Terminates if the range exceeds the region.
        [[nodiscard]] MrSlice slice(std::size_t offset, std::size_t length) const;

        [[nodiscard]] MrSlice whole() const;

        /// Descriptor of the whole region for the peer
        [[nodiscard]] RemoteMemory remote() const;

        [[nodiscard]] long useCount() const;

    private:
        IBvProtectionDomain pd;
        std::shared_ptr<void> owner;
        IBvHandle<ibv_mr> mr;
        Permission perms;
};

/**
 * Part of a registered memory region, carrying the region's keys. Keeps the region alive.
 */
class MrSlice {
    public:
        MrSlice(IBvMemoryRegion region, std::size_t offset, std::size_t length);

        [[nodiscard]] std::byte *data() const;

        [[nodiscard]] std::size_t size() const;

        [[nodiscard]] std::uint64_t address() const;

        [[nodiscard]] std::uint32_t lkey() const;

        [[nodiscard]] std::uint32_t rkey() const;

        [[nodiscard]] gsl::span<std::byte> span() const;

        [[nodiscard]] const IBvMemoryRegion &region() const;

        [[nodiscard]] MrSlice slice(std::size_t offset, std::size_t length) const;

        /// Scatter gather entry, valid as long as this slice exists
        [[nodiscard]] struct ibv_sge sge() const;

        [[nodiscard]] RemoteMemory remote() const;

    private:
        IBvMemoryRegion mr;
        std::size_t offset;
        std::size_t length;
};

/**
 * Scatter gather list for a work request. Terminates if there are more slices than maxSge, or if a slice belongs to
 * another protection domain than the queue it is posted to.
 */
std::vector<struct ibv_sge> toSgeList(const IBvProtectionDomain &pd, gsl::span<const MrSlice> slices,
                                      std::uint32_t maxSge);

#endif //SAFEVERBS_IBVMEMORYREGION_HPP
