//
// Created by jonas on 09.03.21.
//

#include "IBvMemoryRegion.hpp"
#include "Contract.hpp"
#include "IBvException.hpp"

#include <utility>

IBvMemoryRegion::IBvMemoryRegion(const IBvProtectionDomain &pd, gsl::span<std::byte> buffer, Permission permissions,
                                 std::shared_ptr<void> storage) :
        pd(pd),
        owner(std::move(storage)),
        perms(permissions) {
    expects(not buffer.empty(), "registering an empty buffer");
    // Remote write and remote atomic access are rejected by the driver unless local write is granted as well
    expects(hasPermission(perms, Permission::LocalWrite) or
            not(hasPermission(perms, Permission::RemoteWrite) or hasPermission(perms, Permission::RemoteAtomic)),
            "remote write or atomic access requires local write access");

    auto *raw = ibv_reg_mr(pd.get(), buffer.data(), buffer.size(), static_cast<int>(perms));
    if (raw == nullptr) {
        throw IBvException(errno, fmt::format("Registering memory region of {} bytes", buffer.size()));
    }
    mr = IBvHandle<ibv_mr>(raw, ibv_dereg_mr, "memory region");
    logDebug("registered {} bytes at {}, lkey {:#x}, rkey {:#x}", raw->length, raw->addr, raw->lkey, raw->rkey);
}

struct ibv_mr *IBvMemoryRegion::get() const {
    return mr.get();
}

std::uint32_t IBvMemoryRegion::lkey() const {
    return mr->lkey;
}

std::uint32_t IBvMemoryRegion::rkey() const {
    return mr->rkey;
}

std::byte *IBvMemoryRegion::data() const {
    return static_cast<std::byte *>(mr->addr);
}

std::size_t IBvMemoryRegion::size() const {
    return mr->length;
}

gsl::span<std::byte> IBvMemoryRegion::span() const {
    return {data(), size()};
}

Permission IBvMemoryRegion::permissions() const {
    return perms;
}

const IBvProtectionDomain &IBvMemoryRegion::protectionDomain() const {
    return pd;
}

MrSlice IBvMemoryRegion::slice(std::size_t offset, std::size_t length) const {
    return {*this, offset, length};
}

MrSlice IBvMemoryRegion::whole() const {
    return {*this, 0, size()};
}

RemoteMemory IBvMemoryRegion::remote() const {
    return whole().remote();
}

long IBvMemoryRegion::useCount() const {
    return mr.useCount();
}

MrSlice::MrSlice(IBvMemoryRegion region, std::size_t offset, std::size_t length) :
        mr(std::move(region)), offset(offset), length(length) {
    expects(offset <= mr.size() and length <= mr.size() - offset,
            "slice [{}, {}) outside of memory region of {} bytes", offset, offset + length, mr.size());
}

std::byte *MrSlice::data() const {
    return mr.data() + offset;
}

std::size_t MrSlice::size() const {
    return length;
}

std::uint64_t MrSlice::address() const {
    return reinterpret_cast<std::uintptr_t>(data());
}

std::uint32_t MrSlice::lkey() const {
    return mr.lkey();
}

std::uint32_t MrSlice::rkey() const {
    return mr.rkey();
}

gsl::span<std::byte> MrSlice::span() const {
    return {data(), length};
}

const IBvMemoryRegion &MrSlice::region() const {
    return mr;
}

MrSlice MrSlice::slice(std::size_t subOffset, std::size_t subLength) const {
    expects(subOffset <= length and subLength <= length - subOffset,
            "slice [{}, {}) outside of slice of {} bytes", subOffset, subOffset + subLength, length);
    return {mr, offset + subOffset, subLength};
}

struct ibv_sge MrSlice::sge() const {
    return {
            .addr = address(),
            .length = gsl::narrow<std::uint32_t>(length),
            .lkey = lkey(),
    };
}

RemoteMemory MrSlice::remote() const {
    expects(hasPermission(mr.permissions(), Permission::RemoteRead) or
            hasPermission(mr.permissions(), Permission::RemoteWrite) or
            hasPermission(mr.permissions(), Permission::RemoteAtomic),
            "advertising a memory region without remote access");
    return {address(), length, rkey()};
}

std::vector<struct ibv_sge> toSgeList(const IBvProtectionDomain &pd, gsl::span<const MrSlice> slices,
                                      std::uint32_t maxSge) {
    expects(slices.size() <= maxSge, "{} scatter gather entries, queue allows {}", slices.size(), maxSge);
    std::vector<struct ibv_sge> sges;
    sges.reserve(slices.size());
    for (const auto &slice: slices) {
        expects(slice.region().protectionDomain() == pd,
                "memory region lkey {:#x} belongs to a different protection domain", slice.lkey());
        sges.push_back(slice.sge());
    }
    return sges;
}
