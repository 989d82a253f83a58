/**
 * @file IBvRegisteredBuffer.hpp
 * @author ottojo
 * @date 5/25/21
 * Heap buffer that is registered with the adapter for its whole lifetime
 */

#ifndef SAFEVERBS_IBVREGISTEREDBUFFER_HPP
#define SAFEVERBS_IBVREGISTEREDBUFFER_HPP

#include <cstddef>
#include <memory>
#include <type_traits>
#include <gsl/gsl>
#include "IBvMemoryRegion.hpp"

/**
 * Allocates size elements of T and registers them. Copies share the storage. The storage stays allocated until the
 * registration (including every slice handed to the adapter) is gone.
 */
template<typename T>
class IBvRegisteredBuffer {
        static_assert(std::is_trivially_copyable_v<T>, "the adapter copies buffer contents bytewise");

    public:
        IBvRegisteredBuffer(const IBvProtectionDomain &pd, std::size_t size, Permission permissions = Permission::All) :
                _size(size),
                _data(new T[size]()),
                memoryRegion(pd, gsl::as_writable_bytes(gsl::span<T>(_data.get(), size)), permissions, _data) {}

        T &at(std::size_t i) {
            expects(i < _size, "buffer index {} out of range {}", i, _size);
            return _data[i];
        }

        const T &at(std::size_t i) const {
            expects(i < _size, "buffer index {} out of range {}", i, _size);
            return _data[i];
        }

        T *data() {
            return _data.get();
        }

        const T *data() const {
            return _data.get();
        }

        gsl::span<T> span() {
            return {_data.get(), _size};
        }

        [[nodiscard]] std::size_t size() const {
            return _size;
        }

        [[nodiscard]] const IBvMemoryRegion &region() const {
            return memoryRegion;
        }

        /// Slice of the elements [first, first + count)
        [[nodiscard]] MrSlice slice(std::size_t first, std::size_t count) const {
            return memoryRegion.slice(first * sizeof(T), count * sizeof(T));
        }

        [[nodiscard]] MrSlice whole() const {
            return memoryRegion.whole();
        }

    private:
        std::size_t _size;
        std::shared_ptr<T[]> _data;
        IBvMemoryRegion memoryRegion;
};

#endif //SAFEVERBS_IBVREGISTEREDBUFFER_HPP
