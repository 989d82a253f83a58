/**
 * @file IBvHandle.hpp
 * @author ottojo
 * @date 6/14/21
 * Reference counted owner of a raw verbs object.
 */

#ifndef SAFEVERBS_IBVHANDLE_HPP
#define SAFEVERBS_IBVHANDLE_HPP

#include <cerrno>
#include <cstring>
#include <memory>
#include <gsl/gsl>
#include "Log.hpp"

/**
 * Copies share the same verbs object, which is destroyed exactly once with the matching ibv_destroy_* / ibv_dealloc_*
 * function when the last copy goes away. Copying and dropping are thread safe.
 *
 * Resource classes keep handles of the objects they depend on as members declared *before* their own handle, so the
 * own handle is always released first.
 */
template<typename T>
class IBvHandle {
    public:
        using Destroy = int (*)(T *);

        IBvHandle() = default;

        IBvHandle(gsl::owner<T *> raw, Destroy destroy, const char *kind) :
                handle(raw, [destroy, kind](T *object) {
                    int error = destroy(object);
                    if (error != 0) {
                        // Error codes are returned either directly or through errno depending on the provider
                        logWarning("destroying {} {} failed: {}", kind, static_cast<void *>(object),
                                   strerror(error > 0 ? error : errno));
                    } else {
                        logDebug("destroyed {} {}", kind, static_cast<void *>(object));
                    }
                }) {
            Expects(raw != nullptr);
        }

        T *get() const {
            return handle.get();
        }

        T *operator->() const {
            return handle.get();
        }

        explicit operator bool() const {
            return handle != nullptr;
        }

        /// Number of copies currently alive
        [[nodiscard]] long useCount() const {
            return handle.use_count();
        }

        bool operator==(const IBvHandle &other) const {
            return handle == other.handle;
        }

    private:
        std::shared_ptr<T> handle;
};

#endif //SAFEVERBS_IBVHANDLE_HPP
