//
// Created by jonas on 09.03.21.
//

#ifndef SAFEVERBS_IBVEXCEPTION_HPP
#define SAFEVERBS_IBVEXCEPTION_HPP


#include <cerrno>
#include <exception>
#include <string>
#include <infiniband/verbs.h>

/**
 * Classes of recoverable failures. Everything in here is something the adapter, the driver or the network did,
 * never a caller bug (those terminate, see Contract.hpp).
 */
enum class ErrorKind {
        ResourceExhausted,
        LinkFailure,
        RemoteAccess,
        LocalAccess,
        RetryExceeded,
        BadState,
        InvalidRequest,
        NotFound,
        Driver
};

const char *toString(ErrorKind kind);

/// Maps an errno value reported by libibverbs to an error class
ErrorKind classifyErrno(int error);

/// Maps a work completion status to an error class. Must not be called with IBV_WC_SUCCESS.
ErrorKind classifyStatus(enum ibv_wc_status status);

class IBvException : public std::exception {
    public:
        explicit IBvException(int error);

        IBvException(int error, const std::string &what);

        IBvException(ErrorKind kind, int error, const std::string &what);

        [[nodiscard]] const char *what() const noexcept override;

        [[nodiscard]] ErrorKind kind() const noexcept;

        /// errno value, 0 if the failure was not reported through errno
        [[nodiscard]] int error() const noexcept;

    private:
        ErrorKind errorKind;
        int errorNumber;
        std::string message;
};

inline void throwIfError(int error) {
    if (error != 0) {
        throw IBvException(error);
    }
}

inline void throwIfError(int error, const std::string &what) {
    if (error != 0) {
        throw IBvException(error, what);
    }
}

inline void throwIfErrorErrno(int error) {
    if (error != 0) {
        throw IBvException(errno);
    }
}

inline void throwIfErrorErrno(int error, const std::string &what) {
    if (error != 0) {
        throw IBvException(errno, what);
    }
}

#endif //SAFEVERBS_IBVEXCEPTION_HPP
