//
// Created by jonas on 09.03.21.
//

#include <cstring>
#include <fmt/format.h>
#include "IBvException.hpp"

const char *toString(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::ResourceExhausted:
            return "resource exhausted";
        case ErrorKind::LinkFailure:
            return "link failure";
        case ErrorKind::RemoteAccess:
            return "remote access violation";
        case ErrorKind::LocalAccess:
            return "local access violation";
        case ErrorKind::RetryExceeded:
            return "retry count exceeded";
        case ErrorKind::BadState:
            return "bad state";
        case ErrorKind::InvalidRequest:
            return "invalid request";
        case ErrorKind::NotFound:
            return "not found";
        case ErrorKind::Driver:
            return "driver error";
    }
    return "unknown";
}

ErrorKind classifyErrno(int error) {
    switch (error) {
        case ENOMEM:
        case ENOSPC:
        case EAGAIN:
        case ENOBUFS:
            return ErrorKind::ResourceExhausted;
        case ENETDOWN:
        case ENETUNREACH:
        case ENOTCONN:
        case ECONNRESET:
        case EHOSTUNREACH:
            return ErrorKind::LinkFailure;
        case EACCES:
        case EPERM:
            // memlock limit or missing permission on the local device
            return ErrorKind::LocalAccess;
        case ETIMEDOUT:
            return ErrorKind::RetryExceeded;
        case EINVAL:
        case EOPNOTSUPP:
            return ErrorKind::InvalidRequest;
        case ENODEV:
        case ENOENT:
        case ENXIO:
            return ErrorKind::NotFound;
        default:
            return ErrorKind::Driver;
    }
}

ErrorKind classifyStatus(enum ibv_wc_status status) {
    switch (status) {
        case IBV_WC_REM_ACCESS_ERR:
            return ErrorKind::RemoteAccess;
        case IBV_WC_LOC_PROT_ERR:
        case IBV_WC_LOC_ACCESS_ERR:
        case IBV_WC_MW_BIND_ERR:
            return ErrorKind::LocalAccess;
        case IBV_WC_RETRY_EXC_ERR:
        case IBV_WC_RNR_RETRY_EXC_ERR:
        case IBV_WC_RESP_TIMEOUT_ERR:
            return ErrorKind::RetryExceeded;
        case IBV_WC_LOC_LEN_ERR:
            return ErrorKind::ResourceExhausted;
        case IBV_WC_WR_FLUSH_ERR:
            return ErrorKind::BadState;
        case IBV_WC_LOC_QP_OP_ERR:
        case IBV_WC_REM_INV_REQ_ERR:
        case IBV_WC_REM_OP_ERR:
        case IBV_WC_BAD_RESP_ERR:
        case IBV_WC_REM_ABORT_ERR:
            return ErrorKind::InvalidRequest;
        case IBV_WC_FATAL_ERR:
            return ErrorKind::LinkFailure;
        default:
            return ErrorKind::Driver;
    }
}

const char *IBvException::what() const noexcept {
    return message.c_str();
}

ErrorKind IBvException::kind() const noexcept {
    return errorKind;
}

int IBvException::error() const noexcept {
    return errorNumber;
}

IBvException::IBvException(int error) :
        errorKind(classifyErrno(error)),
        errorNumber(error),
        message{"Error " + std::to_string(error) + ": " + strerror(error)} {}

IBvException::IBvException(int error, const std::string &what) :
        errorKind(classifyErrno(error)),
        errorNumber(error),
        message{fmt::format("{}: error {} ({})", what, error, strerror(error))} {}

IBvException::IBvException(ErrorKind kind, int error, const std::string &what) :
        errorKind(kind),
        errorNumber(error),
        message{error == 0 ? fmt::format("{}: {}", what, toString(kind))
                           : fmt::format("{}: {} (error {}: {})", what, toString(kind), error, strerror(error))} {}
