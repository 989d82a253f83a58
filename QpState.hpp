/**
 * @file QpState.hpp
 * @author ottojo
 * @date 6/15/21
 * Connection states of a queue pair
 */

#ifndef SAFEVERBS_QPSTATE_HPP
#define SAFEVERBS_QPSTATE_HPP

#include <infiniband/verbs.h>

/**
 * RESET -> INIT -> RTR -> RTS, and ERROR once a fatal completion was polled. There is no way back: a queue pair
 * serves exactly one connection.
 */
enum class QpState {
        Reset,
        Init,
        ReadyToReceive,
        ReadyToSend,
        Error
};

const char *toString(QpState state);

/// Whether the state machine allows going from one state to the other
bool isValidTransition(QpState from, QpState to);

/// Receive work requests may be posted from INIT on
bool canPostReceive(QpState state);

/// Send side work requests need RTS
bool canPostSend(QpState state);

QpState fromIbv(enum ibv_qp_state state);

enum ibv_qp_state toIbv(QpState state);

#endif //SAFEVERBS_QPSTATE_HPP
