/**
 * @file QpState.cpp
 * @author ottojo
 * @date 6/15/21
 */

#include "QpState.hpp"

const char *toString(QpState state) {
    switch (state) {
        case QpState::Reset:
            return "RESET";
        case QpState::Init:
            return "INIT";
        case QpState::ReadyToReceive:
            return "RTR";
        case QpState::ReadyToSend:
            return "RTS";
        case QpState::Error:
            return "ERROR";
    }
    return "UNKNOWN";
}

bool isValidTransition(QpState from, QpState to) {
    switch (to) {
        case QpState::Init:
            return from == QpState::Reset;
        case QpState::ReadyToReceive:
            return from == QpState::Init;
        case QpState::ReadyToSend:
            return from == QpState::ReadyToReceive;
        case QpState::Error:
            return from != QpState::Error;
        case QpState::Reset:
            return false;
    }
    return false;
}

bool canPostReceive(QpState state) {
    return state == QpState::Init or state == QpState::ReadyToReceive or state == QpState::ReadyToSend;
}

bool canPostSend(QpState state) {
    return state == QpState::ReadyToSend;
}

QpState fromIbv(enum ibv_qp_state state) {
    switch (state) {
        case IBV_QPS_RESET:
            return QpState::Reset;
        case IBV_QPS_INIT:
            return QpState::Init;
        case IBV_QPS_RTR:
            return QpState::ReadyToReceive;
        case IBV_QPS_RTS:
            return QpState::ReadyToSend;
        default:
            // SQD, SQE and ERR are not modeled, none of them accepts new work
            return QpState::Error;
    }
}

enum ibv_qp_state toIbv(QpState state) {
    switch (state) {
        case QpState::Reset:
            return IBV_QPS_RESET;
        case QpState::Init:
            return IBV_QPS_INIT;
        case QpState::ReadyToReceive:
            return IBV_QPS_RTR;
        case QpState::ReadyToSend:
            return IBV_QPS_RTS;
        case QpState::Error:
            return IBV_QPS_ERR;
    }
    return IBV_QPS_UNKNOWN;
}
