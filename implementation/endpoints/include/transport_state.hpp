// Copyright (C) 2025 Bayerische Motoren Werke Aktiengesellschaft (BMW AG)
// This Source Code Form is subject to the terms of the Mozilla Public
// License, v. 2.0. If a copy of the MPL was not distributed with this
// file, You can obtain one at http://mozilla.org/MPL/2.0/.

#ifndef UDPKIT_V1_TRANSPORT_STATE_HPP_
#define UDPKIT_V1_TRANSPORT_STATE_HPP_

#include <cstdint>
#include <functional>
#include <ostream>

#include <boost/system/error_code.hpp>

namespace udpkit_v1 {

// Lifecycle of a transport handle. FAILED and CANCELLED are terminal.
enum class transport_state_e : std::uint8_t {
    TS_SETUP,
    TS_WAITING,
    TS_READY,
    TS_FAILED,
    TS_CANCELLED
};

inline bool is_terminal(transport_state_e _state) {
    return (_state == transport_state_e::TS_FAILED
            || _state == transport_state_e::TS_CANCELLED);
}

inline std::ostream &operator<<(std::ostream &_os, transport_state_e _state) {
    switch (_state) {
    case transport_state_e::TS_SETUP:
        return _os << "setup";
    case transport_state_e::TS_WAITING:
        return _os << "waiting";
    case transport_state_e::TS_READY:
        return _os << "ready";
    case transport_state_e::TS_FAILED:
        return _os << "failed";
    case transport_state_e::TS_CANCELLED:
        return _os << "cancelled";
    }
    return _os << "unknown";
}

// The error is set for TS_WAITING and TS_FAILED only.
typedef std::function<
    void (transport_state_e, const boost::system::error_code &)
> state_handler_t;

} // namespace udpkit_v1

#endif // UDPKIT_V1_TRANSPORT_STATE_HPP_
