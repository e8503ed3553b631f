// Copyright (C) 2025 Bayerische Motoren Werke Aktiengesellschaft (BMW AG)
// This Source Code Form is subject to the terms of the Mozilla Public
// License, v. 2.0. If a copy of the MPL was not distributed with this
// file, You can obtain one at http://mozilla.org/MPL/2.0/.

#ifndef UDPKIT_V1_UDP_LISTENER_HPP_
#define UDPKIT_V1_UDP_LISTENER_HPP_

#include <functional>
#include <memory>

#include "transport_state.hpp"

namespace udpkit_v1 {

class udp_flow;

class udp_listener {
public:
    typedef std::function<
        void (const std::shared_ptr<udp_flow> &)
    > new_connection_handler_t;

    virtual ~udp_listener() = default;

    virtual void set_state_handler(state_handler_t _handler) = 0;
    virtual void set_new_connection_handler(new_connection_handler_t _handler) = 0;

    // Opens and binds the socket. Starting a listener that failed before
    // reopens it, starting a running listener does nothing.
    virtual void start() = 0;
    virtual void cancel() = 0;
};

} // namespace udpkit_v1

#endif // UDPKIT_V1_UDP_LISTENER_HPP_
