// Copyright (C) 2025 Bayerische Motoren Werke Aktiengesellschaft (BMW AG)
// This Source Code Form is subject to the terms of the Mozilla Public
// License, v. 2.0. If a copy of the MPL was not distributed with this
// file, You can obtain one at http://mozilla.org/MPL/2.0/.

#ifndef UDPKIT_V1_UDP_FLOW_HPP_
#define UDPKIT_V1_UDP_FLOW_HPP_

#include <functional>
#include <memory>

#include <boost/system/error_code.hpp>

#include <udpkit/endpoint.hpp>
#include <udpkit/primitive_types.hpp>

#include "transport_state.hpp"

namespace udpkit_v1 {

// Datagrams of one remote peer, as announced by a udp_listener.
class udp_flow {
public:
    typedef std::function<
        void (const boost::system::error_code &,
              const std::shared_ptr<message_buffer_t> &,
              bool /* is complete */)
    > receive_handler_t;

    virtual ~udp_flow() = default;

    virtual const endpoint_t &get_remote_endpoint() const = 0;

    virtual void set_state_handler(state_handler_t _handler) = 0;

    virtual void start() = 0;
    virtual void cancel() = 0;

    // Delivers exactly one datagram (or error) to the handler. Only one
    // receive may be outstanding at a time.
    virtual void async_receive_message(receive_handler_t _handler) = 0;
};

} // namespace udpkit_v1

#endif // UDPKIT_V1_UDP_FLOW_HPP_
