// Copyright (C) 2025 Bayerische Motoren Werke Aktiengesellschaft (BMW AG)
// This Source Code Form is subject to the terms of the Mozilla Public
// License, v. 2.0. If a copy of the MPL was not distributed with this
// file, You can obtain one at http://mozilla.org/MPL/2.0/.

#ifndef UDPKIT_V1_MULTICAST_MEMBERSHIP_HPP_
#define UDPKIT_V1_MULTICAST_MEMBERSHIP_HPP_

#include <functional>
#include <memory>
#include <optional>

#include <boost/asio/ip/address.hpp>

#include <udpkit/endpoint.hpp>
#include <udpkit/primitive_types.hpp>

#include "transport_state.hpp"

namespace udpkit_v1 {

class multicast_membership {
public:
    typedef std::function<
        void (const std::shared_ptr<message_buffer_t> &,
              const std::optional<endpoint_t> &,
              bool /* is complete */)
    > receive_handler_t;

    virtual ~multicast_membership() = default;

    virtual const boost::asio::ip::address &get_group() const = 0;

    virtual void set_state_handler(state_handler_t _handler) = 0;

    // The handler is called for every datagram received while the
    // membership is ready. Datagrams larger than _max_size are either
    // dropped (_reject_oversized) or passed as incomplete.
    virtual void set_receive_handler(length_t _max_size,
            bool _reject_oversized, receive_handler_t _handler) = 0;

    virtual void start() = 0;
    // Leaves the group and closes the socket
    virtual void cancel() = 0;
};

} // namespace udpkit_v1

#endif // UDPKIT_V1_MULTICAST_MEMBERSHIP_HPP_
