// Copyright (C) 2025 Bayerische Motoren Werke Aktiengesellschaft (BMW AG)
// This Source Code Form is subject to the terms of the Mozilla Public
// License, v. 2.0. If a copy of the MPL was not distributed with this
// file, You can obtain one at http://mozilla.org/MPL/2.0/.

#include <boost/asio/error.hpp>
#include <boost/system/system_error.hpp>

#include "../include/asio_multicast_membership.hpp"
#include "../include/asio_transport_factory.hpp"
#include "../include/asio_udp_listener.hpp"

namespace udpkit_v1 {

std::shared_ptr<udp_listener> asio_transport_factory::create_listener(
        boost::asio::io_context &_io, const transport_parameters &_parameters) {
    if (_parameters.port_ == 0) {
        throw boost::system::system_error(
                boost::asio::error::invalid_argument, "invalid port");
    }
    return std::make_shared<asio_udp_listener>(_io, _parameters);
}

std::shared_ptr<multicast_membership>
asio_transport_factory::create_multicast_membership(
        boost::asio::io_context &_io, const boost::asio::ip::address &_group,
        const transport_parameters &_parameters) {
    if (!_group.is_multicast()) {
        throw boost::system::system_error(
                boost::asio::error::invalid_argument,
                _group.to_string() + " is not a multicast address");
    }
    if (_parameters.port_ == 0) {
        throw boost::system::system_error(
                boost::asio::error::invalid_argument, "invalid port");
    }
    return std::make_shared<asio_multicast_membership>(_io, _group, _parameters);
}

} // namespace udpkit_v1
