// Copyright (C) 2025 Bayerische Motoren Werke Aktiengesellschaft (BMW AG)
// This Source Code Form is subject to the terms of the Mozilla Public
// License, v. 2.0. If a copy of the MPL was not distributed with this
// file, You can obtain one at http://mozilla.org/MPL/2.0/.

#ifndef UDPKIT_V1_ABSTRACT_TRANSPORT_FACTORY_HPP_
#define UDPKIT_V1_ABSTRACT_TRANSPORT_FACTORY_HPP_

#include <memory>
#include <optional>
#include <string>

#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/address.hpp>

#include "multicast_membership.hpp"
#include "transport_parameters.hpp"
#include "udp_flow.hpp"
#include "udp_listener.hpp"
#include "../../utility/include/utility.hpp"

namespace udpkit_v1 {

// Creates the transport handles used by the servers. Tests replace it by
// passing a fake factory to the server.
class abstract_transport_factory {
public:
    virtual ~abstract_transport_factory() = default;

    static std::shared_ptr<abstract_transport_factory> get();

    // Throw boost::system::system_error if the handle cannot be created.
    virtual std::shared_ptr<udp_listener> create_listener(
            boost::asio::io_context &_io,
            const transport_parameters &_parameters) = 0;
    virtual std::shared_ptr<multicast_membership> create_multicast_membership(
            boost::asio::io_context &_io,
            const boost::asio::ip::address &_group,
            const transport_parameters &_parameters) = 0;

    virtual bool is_valid_multicast_address(const std::string &_address) const {
        return utility::is_valid_multicast_address(_address);
    }

    virtual std::optional<network_interface> resolve_interface(
            const std::string &_name_or_address) const {
        return utility::resolve_interface(_name_or_address);
    }
};

} // namespace udpkit_v1

#endif // UDPKIT_V1_ABSTRACT_TRANSPORT_FACTORY_HPP_
