// Copyright (C) 2025 Bayerische Motoren Werke Aktiengesellschaft (BMW AG)
// This Source Code Form is subject to the terms of the Mozilla Public
// License, v. 2.0. If a copy of the MPL was not distributed with this
// file, You can obtain one at http://mozilla.org/MPL/2.0/.

#ifndef UDPKIT_V1_ASIO_TRANSPORT_FACTORY_HPP_
#define UDPKIT_V1_ASIO_TRANSPORT_FACTORY_HPP_

#include "abstract_transport_factory.hpp"

namespace udpkit_v1 {

class asio_transport_factory final : public abstract_transport_factory {
public:
    ~asio_transport_factory() override = default;

    std::shared_ptr<udp_listener> create_listener(
            boost::asio::io_context &_io,
            const transport_parameters &_parameters) override;
    std::shared_ptr<multicast_membership> create_multicast_membership(
            boost::asio::io_context &_io,
            const boost::asio::ip::address &_group,
            const transport_parameters &_parameters) override;
};

} // namespace udpkit_v1

#endif // UDPKIT_V1_ASIO_TRANSPORT_FACTORY_HPP_
