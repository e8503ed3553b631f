// Copyright (C) 2025 Bayerische Motoren Werke Aktiengesellschaft (BMW AG)
// This Source Code Form is subject to the terms of the Mozilla Public
// License, v. 2.0. If a copy of the MPL was not distributed with this
// file, You can obtain one at http://mozilla.org/MPL/2.0/.

#include <gtest/gtest.h>

#include "../../../implementation/server/include/server_connection.hpp"
#include "../../../implementation/server/include/server_connection_group.hpp"
#include "fake_transport_factory.hpp"

namespace udpkit_v1::testing {

TEST(identity, connections_with_equal_endpoints_differ) {
    const endpoint_t its_remote(boost::asio::ip::make_address("192.168.0.10"), 40000);
    auto its_first = std::make_shared<server_connection>(std::make_shared<fake_flow>(its_remote),
                                                         std::weak_ptr<server_impl>());
    auto its_second = std::make_shared<server_connection>(std::make_shared<fake_flow>(its_remote),
                                                          std::weak_ptr<server_impl>());

    EXPECT_EQ(its_first->get_remote_endpoint(), its_second->get_remote_endpoint());
    EXPECT_NE(its_first->get_id(), its_second->get_id());
    EXPECT_TRUE(*its_first != *its_second);
    EXPECT_FALSE(*its_first == *its_second);
    EXPECT_TRUE(*its_first == *its_first);
    EXPECT_NE(*its_first < *its_second, *its_second < *its_first);

    EXPECT_EQ(its_first->get_host(), "192.168.0.10");
    EXPECT_EQ(its_first->get_port(), 40000);
    EXPECT_EQ(its_first->get_state(), transport_state_e::TS_SETUP);
}

TEST(identity, groups_with_equal_hosts_differ) {
    const auto its_group = boost::asio::ip::make_address("239.1.1.1");
    const transport_parameters its_parameters{30490, std::nullopt, true, true, 0};
    auto its_first = std::make_shared<server_connection_group>(
            std::make_shared<fake_membership>(its_group, its_parameters), std::weak_ptr<server_impl>());
    auto its_second = std::make_shared<server_connection_group>(
            std::make_shared<fake_membership>(its_group, its_parameters), std::weak_ptr<server_impl>());

    EXPECT_EQ(its_first->get_host(), its_second->get_host());
    EXPECT_TRUE(*its_first != *its_second);
    EXPECT_FALSE(*its_first == *its_second);
    EXPECT_NE(*its_first < *its_second, *its_second < *its_first);
}

TEST(identity, orphaned_connection_ignores_transport) {
    const endpoint_t its_remote(boost::asio::ip::make_address("192.168.0.10"), 40000);
    auto its_flow = std::make_shared<fake_flow>(its_remote);
    auto its_connection = std::make_shared<server_connection>(its_flow, std::weak_ptr<server_impl>());

    its_connection->start();
    EXPECT_EQ(its_connection->get_state(), transport_state_e::TS_READY);

    its_connection->receive();
    its_flow->deliver({0x01});
    its_connection->cancel();
    EXPECT_EQ(its_connection->get_state(), transport_state_e::TS_CANCELLED);
}

} // namespace udpkit_v1::testing
