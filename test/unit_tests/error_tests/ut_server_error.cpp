// Copyright (C) 2025 Bayerische Motoren Werke Aktiengesellschaft (BMW AG)
// This Source Code Form is subject to the terms of the Mozilla Public
// License, v. 2.0. If a copy of the MPL was not distributed with this
// file, You can obtain one at http://mozilla.org/MPL/2.0/.

#include <gtest/gtest.h>

#include <string>

#include <boost/asio/error.hpp>
#include <boost/system/system_error.hpp>

#include <udpkit/error.hpp>

namespace udpkit_v1::testing {

TEST(server_error, message_names_kind_and_value) {
    server_error its_error(error_code_e::INVALID_MULTICAST_GROUP, "10.0.0.1");

    EXPECT_EQ(its_error.code(), error_code_e::INVALID_MULTICAST_GROUP);
    EXPECT_EQ(std::string(its_error.what()), "Invalid multicast group: 10.0.0.1");
    EXPECT_TRUE(its_error.errors().empty());
}

TEST(server_error, every_kind_has_a_description) {
    EXPECT_STREQ(ERROR_INFO[static_cast<int>(error_code_e::INVALID_PORT)], "Invalid port");
    EXPECT_STREQ(ERROR_INFO[static_cast<int>(error_code_e::INVALID_MULTICAST_GROUP)], "Invalid multicast group");
    EXPECT_STREQ(ERROR_INFO[static_cast<int>(error_code_e::MULTIPLE_ERRORS)], "Multiple errors");
    EXPECT_STREQ(ERROR_INFO[static_cast<int>(error_code_e::NO_CONNECTION_FOR_ENDPOINT)], "No connection for endpoint");
}

TEST(server_error, multiple_errors_keep_their_causes) {
    std::vector<std::exception_ptr> its_causes;
    its_causes.push_back(std::make_exception_ptr(server_error(error_code_e::INVALID_PORT, "0")));
    its_causes.push_back(std::make_exception_ptr(
            boost::system::system_error(boost::asio::error::no_such_device, "239.1.1.1")));

    server_error its_error(its_causes);
    EXPECT_EQ(its_error.code(), error_code_e::MULTIPLE_ERRORS);
    EXPECT_EQ(std::string(its_error.what()), "There are multiple errors (2).");
    ASSERT_EQ(its_error.errors().size(), 2u);
    EXPECT_THROW(std::rethrow_exception(its_error.errors()[0]), server_error);
    EXPECT_THROW(std::rethrow_exception(its_error.errors()[1]), boost::system::system_error);
}

TEST(server_error, is_a_runtime_error) {
    try {
        throw server_error(error_code_e::NO_CONNECTION_FOR_ENDPOINT, "192.168.0.1:40000");
    } catch (const std::runtime_error& e) {
        EXPECT_EQ(std::string(e.what()), "No connection for endpoint: 192.168.0.1:40000");
    }
}

} // namespace udpkit_v1::testing
