// Copyright (C) 2025 Bayerische Motoren Werke Aktiengesellschaft (BMW AG)
// This Source Code Form is subject to the terms of the Mozilla Public
// License, v. 2.0. If a copy of the MPL was not distributed with this
// file, You can obtain one at http://mozilla.org/MPL/2.0/.

#include <gtest/gtest.h>

#include <boost/filesystem.hpp>

#include "../../../implementation/utility/include/utility.hpp"

namespace udpkit_v1::testing {

TEST(utility, port_zero_is_invalid) {
    EXPECT_FALSE(utility::is_valid_port(0));
    EXPECT_TRUE(utility::is_valid_port(1));
    EXPECT_TRUE(utility::is_valid_port(30490));
    EXPECT_TRUE(utility::is_valid_port(65535));
}

TEST(utility, multicast_addresses_are_recognized) {
    EXPECT_TRUE(utility::is_valid_multicast_address("224.0.0.1"));
    EXPECT_TRUE(utility::is_valid_multicast_address("239.255.255.250"));
    EXPECT_TRUE(utility::is_valid_multicast_address("ff02::1"));
    EXPECT_TRUE(utility::is_valid_multicast_address("ff15::efc0:fffa"));

    EXPECT_FALSE(utility::is_valid_multicast_address("192.168.0.1"));
    EXPECT_FALSE(utility::is_valid_multicast_address("223.255.255.255"));
    EXPECT_FALSE(utility::is_valid_multicast_address("240.0.0.1"));
    EXPECT_FALSE(utility::is_valid_multicast_address("fe80::1"));
    EXPECT_FALSE(utility::is_valid_multicast_address("239.1.1"));
    EXPECT_FALSE(utility::is_valid_multicast_address("eth0"));
    EXPECT_FALSE(utility::is_valid_multicast_address(""));
}

TEST(utility, loopback_interface_is_resolved_by_name) {
    auto its_interface = utility::resolve_interface("lo");
    if (!its_interface)
        GTEST_SKIP() << "No loopback interface named lo";

    EXPECT_EQ(its_interface->name_, "lo");
    EXPECT_NE(its_interface->index_, 0u);
    ASSERT_TRUE(its_interface->address_);
    EXPECT_TRUE(its_interface->address_->is_v4());
    EXPECT_TRUE(its_interface->address_->is_loopback());
}

TEST(utility, loopback_interface_is_resolved_by_address) {
    auto its_interface = utility::resolve_interface("127.0.0.1");
    if (!its_interface)
        GTEST_SKIP() << "No interface carries 127.0.0.1";

    EXPECT_FALSE(its_interface->name_.empty());
    ASSERT_TRUE(its_interface->address_);
    EXPECT_EQ(its_interface->address_->to_string(), "127.0.0.1");
}

TEST(utility, unknown_interface_is_not_resolved) {
    EXPECT_FALSE(utility::resolve_interface(""));
    EXPECT_FALSE(utility::resolve_interface("udpkit-none0"));
    EXPECT_FALSE(utility::resolve_interface("192.0.2.123"));
}

TEST(utility, files_and_folders_are_distinguished) {
    const auto its_folder = boost::filesystem::temp_directory_path();
    const auto its_file = its_folder / boost::filesystem::unique_path("udpkit-%%%%-%%%%.json");
    {
        boost::filesystem::ofstream its_stream(its_file);
        its_stream << "{}";
    }

    EXPECT_TRUE(utility::is_folder(its_folder.string()));
    EXPECT_FALSE(utility::is_file(its_folder.string()));
    EXPECT_TRUE(utility::is_file(its_file.string()));
    EXPECT_FALSE(utility::is_folder(its_file.string()));
    EXPECT_FALSE(utility::is_file((its_folder / "udpkit-does-not-exist").string()));

    boost::system::error_code its_error;
    boost::filesystem::remove(its_file, its_error);
}

} // namespace udpkit_v1::testing
