// Copyright (C) 2025 Bayerische Motoren Werke Aktiengesellschaft (BMW AG)
// This Source Code Form is subject to the terms of the Mozilla Public
// License, v. 2.0. If a copy of the MPL was not distributed with this
// file, You can obtain one at http://mozilla.org/MPL/2.0/.

#include <gtest/gtest.h>

#include <fstream>
#include <memory>
#include <string>

#include <boost/filesystem.hpp>

#include <udpkit/defines.hpp>

#include "../../../implementation/configuration/include/configuration_impl.hpp"
#include "../../../implementation/configuration/include/server.hpp"

namespace udpkit_v1::testing {

namespace {
const std::string complete_configuration = R"({
    "logging" : {
        "level" : "debug",
        "console" : "true",
        "file" : { "enable" : "false", "path" : "/tmp/udpkit-test.log" }
    },
    "udp-receive-buffer-size" : "65536",
    "servers" : [
        {
            "name" : "sensor-listener",
            "interface" : "eth0",
            "port" : "30490",
            "multicast" : [ "239.1.1.1", "ff15::1" ],
            "reuse-local-endpoint" : "false",
            "fast-open" : "false"
        },
        {
            "name" : "plain",
            "port" : "30501"
        },
        {
            "port" : "30502"
        },
        {
            "name" : "broken-port",
            "port" : "70000"
        }
    ]
})";
}

struct configuration_test : ::testing::Test {
    void SetUp() override {
        folder_ = boost::filesystem::temp_directory_path()
                / boost::filesystem::unique_path("udpkit-%%%%-%%%%");
        boost::filesystem::create_directories(folder_);
    }

    void TearDown() override {
        boost::system::error_code its_error;
        boost::filesystem::remove_all(folder_, its_error);
    }

    std::string write(const std::string& _name, const std::string& _content) {
        const auto its_path = folder_ / _name;
        std::ofstream its_file(its_path.string());
        its_file << _content;
        return its_path.string();
    }

    boost::filesystem::path folder_;
};

TEST_F(configuration_test, server_entry_is_read) {
    auto its_configuration = std::make_shared<cfg::configuration_impl>(
            write("udpkit.json", complete_configuration));
    EXPECT_TRUE(its_configuration->load("sensor-listener"));

    auto its_server = its_configuration->get_server("sensor-listener");
    ASSERT_NE(its_server, nullptr);
    EXPECT_EQ(its_server->interface_, std::optional<std::string>("eth0"));
    EXPECT_EQ(its_server->port_, 30490);
    ASSERT_TRUE(its_server->multicast_groups_);
    EXPECT_EQ(*its_server->multicast_groups_, std::vector<std::string>({"239.1.1.1", "ff15::1"}));
    EXPECT_FALSE(its_server->reuse_local_endpoint_);
    EXPECT_FALSE(its_server->fast_open_);
}

TEST_F(configuration_test, optional_server_settings_have_defaults) {
    auto its_configuration = std::make_shared<cfg::configuration_impl>(
            write("udpkit.json", complete_configuration));
    its_configuration->load("plain");

    auto its_server = its_configuration->get_server("plain");
    ASSERT_NE(its_server, nullptr);
    EXPECT_FALSE(its_server->interface_);
    EXPECT_EQ(its_server->port_, 30501);
    EXPECT_FALSE(its_server->multicast_groups_);
    EXPECT_TRUE(its_server->reuse_local_endpoint_);
    EXPECT_TRUE(its_server->fast_open_);
}

TEST_F(configuration_test, invalid_entries_are_handled) {
    auto its_configuration = std::make_shared<cfg::configuration_impl>(
            write("udpkit.json", complete_configuration));
    its_configuration->load("plain");

    // Unnamed entries are skipped, out of range ports become invalid
    EXPECT_EQ(its_configuration->get_server_names(),
              std::set<std::string>({"broken-port", "plain", "sensor-listener"}));
    EXPECT_EQ(its_configuration->get_server("broken-port")->port_, 0);
    EXPECT_EQ(its_configuration->get_server("unknown"), nullptr);
}

TEST_F(configuration_test, logging_and_buffer_settings_are_read) {
    auto its_configuration = std::make_shared<cfg::configuration_impl>(
            write("udpkit.json", complete_configuration));
    its_configuration->load("plain");

    EXPECT_EQ(its_configuration->get_loglevel(), logger::level_e::LL_DEBUG);
    EXPECT_TRUE(its_configuration->has_console_log());
    EXPECT_FALSE(its_configuration->has_file_log());
    EXPECT_EQ(its_configuration->get_logfile(), "/tmp/udpkit-test.log");
    EXPECT_EQ(its_configuration->get_udp_receive_buffer_size(), 65536);
}

TEST_F(configuration_test, folder_files_are_merged_first_definition_wins) {
    write("10-base.json", R"({
        "logging" : { "level" : "warning" },
        "servers" : [ { "name" : "a", "port" : "1000" } ]
    })");
    write("20-override.json", R"({
        "logging" : { "level" : "trace" },
        "servers" : [ { "name" : "a", "port" : "2000" }, { "name" : "b", "port" : "3000" } ]
    })");
    write("ignored.txt", "not json");

    auto its_configuration = std::make_shared<cfg::configuration_impl>(folder_.string());
    EXPECT_TRUE(its_configuration->load("a"));

    EXPECT_EQ(its_configuration->get_loglevel(), logger::level_e::LL_WARNING);
    EXPECT_EQ(its_configuration->get_server("a")->port_, 1000);
    EXPECT_EQ(its_configuration->get_server("b")->port_, 3000);
}

TEST_F(configuration_test, unreadable_file_is_reported) {
    auto its_configuration = std::make_shared<cfg::configuration_impl>(
            write("broken.json", "{ \"servers\" : [ "));
    EXPECT_FALSE(its_configuration->load("any"));
    EXPECT_TRUE(its_configuration->get_server_names().empty());
}

TEST_F(configuration_test, missing_configuration_uses_defaults) {
    auto its_configuration = std::make_shared<cfg::configuration_impl>(
            (folder_ / "empty").string());
    EXPECT_TRUE(its_configuration->load("any"));

    EXPECT_EQ(its_configuration->get_loglevel(), logger::level_e::LL_INFO);
    EXPECT_TRUE(its_configuration->has_console_log());
    EXPECT_FALSE(its_configuration->has_file_log());
    EXPECT_EQ(its_configuration->get_udp_receive_buffer_size(), UDPKIT_DEFAULT_UDP_RECEIVE_BUFFER_SIZE);
    EXPECT_TRUE(its_configuration->get_server_names().empty());
}

} // namespace udpkit_v1::testing
