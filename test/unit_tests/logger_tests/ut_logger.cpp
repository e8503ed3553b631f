// Copyright (C) 2025 Bayerische Motoren Werke Aktiengesellschaft (BMW AG)
// This Source Code Form is subject to the terms of the Mozilla Public
// License, v. 2.0. If a copy of the MPL was not distributed with this
// file, You can obtain one at http://mozilla.org/MPL/2.0/.

#include <gtest/gtest.h>

#include <fstream>
#include <memory>
#include <sstream>
#include <string>
#include <vector>

#include <boost/filesystem.hpp>

#include <udpkit/internal/logger.hpp>

#include "../../../implementation/configuration/include/configuration_impl.hpp"

namespace udpkit_v1::testing {

struct logger_test : ::testing::Test {
    void SetUp() override {
        folder_ = boost::filesystem::temp_directory_path()
                / boost::filesystem::unique_path("udpkit-log-%%%%-%%%%");
        boost::filesystem::create_directories(folder_);
    }

    void TearDown() override {
        // Back to console logging at info level
        auto its_defaults = std::make_shared<cfg::configuration_impl>((folder_ / "none").string());
        its_defaults->load("any");

        boost::system::error_code its_error;
        boost::filesystem::remove_all(folder_, its_error);
    }

    void use_log_file(const std::string& _level) {
        const auto its_config = folder_ / "udpkit.json";
        std::ofstream its_file(its_config.string());
        its_file << R"({ "logging" : { "level" : ")" << _level << R"(", "console" : "false",
                         "file" : { "enable" : "true", "path" : ")"
                 << log_file().string() << R"(" } } })";
        its_file.close();

        auto its_configuration = std::make_shared<cfg::configuration_impl>(its_config.string());
        ASSERT_TRUE(its_configuration->load("any"));
    }

    std::vector<std::string> read_lines() const {
        std::vector<std::string> its_lines;
        std::ifstream its_file(log_file().string());
        std::string its_line;
        while (std::getline(its_file, its_line))
            its_lines.push_back(its_line);
        return its_lines;
    }

    boost::filesystem::path log_file() const { return folder_ / "udpkit.log"; }

    boost::filesystem::path folder_;
};

TEST_F(logger_test, level_names_are_mapped) {
    EXPECT_EQ(logger::to_level("error"), logger::level_e::LL_ERROR);
    EXPECT_EQ(logger::to_level("warning"), logger::level_e::LL_WARNING);
    EXPECT_EQ(logger::to_level("info"), logger::level_e::LL_INFO);
    EXPECT_EQ(logger::to_level("debug"), logger::level_e::LL_DEBUG);
    EXPECT_EQ(logger::to_level("trace"), logger::level_e::LL_TRACE);
    EXPECT_EQ(logger::to_level("none"), logger::level_e::LL_NONE);
    EXPECT_EQ(logger::to_level("loud"), logger::level_e::LL_INFO);
}

TEST_F(logger_test, lines_below_the_level_are_dropped) {
    use_log_file("warning");

    UDPKIT_ERROR << "first " << 1;
    UDPKIT_INFO << "hidden";
    UDPKIT_DEBUG << "hidden";
    UDPKIT_WARNING << "second";

    const auto its_lines = read_lines();
    ASSERT_EQ(its_lines.size(), 2u);
    EXPECT_NE(its_lines[0].find(" [error] first 1"), std::string::npos) << its_lines[0];
    EXPECT_NE(its_lines[1].find(" [warning] second"), std::string::npos) << its_lines[1];

    // YYYY-MM-DD hh:mm:ss.uuuuuu
    ASSERT_GE(its_lines[0].size(), 26u);
    EXPECT_EQ(its_lines[0][4], '-');
    EXPECT_EQ(its_lines[0][10], ' ');
    EXPECT_EQ(its_lines[0][13], ':');
    EXPECT_EQ(its_lines[0][19], '.');
}

TEST_F(logger_test, none_disables_logging) {
    use_log_file("none");

    UDPKIT_ERROR << "hidden";

    EXPECT_TRUE(read_lines().empty());
}

} // namespace udpkit_v1::testing
