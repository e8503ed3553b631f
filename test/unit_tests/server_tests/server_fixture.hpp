// Copyright (C) 2025 Bayerische Motoren Werke Aktiengesellschaft (BMW AG)
// This Source Code Form is subject to the terms of the Mozilla Public
// License, v. 2.0. If a copy of the MPL was not distributed with this
// file, You can obtain one at http://mozilla.org/MPL/2.0/.

#ifndef UDPKIT_V1_SERVER_FIXTURE_
#define UDPKIT_V1_SERVER_FIXTURE_

#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include <boost/asio/io_context.hpp>

#include <udpkit/error.hpp>

#include "../../../implementation/server/include/server_impl.hpp"
#include "fake_transport_factory.hpp"
#include "mock_server_delegate.hpp"

#include <gtest/gtest.h>

namespace udpkit_v1::testing {

struct received_datagram {
    message_buffer_t payload_;
    std::optional<endpoint_t> source_;
};

struct server_fixture : ::testing::Test {
    void SetUp() override {
        factory_ = std::make_shared<fake_transport_factory>();
        delegate_ = std::make_shared<::testing::NiceMock<mock_server_delegate>>();

        ON_CALL(*delegate_, on_message_received)
            .WillByDefault([this](server&, const byte_t* _data, length_t _length,
                                  const std::optional<endpoint_t>& _source) {
                received_.push_back({message_buffer_t(_data, _data + _length), _source});
            });
    }

    void TearDown() override {
        server_.reset();
        poll();
    }

    void create_server(const std::optional<std::vector<std::string>>& _groups = std::nullopt, port_t _port = 30490) {
        server_ = std::make_shared<server_impl>(io_, std::nullopt, _port, _groups, factory_);
        server_->set_delegate(delegate_);
    }

    // Runs everything the transport fakes triggered so far
    void poll() {
        io_.restart();
        io_.poll();
    }

    // Starts a unicast server and makes its listener ready
    std::shared_ptr<fake_listener> start_unicast() {
        server_->start_listening();
        auto its_listener = factory_->last_listener();
        its_listener->report(transport_state_e::TS_READY);
        poll();
        return its_listener;
    }

    std::shared_ptr<fake_flow> connect(const std::shared_ptr<fake_listener>& _listener, const endpoint_t& _remote) {
        auto its_flow = _listener->connect(_remote);
        poll();
        return its_flow;
    }

    void make_ready(const std::string& _group) {
        factory_->membership(_group)->report(transport_state_e::TS_READY);
        poll();
    }

    static void expect_server_error(const std::function<void()>& _operation, error_code_e _code) {
        try {
            _operation();
            ADD_FAILURE() << "server_error expected";
        } catch (const server_error& e) {
            EXPECT_EQ(e.code(), _code) << e.what();
        }
    }

    boost::asio::io_context io_;
    std::shared_ptr<fake_transport_factory> factory_;
    std::shared_ptr<::testing::NiceMock<mock_server_delegate>> delegate_;
    std::shared_ptr<server_impl> server_;
    std::vector<received_datagram> received_;
};

}

#endif
