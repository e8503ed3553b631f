// Copyright (C) 2014-2025 Bayerische Motoren Werke Aktiengesellschaft (BMW AG)
// This Source Code Form is subject to the terms of the Mozilla Public
// License, v. 2.0. If a copy of the MPL was not distributed with this
// file, You can obtain one at http://mozilla.org/MPL/2.0/.

#include <cstdlib>

#include <udpkit/defines.hpp>
#include <udpkit/internal/logger.hpp>

#include "../include/runtime_impl.hpp"
#include "../../configuration/include/configuration_impl.hpp"
#include "../../configuration/include/server.hpp"
#include "../../endpoints/include/abstract_transport_factory.hpp"
#include "../../server/include/server_impl.hpp"

namespace udpkit_v1 {

std::shared_ptr<runtime> runtime_impl::get() {
    static std::shared_ptr<runtime> the_runtime_ = std::make_shared<runtime_impl>();
    return the_runtime_;
}

runtime_impl::~runtime_impl() {
}

std::shared_ptr<configuration>
runtime_impl::get_configuration(const std::string &_name) {
    std::lock_guard<std::mutex> its_lock(configuration_mutex_);
    if (!configuration_) {
        auto its_configuration = std::make_shared<cfg::configuration_impl>();
        its_configuration->load(_name);
        configuration_ = its_configuration;
    }
    return configuration_;
}

std::shared_ptr<server> runtime_impl::create_server(
        boost::asio::io_context &_io, const std::string &_name) {

    std::string its_name(_name);
    if (its_name.empty()) {
        const char *its_env = getenv(UDPKIT_ENV_SERVER_NAME);
        if (nullptr != its_env)
            its_name = its_env;
    }

    auto its_configuration = get_configuration(its_name);
    auto its_server_cfg = its_configuration->get_server(its_name);
    if (!its_server_cfg) {
        UDPKIT_ERROR << "runtime::" << __func__ << ": No configuration for server \""
                << its_name << "\"";
        return nullptr;
    }

    auto its_server = std::make_shared<server_impl>(_io,
            its_server_cfg->interface_, its_server_cfg->port_,
            its_server_cfg->multicast_groups_, abstract_transport_factory::get());
    its_server->set_local_endpoint_reuse(its_server_cfg->reuse_local_endpoint_);
    its_server->set_fast_open(its_server_cfg->fast_open_);
    its_server->set_receive_buffer_size(
            its_configuration->get_udp_receive_buffer_size());

    UDPKIT_INFO << "runtime::" << __func__ << ": Created server \""
            << its_name << "\"";
    return its_server;
}

std::shared_ptr<server> runtime_impl::create_server(
        boost::asio::io_context &_io,
        const std::optional<std::string> &_interface, port_t _port,
        const std::optional<std::vector<std::string>> &_multicast_groups) {

    // Initializes the logger
    auto its_configuration = get_configuration("");

    auto its_server = std::make_shared<server_impl>(_io, _interface, _port,
            _multicast_groups, abstract_transport_factory::get());
    its_server->set_receive_buffer_size(
            its_configuration->get_udp_receive_buffer_size());
    return its_server;
}

} // namespace udpkit_v1
