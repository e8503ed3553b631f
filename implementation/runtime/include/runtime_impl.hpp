// Copyright (C) 2014-2025 Bayerische Motoren Werke Aktiengesellschaft (BMW AG)
// This Source Code Form is subject to the terms of the Mozilla Public
// License, v. 2.0. If a copy of the MPL was not distributed with this
// file, You can obtain one at http://mozilla.org/MPL/2.0/.

#ifndef UDPKIT_V1_RUNTIME_IMPL_HPP_
#define UDPKIT_V1_RUNTIME_IMPL_HPP_

#include <udpkit/runtime.hpp>
#include <mutex>

namespace udpkit_v1 {

class configuration;

class runtime_impl: public runtime {
public:
    static std::shared_ptr<runtime> get();

    virtual ~runtime_impl();

    std::shared_ptr<server> create_server(boost::asio::io_context &_io,
            const std::string &_name);
    std::shared_ptr<server> create_server(boost::asio::io_context &_io,
            const std::optional<std::string> &_interface, port_t _port,
            const std::optional<std::vector<std::string>> &_multicast_groups);

private:
    std::shared_ptr<configuration> get_configuration(const std::string &_name);

private:
    std::shared_ptr<configuration> configuration_;
    std::mutex configuration_mutex_;
};

} // namespace udpkit_v1

#endif // UDPKIT_V1_RUNTIME_IMPL_HPP_
