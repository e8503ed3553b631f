// Copyright (C) 2014-2025 Bayerische Motoren Werke Aktiengesellschaft (BMW AG)
// This Source Code Form is subject to the terms of the Mozilla Public
// License, v. 2.0. If a copy of the MPL was not distributed with this
// file, You can obtain one at http://mozilla.org/MPL/2.0/.

#ifndef UDPKIT_V1_CFG_SERVER_HPP_
#define UDPKIT_V1_CFG_SERVER_HPP_

#include <optional>
#include <string>
#include <vector>

#include <udpkit/primitive_types.hpp>

namespace udpkit_v1 {
namespace cfg {

struct server {
    server() : port_(0), reuse_local_endpoint_(true), fast_open_(true) {}

    std::string name_;
    std::optional<std::string> interface_;
    port_t port_;

    // Not set: unicast listener
    std::optional<std::vector<std::string>> multicast_groups_;

    bool reuse_local_endpoint_;
    bool fast_open_;
};

} // namespace cfg
} // namespace udpkit_v1

#endif // UDPKIT_V1_CFG_SERVER_HPP_
