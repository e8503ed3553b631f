// Copyright (C) 2025 Bayerische Motoren Werke Aktiengesellschaft (BMW AG)
// This Source Code Form is subject to the terms of the Mozilla Public
// License, v. 2.0. If a copy of the MPL was not distributed with this
// file, You can obtain one at http://mozilla.org/MPL/2.0/.

#ifndef UDPKIT_V1_TRANSPORT_PARAMETERS_HPP_
#define UDPKIT_V1_TRANSPORT_PARAMETERS_HPP_

#include <cstddef>
#include <optional>

#include <udpkit/defines.hpp>
#include <udpkit/primitive_types.hpp>

#include "../../utility/include/utility.hpp"

namespace udpkit_v1 {

struct transport_parameters {
    port_t port_;
    // Not set: all interfaces
    std::optional<network_interface> interface_;
    bool reuse_local_endpoint_;
    bool fast_open_;
    int receive_buffer_size_;
    std::size_t max_flows_ = UDPKIT_DEFAULT_MAX_FLOWS;
};

} // namespace udpkit_v1

#endif // UDPKIT_V1_TRANSPORT_PARAMETERS_HPP_
