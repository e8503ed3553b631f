// Copyright (C) 2014-2025 Bayerische Motoren Werke Aktiengesellschaft (BMW AG)
// This Source Code Form is subject to the terms of the Mozilla Public
// License, v. 2.0. If a copy of the MPL was not distributed with this
// file, You can obtain one at http://mozilla.org/MPL/2.0/.

#ifndef UDPKIT_V1_ENDPOINT_HPP_
#define UDPKIT_V1_ENDPOINT_HPP_

#include <boost/asio/ip/udp.hpp>

namespace udpkit_v1 {

typedef boost::asio::ip::udp::endpoint endpoint_t;

} // namespace udpkit_v1

#endif // UDPKIT_V1_ENDPOINT_HPP_
