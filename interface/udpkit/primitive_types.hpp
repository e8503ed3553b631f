// Copyright (C) 2014-2025 Bayerische Motoren Werke Aktiengesellschaft (BMW AG)
// This Source Code Form is subject to the terms of the Mozilla Public
// License, v. 2.0. If a copy of the MPL was not distributed with this
// file, You can obtain one at http://mozilla.org/MPL/2.0/.

#ifndef UDPKIT_V1_PRIMITIVE_TYPES_HPP_
#define UDPKIT_V1_PRIMITIVE_TYPES_HPP_

#include <cstdint>
#include <vector>

namespace udpkit_v1 {

typedef uint8_t byte_t;
typedef uint32_t length_t;
typedef uint16_t port_t;

// Process-unique identity of a connection or connection group
typedef uint64_t connection_id_t;

typedef std::vector<byte_t> message_buffer_t;

} // namespace udpkit_v1

#endif // UDPKIT_V1_PRIMITIVE_TYPES_HPP_
