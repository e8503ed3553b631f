// Copyright (C) 2014-2025 Bayerische Motoren Werke Aktiengesellschaft (BMW AG)
// This Source Code Form is subject to the terms of the Mozilla Public
// License, v. 2.0. If a copy of the MPL was not distributed with this
// file, You can obtain one at http://mozilla.org/MPL/2.0/.

#ifndef UDPKIT_UDPKIT_HPP_
#define UDPKIT_UDPKIT_HPP_

/**
 * \brief The central udpkit header. Include this to use udpkit.
 */

#include <udpkit/defines.hpp>
#include <udpkit/error.hpp>
#include <udpkit/runtime.hpp>
#include <udpkit/server.hpp>
#include <udpkit/server_delegate.hpp>

namespace udpkit = udpkit_v1;

#endif // UDPKIT_UDPKIT_HPP_
