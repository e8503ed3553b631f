// Copyright (C) 2025 Bayerische Motoren Werke Aktiengesellschaft (BMW AG)
// This Source Code Form is subject to the terms of the Mozilla Public
// License, v. 2.0. If a copy of the MPL was not distributed with this
// file, You can obtain one at http://mozilla.org/MPL/2.0/.

#include "../include/abstract_transport_factory.hpp"
#include "../include/asio_transport_factory.hpp"

namespace udpkit_v1 {

std::shared_ptr<abstract_transport_factory> abstract_transport_factory::get() {
    static auto const factory = std::make_shared<asio_transport_factory>();
    return factory;
}

} // namespace udpkit_v1
