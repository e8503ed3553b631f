// Copyright (C) 2025 Bayerische Motoren Werke Aktiengesellschaft (BMW AG)
// This Source Code Form is subject to the terms of the Mozilla Public
// License, v. 2.0. If a copy of the MPL was not distributed with this
// file, You can obtain one at http://mozilla.org/MPL/2.0/.

#ifndef UDPKIT_V1_MOCK_SERVER_DELEGATE_
#define UDPKIT_V1_MOCK_SERVER_DELEGATE_

#include <udpkit/server.hpp>
#include <udpkit/server_delegate.hpp>

#include <gmock/gmock.h>

namespace udpkit_v1::testing {

class mock_server_delegate : public server_delegate {
public:
    MOCK_METHOD(void, on_started_listening, (server&), (override));
    MOCK_METHOD(void, on_stopped_listening, (server&, const boost::system::error_code&), (override));
    MOCK_METHOD(void, on_message_received, (server&, const byte_t*, length_t, const std::optional<endpoint_t>&),
                (override));
};

}

#endif
