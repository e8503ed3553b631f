// Copyright (C) 2014-2025 Bayerische Motoren Werke Aktiengesellschaft (BMW AG)
// This Source Code Form is subject to the terms of the Mozilla Public
// License, v. 2.0. If a copy of the MPL was not distributed with this
// file, You can obtain one at http://mozilla.org/MPL/2.0/.

#ifndef UDPKIT_V1_DEFINES_HPP_
#define UDPKIT_V1_DEFINES_HPP_

#define UDPKIT_ENV_CONFIGURATION                "UDPKIT_CONFIGURATION"
#define UDPKIT_ENV_SERVER_NAME                  "UDPKIT_SERVER_NAME"

#define UDPKIT_DEFAULT_CONFIGURATION_FILE       "/etc/udpkit.json"
#define UDPKIT_LOCAL_CONFIGURATION_FILE         "./udpkit.json"

// Largest datagram a multicast membership delivers; larger ones are rejected
#define UDPKIT_MAX_MULTICAST_MESSAGE_SIZE       1500

// Largest datagram the unicast listener reads in one go
#define UDPKIT_MAX_UDP_MESSAGE_SIZE             65507

// Datagrams buffered per peer flow before the oldest is dropped
#define UDPKIT_DEFAULT_FLOW_QUEUE_LIMIT         1024

// Peer flows a listener tracks before the least recently active is cancelled
#define UDPKIT_DEFAULT_MAX_FLOWS                1024

#define UDPKIT_DEFAULT_UDP_RECEIVE_BUFFER_SIZE  1703936

#endif // UDPKIT_V1_DEFINES_HPP_
