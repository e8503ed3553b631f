// Copyright (C) 2025 Bayerische Motoren Werke Aktiengesellschaft (BMW AG)
// This Source Code Form is subject to the terms of the Mozilla Public
// License, v. 2.0. If a copy of the MPL was not distributed with this
// file, You can obtain one at http://mozilla.org/MPL/2.0/.

#ifndef UDPKIT_V1_SERVER_CONNECTION_HPP_
#define UDPKIT_V1_SERVER_CONNECTION_HPP_

#include <atomic>
#include <memory>
#include <string>

#include <udpkit/endpoint.hpp>
#include <udpkit/primitive_types.hpp>

#include "../../endpoints/include/transport_state.hpp"

namespace udpkit_v1 {

class server_impl;
class udp_flow;

// One unicast peer of a server. Connections are compared by identity, two
// connections of the same remote endpoint are distinct.
class server_connection : public std::enable_shared_from_this<server_connection> {
public:
    server_connection(const std::shared_ptr<udp_flow> &_flow,
            const std::weak_ptr<server_impl> &_server);
    ~server_connection();

    connection_id_t get_id() const { return id_; }

    const endpoint_t &get_remote_endpoint() const;
    std::string get_host() const;
    port_t get_port() const;

    transport_state_e get_state() const;

    void start();
    void cancel();

    // Requests the next datagram from the peer
    void receive();

    bool operator==(const server_connection &_other) const {
        return id_ == _other.id_;
    }
    bool operator!=(const server_connection &_other) const {
        return id_ != _other.id_;
    }
    bool operator<(const server_connection &_other) const {
        return id_ < _other.id_;
    }

private:
    void on_state(transport_state_e _state, const boost::system::error_code &_error);
    void on_message(const boost::system::error_code &_error,
            const std::shared_ptr<message_buffer_t> &_buffer, bool _is_complete);

private:
    const connection_id_t id_;
    const std::shared_ptr<udp_flow> flow_;
    const std::weak_ptr<server_impl> server_;

    std::atomic<transport_state_e> state_;

    std::string instance_name_;
};

} // namespace udpkit_v1

#endif // UDPKIT_V1_SERVER_CONNECTION_HPP_
