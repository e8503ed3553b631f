// Copyright (C) 2025 Bayerische Motoren Werke Aktiengesellschaft (BMW AG)
// This Source Code Form is subject to the terms of the Mozilla Public
// License, v. 2.0. If a copy of the MPL was not distributed with this
// file, You can obtain one at http://mozilla.org/MPL/2.0/.

#ifndef UDPKIT_V1_SERVER_CONNECTION_GROUP_HPP_
#define UDPKIT_V1_SERVER_CONNECTION_GROUP_HPP_

#include <atomic>
#include <memory>
#include <optional>
#include <string>

#include <boost/asio/ip/address.hpp>

#include <udpkit/endpoint.hpp>
#include <udpkit/primitive_types.hpp>

#include "../../endpoints/include/transport_state.hpp"

namespace udpkit_v1 {

class multicast_membership;
class server_impl;

// The membership of a server in one multicast group.
class server_connection_group
        : public std::enable_shared_from_this<server_connection_group> {
public:
    server_connection_group(const std::shared_ptr<multicast_membership> &_membership,
            const std::weak_ptr<server_impl> &_server);
    ~server_connection_group();

    connection_id_t get_id() const { return id_; }

    const boost::asio::ip::address &get_host() const;

    transport_state_e get_state() const;

    void start();
    void cancel();
    bool is_cancelling() const { return is_cancelling_; }

    bool operator==(const server_connection_group &_other) const {
        return id_ == _other.id_;
    }
    bool operator!=(const server_connection_group &_other) const {
        return id_ != _other.id_;
    }
    bool operator<(const server_connection_group &_other) const {
        return id_ < _other.id_;
    }

private:
    void on_state(transport_state_e _state, const boost::system::error_code &_error);
    void on_message(const std::shared_ptr<message_buffer_t> &_buffer,
            const std::optional<endpoint_t> &_source, bool _is_complete);

private:
    const connection_id_t id_;
    const std::shared_ptr<multicast_membership> membership_;
    const std::weak_ptr<server_impl> server_;

    std::atomic<transport_state_e> state_;
    std::atomic<bool> is_cancelling_;

    std::string instance_name_;
};

} // namespace udpkit_v1

#endif // UDPKIT_V1_SERVER_CONNECTION_GROUP_HPP_
