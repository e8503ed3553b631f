// Copyright (C) 2025 Bayerische Motoren Werke Aktiengesellschaft (BMW AG)
// This Source Code Form is subject to the terms of the Mozilla Public
// License, v. 2.0. If a copy of the MPL was not distributed with this
// file, You can obtain one at http://mozilla.org/MPL/2.0/.

#include <boost/asio/error.hpp>

#include <udpkit/internal/logger.hpp>

#include "../include/server_connection.hpp"
#include "../include/server_impl.hpp"
#include "../../endpoints/include/udp_flow.hpp"

namespace udpkit_v1 {

namespace {
std::atomic<connection_id_t> next_connection_id(1);
}

server_connection::server_connection(const std::shared_ptr<udp_flow> &_flow,
        const std::weak_ptr<server_impl> &_server)
    : id_(next_connection_id++),
      flow_(_flow),
      server_(_server),
      state_(transport_state_e::TS_SETUP) {

    instance_name_ = "sc#" + std::to_string(id_) + "::"
            + get_host() + ":" + std::to_string(get_port()) + "::";
}

server_connection::~server_connection() {
    UDPKIT_DEBUG << instance_name_ << __func__;
}

const endpoint_t &server_connection::get_remote_endpoint() const {
    return flow_->get_remote_endpoint();
}

std::string server_connection::get_host() const {
    return flow_->get_remote_endpoint().address().to_string();
}

port_t server_connection::get_port() const {
    return flow_->get_remote_endpoint().port();
}

transport_state_e server_connection::get_state() const {
    return state_;
}

void server_connection::start() {
    auto its_me = shared_from_this();
    flow_->set_state_handler(
        [its_me](transport_state_e _state, const boost::system::error_code &_error) {
            its_me->on_state(_state, _error);
        });
    flow_->start();
}

void server_connection::cancel() {
    UDPKIT_DEBUG << instance_name_ << __func__;
    flow_->cancel();
}

void server_connection::receive() {
    auto its_me = shared_from_this();
    flow_->async_receive_message(
        [its_me](const boost::system::error_code &_error,
                const std::shared_ptr<message_buffer_t> &_buffer,
                bool _is_complete) {
            its_me->on_message(_error, _buffer, _is_complete);
        });
}

void server_connection::on_state(transport_state_e _state,
        const boost::system::error_code &_error) {
    state_ = _state;

    switch (_state) {
    case transport_state_e::TS_SETUP:
    case transport_state_e::TS_WAITING:
        UDPKIT_DEBUG << instance_name_ << __func__ << ": " << _state
                << (_error ? ", " + _error.message() : "");
        // No bookkeeping change
        return;
    case transport_state_e::TS_FAILED:
        UDPKIT_WARNING << instance_name_ << __func__ << ": " << _state
                << ", " << _error.message();
        break;
    default:
        UDPKIT_DEBUG << instance_name_ << __func__ << ": " << _state;
        break;
    }

    auto its_server = server_.lock();
    if (its_server)
        its_server->on_connection_state(shared_from_this(), _state, _error);
}

void server_connection::on_message(const boost::system::error_code &_error,
        const std::shared_ptr<message_buffer_t> &_buffer, bool _is_complete) {

    if (_error) {
        if (_error == boost::asio::error::operation_aborted) {
            UDPKIT_DEBUG << instance_name_ << __func__ << ": receive aborted";
        } else {
            UDPKIT_ERROR << instance_name_ << __func__ << ": "
                    << _error.message();
        }
        return;
    }

    if (!_is_complete || !_buffer || _buffer->empty()) {
        UDPKIT_DEBUG << instance_name_ << __func__
                << ": incomplete or empty datagram, receive stopped";
        return;
    }

    auto its_server = server_.lock();
    if (its_server)
        its_server->on_connection_message(shared_from_this(), _buffer);
}

} // namespace udpkit_v1
