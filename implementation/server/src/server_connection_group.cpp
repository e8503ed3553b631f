// Copyright (C) 2025 Bayerische Motoren Werke Aktiengesellschaft (BMW AG)
// This Source Code Form is subject to the terms of the Mozilla Public
// License, v. 2.0. If a copy of the MPL was not distributed with this
// file, You can obtain one at http://mozilla.org/MPL/2.0/.

#include <udpkit/defines.hpp>
#include <udpkit/internal/logger.hpp>

#include "../include/server_connection_group.hpp"
#include "../include/server_impl.hpp"
#include "../../endpoints/include/multicast_membership.hpp"

namespace udpkit_v1 {

namespace {
std::atomic<connection_id_t> next_connection_group_id(1);
}

server_connection_group::server_connection_group(
        const std::shared_ptr<multicast_membership> &_membership,
        const std::weak_ptr<server_impl> &_server)
    : id_(next_connection_group_id++),
      membership_(_membership),
      server_(_server),
      state_(transport_state_e::TS_SETUP),
      is_cancelling_(false) {

    instance_name_ = "scg#" + std::to_string(id_) + "::"
            + _membership->get_group().to_string() + "::";
}

server_connection_group::~server_connection_group() {
    UDPKIT_DEBUG << instance_name_ << __func__;
}

const boost::asio::ip::address &server_connection_group::get_host() const {
    return membership_->get_group();
}

transport_state_e server_connection_group::get_state() const {
    return state_;
}

void server_connection_group::start() {
    auto its_me = shared_from_this();

    // Registered once, the membership re-arms it for every datagram
    membership_->set_receive_handler(UDPKIT_MAX_MULTICAST_MESSAGE_SIZE, true,
        [its_me](const std::shared_ptr<message_buffer_t> &_buffer,
                const std::optional<endpoint_t> &_source, bool _is_complete) {
            its_me->on_message(_buffer, _source, _is_complete);
        });
    membership_->set_state_handler(
        [its_me](transport_state_e _state, const boost::system::error_code &_error) {
            its_me->on_state(_state, _error);
        });
    membership_->start();
}

void server_connection_group::cancel() {
    UDPKIT_INFO << instance_name_ << __func__;
    is_cancelling_ = true;
    membership_->cancel();
}

void server_connection_group::on_state(transport_state_e _state,
        const boost::system::error_code &_error) {
    state_ = _state;

    switch (_state) {
    case transport_state_e::TS_SETUP:
    case transport_state_e::TS_WAITING:
        UDPKIT_DEBUG << instance_name_ << __func__ << ": " << _state
                << (_error ? ", " + _error.message() : "");
        return;
    case transport_state_e::TS_FAILED:
        UDPKIT_ERROR << instance_name_ << __func__ << ": " << _state
                << ", " << _error.message();
        break;
    default:
        UDPKIT_INFO << instance_name_ << __func__ << ": " << _state;
        break;
    }

    auto its_server = server_.lock();
    if (its_server)
        its_server->on_connection_group_state(shared_from_this(), _state, _error);
}

void server_connection_group::on_message(
        const std::shared_ptr<message_buffer_t> &_buffer,
        const std::optional<endpoint_t> &_source, bool _is_complete) {

    if (!_is_complete || !_buffer || _buffer->empty()) {
        UDPKIT_DEBUG << instance_name_ << __func__
                << ": dropped incomplete or empty datagram";
        return;
    }

    auto its_server = server_.lock();
    if (its_server)
        its_server->on_connection_group_message(shared_from_this(), _buffer, _source);
}

} // namespace udpkit_v1
