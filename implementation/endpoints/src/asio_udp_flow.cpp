// Copyright (C) 2025 Bayerische Motoren Werke Aktiengesellschaft (BMW AG)
// This Source Code Form is subject to the terms of the Mozilla Public
// License, v. 2.0. If a copy of the MPL was not distributed with this
// file, You can obtain one at http://mozilla.org/MPL/2.0/.

#include <atomic>
#include <functional>

#include <boost/asio/error.hpp>
#include <boost/asio/post.hpp>

#include <udpkit/internal/logger.hpp>

#include "../include/asio_udp_flow.hpp"
#include "../include/asio_udp_listener.hpp"

namespace udpkit_v1 {

asio_udp_flow::asio_udp_flow(boost::asio::io_context &_io,
        const std::weak_ptr<asio_udp_listener> &_listener,
        const endpoint_t &_remote, std::size_t _queue_limit)
    : strand_(_io),
      listener_(_listener),
      remote_(_remote),
      queue_limit_(_queue_limit),
      state_(transport_state_e::TS_SETUP),
      dropped_(0) {

    static std::atomic<unsigned> instance_count = 0;
    instance_name_ = "auf#" + std::to_string(++instance_count) + "::"
            + _remote.address().to_string() + ":"
            + std::to_string(_remote.port()) + "::";

    UDPKIT_DEBUG << instance_name_ << __func__;
}

asio_udp_flow::~asio_udp_flow() {
    UDPKIT_DEBUG << instance_name_ << __func__ << ": dropped=" << dropped_;
}

const endpoint_t &asio_udp_flow::get_remote_endpoint() const {
    return remote_;
}

void asio_udp_flow::set_state_handler(state_handler_t _handler) {
    std::scoped_lock its_lock(sync_);
    state_handler_ = std::move(_handler);
}

void asio_udp_flow::start() {
    boost::asio::post(strand_,
            std::bind(&asio_udp_flow::start_cbk, shared_from_this()));
}

void asio_udp_flow::start_cbk() {
    {
        std::scoped_lock its_lock(sync_);
        if (state_ != transport_state_e::TS_SETUP) {
            UDPKIT_DEBUG << instance_name_ << __func__
                    << ": ignored, state=" << state_;
            return;
        }
        state_ = transport_state_e::TS_READY;
    }
    report(transport_state_e::TS_READY, boost::system::error_code());

    std::scoped_lock its_lock(sync_);
    deliver_unlocked();
}

void asio_udp_flow::cancel() {
    boost::asio::post(strand_,
            std::bind(&asio_udp_flow::cancel_cbk, shared_from_this(), true));
}

void asio_udp_flow::cancel_cbk(bool _notify_listener) {
    {
        std::scoped_lock its_lock(sync_);
        if (is_terminal(state_))
            return;

        state_ = transport_state_e::TS_CANCELLED;
        abort_receive_unlocked();
        queue_.clear();
    }

    if (_notify_listener) {
        auto its_listener = listener_.lock();
        if (its_listener)
            its_listener->remove_flow(remote_);
    }

    report(transport_state_e::TS_CANCELLED, boost::system::error_code());
}

void asio_udp_flow::fail(const boost::system::error_code &_error) {
    boost::asio::post(strand_,
            std::bind(&asio_udp_flow::fail_cbk, shared_from_this(), _error));
}

void asio_udp_flow::fail_cbk(const boost::system::error_code &_error) {
    {
        std::scoped_lock its_lock(sync_);
        if (is_terminal(state_))
            return;

        state_ = transport_state_e::TS_FAILED;
        abort_receive_unlocked();
        queue_.clear();
    }
    report(transport_state_e::TS_FAILED, _error);
}

void asio_udp_flow::async_receive_message(receive_handler_t _handler) {
    std::scoped_lock its_lock(sync_);
    if (is_terminal(state_)) {
        boost::asio::post(strand_, [_handler]() {
            _handler(boost::asio::error::operation_aborted, nullptr, false);
        });
        return;
    }

    if (receive_handler_) {
        UDPKIT_WARNING << instance_name_ << __func__
                << ": receive already in progress";
        boost::asio::post(strand_, [_handler]() {
            _handler(boost::asio::error::in_progress, nullptr, false);
        });
        return;
    }

    receive_handler_ = std::move(_handler);
    deliver_unlocked();
}

void asio_udp_flow::enqueue(const std::shared_ptr<message_buffer_t> &_buffer) {
    std::scoped_lock its_lock(sync_);
    if (is_terminal(state_))
        return;

    queue_.push_back(_buffer);
    if (queue_.size() > queue_limit_) {
        queue_.pop_front();
        if (dropped_++ == 0) {
            UDPKIT_WARNING << instance_name_ << __func__
                    << ": queue limit (" << queue_limit_
                    << ") exceeded, dropping oldest datagrams";
        }
    }

    deliver_unlocked();
}

void asio_udp_flow::deliver_unlocked() {
    // The caller must hold the lock

    if (state_ != transport_state_e::TS_READY
            || !receive_handler_ || queue_.empty())
        return;

    auto its_buffer = queue_.front();
    queue_.pop_front();

    receive_handler_t its_handler;
    its_handler.swap(receive_handler_);
    boost::asio::post(strand_, [its_handler, its_buffer]() {
        its_handler(boost::system::error_code(), its_buffer, true);
    });
}

void asio_udp_flow::abort_receive_unlocked() {
    // The caller must hold the lock

    if (receive_handler_) {
        receive_handler_t its_handler;
        its_handler.swap(receive_handler_);
        boost::asio::post(strand_, [its_handler]() {
            its_handler(boost::asio::error::operation_aborted, nullptr, false);
        });
    }
}

void asio_udp_flow::report(transport_state_e _state,
        const boost::system::error_code &_error) {

    UDPKIT_DEBUG << instance_name_ << __func__ << ": " << _state
            << (_error ? ", " + _error.message() : "");

    state_handler_t its_handler;
    {
        std::scoped_lock its_lock(sync_);
        its_handler = state_handler_;
        if (is_terminal(_state))
            state_handler_ = nullptr;
    }

    if (its_handler)
        its_handler(_state, _error);
}

} // namespace udpkit_v1
