// Copyright (C) 2025 Bayerische Motoren Werke Aktiengesellschaft (BMW AG)
// This Source Code Form is subject to the terms of the Mozilla Public
// License, v. 2.0. If a copy of the MPL was not distributed with this
// file, You can obtain one at http://mozilla.org/MPL/2.0/.

#include <cerrno>
#include <cstring>
#include <functional>
#include <tuple>

#include <sys/socket.h>

#include <boost/asio/buffer.hpp>
#include <boost/asio/error.hpp>
#include <boost/asio/ip/v6_only.hpp>
#include <boost/asio/post.hpp>

#include <udpkit/defines.hpp>
#include <udpkit/internal/logger.hpp>

#include "../include/asio_udp_flow.hpp"
#include "../include/asio_udp_listener.hpp"

namespace udpkit_v1 {

namespace {

// Dual-stack sockets report IPv4 peers as v4-mapped IPv6 addresses
endpoint_t normalize(const endpoint_t &_endpoint) {
    const auto &its_address(_endpoint.address());
    if (its_address.is_v6() && its_address.to_v6().is_v4_mapped()) {
        return endpoint_t(boost::asio::ip::make_address_v4(
                boost::asio::ip::v4_mapped, its_address.to_v6()), _endpoint.port());
    }
    return _endpoint;
}

} // namespace

asio_udp_listener::asio_udp_listener(boost::asio::io_context &_io,
        const transport_parameters &_parameters)
    : io_(_io),
      strand_(_io),
      parameters_(_parameters),
      state_(transport_state_e::TS_SETUP),
      is_started_(false),
      recv_buffer_(UDPKIT_MAX_UDP_MESSAGE_SIZE, 0),
      activity_counter_(0),
      lifecycle_idx_(0) {

    static std::atomic<unsigned> instance_count = 0;
    instance_name_ = "aul#" + std::to_string(++instance_count) + "::";

    UDPKIT_INFO << instance_name_ << __func__ << ": port=" << parameters_.port_
            << ", interface="
            << (parameters_.interface_ ? parameters_.interface_->name_ : "any")
            << ", reuse=" << std::boolalpha << parameters_.reuse_local_endpoint_
            << ", fast_open=" << parameters_.fast_open_;
}

asio_udp_listener::~asio_udp_listener() {
    UDPKIT_INFO << instance_name_ << __func__ << ": lifecycle_idx="
            << lifecycle_idx_.load();
}

void asio_udp_listener::set_state_handler(state_handler_t _handler) {
    std::scoped_lock its_lock(sync_);
    state_handler_ = std::move(_handler);
}

void asio_udp_listener::set_new_connection_handler(
        new_connection_handler_t _handler) {
    std::scoped_lock its_lock(sync_);
    new_connection_handler_ = std::move(_handler);
}

endpoint_t asio_udp_listener::get_local_endpoint() const {
    std::scoped_lock its_lock(sync_);
    return local_;
}

void asio_udp_listener::start() {
    boost::asio::post(strand_,
            std::bind(&asio_udp_listener::start_cbk, shared_from_this()));
}

void asio_udp_listener::start_cbk() {
    boost::system::error_code its_error;
    {
        std::scoped_lock its_lock(sync_);
        if (state_ == transport_state_e::TS_CANCELLED) {
            UDPKIT_WARNING << instance_name_ << __func__
                    << ": cannot start a cancelled listener";
            return;
        }
        if (is_started_ && state_ != transport_state_e::TS_FAILED) {
            UDPKIT_DEBUG << instance_name_ << __func__
                    << ": already started, state=" << state_;
            return;
        }

        is_started_ = true;
        state_ = transport_state_e::TS_SETUP;
        init_unlocked(its_error);
        if (its_error) {
            state_ = transport_state_e::TS_FAILED;
        } else {
            state_ = transport_state_e::TS_READY;
        }
    }

    if (its_error) {
        report(transport_state_e::TS_FAILED, its_error);
        return;
    }

    report(transport_state_e::TS_READY, its_error);

    std::scoped_lock its_lock(sync_);
    receive_unlocked();
}

void asio_udp_listener::init_unlocked(boost::system::error_code &_error) {
    // The caller must hold the lock

    lifecycle_idx_++;

    socket_ = std::make_unique<socket_type>(io_);

    endpoint_t its_local;
    if (parameters_.interface_ && parameters_.interface_->address_) {
        its_local = endpoint_t(*parameters_.interface_->address_, parameters_.port_);
        std::ignore = socket_->open(its_local.protocol(), _error);
    } else {
        // Listen on both stacks, IPv4 only if IPv6 is unavailable
        its_local = endpoint_t(boost::asio::ip::address_v6::any(), parameters_.port_);
        std::ignore = socket_->open(its_local.protocol(), _error);
        if (!_error) {
            std::ignore = socket_->set_option(
                    boost::asio::ip::v6_only(false), _error);
            if (_error) {
                UDPKIT_WARNING << instance_name_ << __func__
                        << ": no dual-stack support, " << _error.message();
                boost::system::error_code its_error;
                std::ignore = socket_->close(its_error);
            }
        }
        if (_error) {
            its_local = endpoint_t(boost::asio::ip::address_v4::any(), parameters_.port_);
            _error.clear();
            std::ignore = socket_->open(its_local.protocol(), _error);
        }
    }
    if (_error) {
        UDPKIT_ERROR << instance_name_ << __func__ << ": failed to open socket, "
                << _error.message();
        socket_.reset();
        return;
    }

    if (parameters_.reuse_local_endpoint_) {
        boost::asio::socket_base::reuse_address opt_reuse_address(true);
        std::ignore = socket_->set_option(opt_reuse_address, _error);
        if (_error) {
            UDPKIT_ERROR << instance_name_ << __func__
                    << ": failed to reuse address, " << _error.message();
            socket_.reset();
            return;
        }
    }

#if defined(__linux__)
    // If specified, bind to device
    if (parameters_.interface_) {
        const std::string &its_device(parameters_.interface_->name_);
        if (setsockopt(socket_->native_handle(), SOL_SOCKET, SO_BINDTODEVICE,
                its_device.c_str(), static_cast<socklen_t>(its_device.size())) == -1) {
            UDPKIT_WARNING << instance_name_ << __func__
                    << ": failed to bind to device " << its_device << ", "
                    << std::strerror(errno);
            // Non-fatal error
        }
    }
#endif

    std::ignore = socket_->bind(its_local, _error);
    if (_error) {
        UDPKIT_ERROR << instance_name_ << __func__ << ": failed to bind "
                << its_local << ", " << _error.message();
        socket_.reset();
        return;
    }

    if (parameters_.receive_buffer_size_ > 0) {
        std::ignore = socket_->set_option(
                boost::asio::socket_base::receive_buffer_size(
                        parameters_.receive_buffer_size_), _error);
        if (_error) {
            UDPKIT_WARNING << instance_name_ << __func__
                    << ": failed to configure receive buffer size, "
                    << _error.message();
            // Non-fatal error
            _error.clear();
        }
    }

    local_ = socket_->local_endpoint(_error);
    if (_error) {
        // Non-fatal error
        local_ = its_local;
        _error.clear();
    }

    UDPKIT_INFO << instance_name_ << __func__ << ": bound to " << local_
            << ", lifecycle_idx=" << lifecycle_idx_.load();
}

void asio_udp_listener::receive_unlocked() {
    // The caller must hold the lock

    if (!socket_ || state_ != transport_state_e::TS_READY)
        return;

    socket_->async_receive_from(boost::asio::buffer(recv_buffer_), remote_,
            strand_.wrap(std::bind(&asio_udp_listener::receive_cbk,
                    shared_from_this(), lifecycle_idx_.load(),
                    std::placeholders::_1, std::placeholders::_2)));
}

void asio_udp_listener::receive_cbk(std::uint32_t _lifecycle_idx,
        const boost::system::error_code &_error, std::size_t _bytes) {

    std::shared_ptr<asio_udp_flow> its_flow;
    std::shared_ptr<asio_udp_flow> its_evicted;
    std::shared_ptr<message_buffer_t> its_buffer;
    new_connection_handler_t its_handler;
    std::map<endpoint_t, std::shared_ptr<asio_udp_flow>> its_flows;
    {
        std::scoped_lock its_lock(sync_);
        if (_lifecycle_idx != lifecycle_idx_
                || state_ != transport_state_e::TS_READY) {
            return;
        }

        if (_error) {
            if (_error == boost::asio::error::operation_aborted)
                return;

            UDPKIT_ERROR << instance_name_ << __func__ << ": "
                    << _error.message() << " (" << _error.value() << ")";
            state_ = transport_state_e::TS_FAILED;
            boost::system::error_code its_error;
            std::ignore = socket_->close(its_error);
            socket_.reset();
            its_flows.swap(flows_);
            flow_activity_.clear();
        } else {
            its_buffer = std::make_shared<message_buffer_t>(
                    recv_buffer_.begin(),
                    recv_buffer_.begin() + static_cast<std::ptrdiff_t>(_bytes));

            const endpoint_t its_remote(normalize(remote_));
            auto found_flow = flows_.find(its_remote);
            if (found_flow != flows_.end()) {
                its_flow = found_flow->second;
            } else {
                if (parameters_.max_flows_ > 0
                        && flows_.size() >= parameters_.max_flows_) {
                    its_evicted = evict_flow_unlocked();
                }
                its_flow = std::make_shared<asio_udp_flow>(io_,
                        weak_from_this(), its_remote,
                        UDPKIT_DEFAULT_FLOW_QUEUE_LIMIT);
                flows_[its_remote] = its_flow;
                its_handler = new_connection_handler_;
            }
            flow_activity_[its_remote] = ++activity_counter_;
        }
    }

    if (_error) {
        for (const auto &f : its_flows)
            f.second->fail(_error);
        report(transport_state_e::TS_FAILED, _error);
        return;
    }

    if (its_evicted)
        its_evicted->cancel();

    // Announce the flow before its first datagram is queued
    if (its_handler)
        its_handler(its_flow);
    its_flow->enqueue(its_buffer);

    std::scoped_lock its_lock(sync_);
    receive_unlocked();
}

void asio_udp_listener::cancel() {
    boost::asio::post(strand_,
            std::bind(&asio_udp_listener::cancel_cbk, shared_from_this()));
}

void asio_udp_listener::cancel_cbk() {
    std::map<endpoint_t, std::shared_ptr<asio_udp_flow>> its_flows;
    {
        std::scoped_lock its_lock(sync_);
        if (state_ == transport_state_e::TS_CANCELLED)
            return;

        state_ = transport_state_e::TS_CANCELLED;
        lifecycle_idx_++;
        if (socket_) {
            boost::system::error_code its_error;
            std::ignore = socket_->close(its_error);
            if (its_error) {
                UDPKIT_WARNING << instance_name_ << __func__
                        << ": failed to close socket, " << its_error.message();
            }
            socket_.reset();
        }
        its_flows.swap(flows_);
        flow_activity_.clear();
    }

    for (const auto &f : its_flows)
        f.second->cancel();

    report(transport_state_e::TS_CANCELLED, boost::system::error_code());
}

void asio_udp_listener::remove_flow(const endpoint_t &_remote) {
    std::scoped_lock its_lock(sync_);
    flows_.erase(_remote);
    flow_activity_.erase(_remote);
}

std::shared_ptr<asio_udp_flow> asio_udp_listener::evict_flow_unlocked() {
    // The caller must hold the lock

    auto its_oldest = flow_activity_.end();
    for (auto it = flow_activity_.begin(); it != flow_activity_.end(); ++it) {
        if (its_oldest == flow_activity_.end() || it->second < its_oldest->second)
            its_oldest = it;
    }
    if (its_oldest == flow_activity_.end())
        return nullptr;

    std::shared_ptr<asio_udp_flow> its_flow;
    auto found_flow = flows_.find(its_oldest->first);
    if (found_flow != flows_.end()) {
        its_flow = found_flow->second;
        flows_.erase(found_flow);
    }

    UDPKIT_WARNING << instance_name_ << __func__ << ": " << flows_.size() + 1
            << " flows, cancelling least recently active " << its_oldest->first;
    flow_activity_.erase(its_oldest);
    return its_flow;
}

void asio_udp_listener::report(transport_state_e _state,
        const boost::system::error_code &_error) {

    UDPKIT_INFO << instance_name_ << __func__ << ": " << _state
            << (_error ? ", " + _error.message() : "");

    state_handler_t its_handler;
    {
        std::scoped_lock its_lock(sync_);
        its_handler = state_handler_;
        if (is_terminal(_state)) {
            state_handler_ = nullptr;
            new_connection_handler_ = nullptr;
        }
    }

    if (its_handler)
        its_handler(_state, _error);
}

} // namespace udpkit_v1
