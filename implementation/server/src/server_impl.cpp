// Copyright (C) 2025 Bayerische Motoren Werke Aktiengesellschaft (BMW AG)
// This Source Code Form is subject to the terms of the Mozilla Public
// License, v. 2.0. If a copy of the MPL was not distributed with this
// file, You can obtain one at http://mozilla.org/MPL/2.0/.

#include <atomic>
#include <exception>
#include <functional>
#include <sstream>

#include <boost/asio/post.hpp>

#include <udpkit/error.hpp>
#include <udpkit/server_delegate.hpp>
#include <udpkit/internal/logger.hpp>

#include "../include/server_connection.hpp"
#include "../include/server_connection_group.hpp"
#include "../include/server_impl.hpp"
#include "../../endpoints/include/abstract_transport_factory.hpp"
#include "../../utility/include/utility.hpp"

namespace udpkit_v1 {

server_impl::server_impl(boost::asio::io_context &_io,
        const std::optional<std::string> &_interface, port_t _port,
        const std::optional<std::vector<std::string>> &_multicast_groups,
        const std::shared_ptr<abstract_transport_factory> &_factory)
    : io_(_io),
      strand_(_io),
      factory_(_factory),
      interface_(_interface),
      port_(_port),
      reuse_local_endpoint_(true),
      fast_open_(true),
      receive_buffer_size_(0),
      is_listener_ready_(false),
      is_listener_cancelling_(false),
      is_listening_(false) {

    static std::atomic<unsigned> instance_count = 0;
    instance_name_ = "srv#" + std::to_string(++instance_count) + "::";

    if (_multicast_groups) {
        std::set<boost::asio::ip::address> its_groups;
        for (const auto &g : *_multicast_groups) {
            if (factory_->is_valid_multicast_address(g)) {
                its_groups.insert(boost::asio::ip::make_address(g));
            } else {
                UDPKIT_WARNING << instance_name_ << __func__
                        << ": Ignoring invalid multicast group \"" << g << "\"";
            }
        }
        if (!its_groups.empty())
            multicast_groups_ = its_groups;
    }

    UDPKIT_INFO << instance_name_ << __func__ << ": port=" << port_
            << ", interface=" << (interface_ ? *interface_ : "any")
            << ", mode=" << (multicast_groups_ ? "multicast" : "unicast");
}

server_impl::~server_impl() {
    UDPKIT_INFO << instance_name_ << __func__;

    std::scoped_lock its_lock(sync_);
    stop_listening_unlocked(false);

    // Release everything that did not reach the listening state
    if (listener_ && !is_listener_cancelling_)
        listener_->cancel();
    for (const auto &g : joining_groups_) {
        if (!g.second->is_cancelling())
            g.second->cancel();
    }
    for (const auto &g : connection_groups_) {
        if (!g.second->is_cancelling())
            g.second->cancel();
    }
    for (const auto &c : connections_)
        c.second->cancel();
}

void server_impl::start_listening() {
    std::scoped_lock its_lock(sync_);

    if (listener_ && !multicast_groups_) {
        if (!is_listener_cancelling_) {
            UDPKIT_INFO << instance_name_ << __func__ << ": restarting listener";
            wire_listener_unlocked(listener_);
            listener_->start();
            return;
        }

        // A cancelled listener cannot be restarted
        discard_listener_unlocked();
    }

    configure_unlocked();

    if (listener_ && !multicast_groups_)
        listener_->start();
}

void server_impl::stop_listening(bool _clearing_multicast) {
    std::scoped_lock its_lock(sync_);
    stop_listening_unlocked(_clearing_multicast);
}

void server_impl::stop_listening_unlocked(bool _clearing_multicast) {
    // The caller must hold the lock

    if (!is_listening_)
        return;

    UDPKIT_INFO << instance_name_ << __func__ << ": clearing_multicast="
            << std::boolalpha << _clearing_multicast;

    const auto its_joined(joined_multicast_groups_);
    for (const auto &h : its_joined)
        leave_multicast_group_unlocked(h, !_clearing_multicast);

    discard_joining_groups_unlocked();
    if (_clearing_multicast)
        multicast_groups_.reset();

    if (listener_ && !is_listener_cancelling_) {
        is_listener_cancelling_ = true;
        listener_->cancel();
    }
}

void server_impl::join_multicast_group(const std::string &_group) {
    if (!factory_->is_valid_multicast_address(_group))
        throw server_error(error_code_e::INVALID_MULTICAST_GROUP, _group);

    const auto its_host = boost::asio::ip::make_address(_group);

    std::scoped_lock its_lock(sync_);
    if (multicast_groups_) {
        join_multicast_group_unlocked(its_host);
    } else {
        // Switching to multicast requires a restart by the application
        UDPKIT_INFO << instance_name_ << __func__ << ": switching to multicast";
        multicast_groups_ = std::set<boost::asio::ip::address> { its_host };
        stop_listening_unlocked(false);
    }
}

void server_impl::join_multicast_group_unlocked(
        const boost::asio::ip::address &_host) {
    // The caller must hold the lock

    // Groups that are being left do not count
    for (const auto &g : connection_groups_) {
        if (g.second->get_host() == _host && !g.second->is_cancelling())
            return;
    }
    for (const auto &g : joining_groups_) {
        if (g.second->get_host() == _host && !g.second->is_cancelling())
            return;
    }

    if (multicast_groups_)
        multicast_groups_->insert(_host);

    if (!utility::is_valid_port(port_))
        throw server_error(error_code_e::INVALID_PORT, std::to_string(port_));

    auto its_membership = factory_->create_multicast_membership(io_, _host,
            make_parameters_unlocked());
    auto its_connection_group = std::make_shared<server_connection_group>(
            its_membership, weak_from_this());
    joining_groups_[its_connection_group->get_id()] = its_connection_group;

    UDPKIT_INFO << instance_name_ << __func__ << ": " << _host;
    its_connection_group->start();
}

void server_impl::leave_multicast_group(const std::string &_group) {
    if (!factory_->is_valid_multicast_address(_group))
        throw server_error(error_code_e::INVALID_MULTICAST_GROUP, _group);

    const auto its_host = boost::asio::ip::make_address(_group);

    std::scoped_lock its_lock(sync_);
    leave_multicast_group_unlocked(its_host, false);
}

void server_impl::leave_multicast_group_unlocked(
        const boost::asio::ip::address &_host, bool _preserve) {
    // The caller must hold the lock

    if (joined_multicast_groups_.find(_host) == joined_multicast_groups_.end())
        return;

    if (!_preserve && multicast_groups_) {
        multicast_groups_->erase(_host);
        if (multicast_groups_->empty()) {
            UDPKIT_INFO << instance_name_ << __func__ << ": switching to unicast";
            multicast_groups_.reset();
        }
    }

    if (!is_listening_)
        return;

    for (const auto &g : connection_groups_) {
        if (g.second->get_host() == _host && !g.second->is_cancelling())
            g.second->cancel();
    }
}

std::vector<std::string> server_impl::get_joined_multicast_groups() const {
    std::scoped_lock its_lock(sync_);
    std::vector<std::string> its_groups;
    for (const auto &h : joined_multicast_groups_)
        its_groups.push_back(h.to_string());
    return its_groups;
}

std::optional<std::set<std::string>> server_impl::get_multicast_groups() const {
    std::scoped_lock its_lock(sync_);
    if (!multicast_groups_)
        return std::nullopt;

    std::set<std::string> its_groups;
    for (const auto &h : *multicast_groups_)
        its_groups.insert(h.to_string());
    return its_groups;
}

bool server_impl::is_listening() const {
    std::scoped_lock its_lock(sync_);
    return is_listening_;
}

std::optional<std::string> server_impl::get_interface() const {
    std::scoped_lock its_lock(sync_);
    return interface_;
}

void server_impl::set_interface(const std::optional<std::string> &_interface) {
    std::scoped_lock its_lock(sync_);
    if (interface_ == _interface)
        return;

    interface_ = _interface;
    stop_listening_unlocked(false);

    // Nothing that was set up for the old interface may be restarted
    if (listener_ && !is_listener_cancelling_)
        discard_listener_unlocked();
    discard_joining_groups_unlocked();
}

port_t server_impl::get_port() const {
    std::scoped_lock its_lock(sync_);
    return port_;
}

void server_impl::set_port(port_t _port) {
    std::scoped_lock its_lock(sync_);
    if (port_ == _port)
        return;

    port_ = _port;
    stop_listening_unlocked(false);

    if (listener_ && !is_listener_cancelling_)
        discard_listener_unlocked();
    discard_joining_groups_unlocked();
}

void server_impl::set_local_endpoint_reuse(bool _allow) {
    std::scoped_lock its_lock(sync_);
    reuse_local_endpoint_ = _allow;
}

void server_impl::set_fast_open(bool _allow) {
    std::scoped_lock its_lock(sync_);
    fast_open_ = _allow;
}

void server_impl::set_receive_buffer_size(int _size) {
    std::scoped_lock its_lock(sync_);
    receive_buffer_size_ = _size;
}

std::shared_ptr<server_delegate> server_impl::get_delegate() const {
    std::scoped_lock its_lock(sync_);
    return delegate_.lock();
}

void server_impl::set_delegate(const std::shared_ptr<server_delegate> &_delegate) {
    std::scoped_lock its_lock(sync_);
    delegate_ = _delegate;
}

void server_impl::disconnect_from(const endpoint_t &_remote) {
    std::scoped_lock its_lock(sync_);
    for (const auto &c : connections_) {
        if (c.second->get_remote_endpoint() == _remote) {
            c.second->cancel();
            return;
        }
    }

    std::stringstream its_remote;
    its_remote << _remote;
    throw server_error(error_code_e::NO_CONNECTION_FOR_ENDPOINT, its_remote.str());
}

std::size_t server_impl::get_connection_count() const {
    std::scoped_lock its_lock(sync_);
    return connections_.size();
}

std::size_t server_impl::get_connection_group_count() const {
    std::scoped_lock its_lock(sync_);
    return connection_groups_.size();
}

void server_impl::print_status() const {
    std::scoped_lock its_lock(sync_);

    std::stringstream its_desired;
    if (multicast_groups_) {
        for (const auto &h : *multicast_groups_)
            its_desired << h << " ";
    }
    std::stringstream its_joined;
    for (const auto &h : joined_multicast_groups_)
        its_joined << h << " ";

    UDPKIT_INFO << instance_name_ << __func__
            << ": mode=" << (multicast_groups_ ? "multicast" : "unicast")
            << ", port=" << port_
            << ", interface=" << (interface_ ? *interface_ : "any")
            << ", listening=" << std::boolalpha << is_listening_
            << ", listener=" << (listener_ ? (is_listener_ready_ ? "ready" :
                    (is_listener_cancelling_ ? "cancelling" : "not ready")) : "none")
            << ", connections=" << connections_.size()
            << ", groups=" << connection_groups_.size()
            << ", joining=" << joining_groups_.size()
            << ", desired=[ " << its_desired.str() << "]"
            << ", joined=[ " << its_joined.str() << "]";
}

void server_impl::configure_unlocked() {
    // The caller must hold the lock

    if (!multicast_groups_) {
        configure_listener_unlocked();
        return;
    }

    // Fail early if the port is invalid
    if (!utility::is_valid_port(port_))
        throw server_error(error_code_e::INVALID_PORT, std::to_string(port_));

    // Only one of listener and groups may be active
    if (listener_)
        discard_listener_unlocked();

    std::vector<std::exception_ptr> its_errors;
    const auto its_groups(*multicast_groups_);
    for (const auto &h : its_groups) {
        try {
            join_multicast_group_unlocked(h);
        } catch (const std::exception &e) {
            UDPKIT_ERROR << instance_name_ << __func__ << ": joining " << h
                    << " failed: " << e.what();
            its_errors.push_back(std::current_exception());
        }
    }

    if (its_errors.size() > 1) {
        throw server_error(std::move(its_errors));
    } else if (its_errors.size() == 1) {
        std::rethrow_exception(its_errors.front());
    }
}

void server_impl::configure_listener_unlocked() {
    // The caller must hold the lock

    if (!utility::is_valid_port(port_))
        throw server_error(error_code_e::INVALID_PORT, std::to_string(port_));

    auto its_listener = factory_->create_listener(io_, make_parameters_unlocked());

    listener_ = its_listener;
    is_listener_ready_ = false;
    is_listener_cancelling_ = false;
    wire_listener_unlocked(listener_);
}

void server_impl::wire_listener_unlocked(
        const std::shared_ptr<udp_listener> &_listener) {
    // The caller must hold the lock

    std::weak_ptr<server_impl> its_me(weak_from_this());
    std::weak_ptr<udp_listener> its_listener(_listener);

    _listener->set_state_handler(
        [its_me, its_listener](transport_state_e _state,
                const boost::system::error_code &_error) {
            auto its_server = its_me.lock();
            if (its_server)
                its_server->on_listener_state(its_listener.lock(), _state, _error);
        });
    _listener->set_new_connection_handler(
        [its_me, its_listener](const std::shared_ptr<udp_flow> &_flow) {
            auto its_server = its_me.lock();
            if (its_server) {
                its_server->on_new_flow(its_listener.lock(), _flow);
            } else {
                _flow->cancel();
            }
        });
}

void server_impl::discard_listener_unlocked() {
    // The caller must hold the lock

    if (!listener_)
        return;

    UDPKIT_INFO << instance_name_ << __func__;

    if (!is_listener_cancelling_)
        listener_->cancel();
    listener_.reset();
    is_listener_ready_ = false;
    is_listener_cancelling_ = false;

    for (const auto &c : connections_)
        c.second->cancel();

    update_listening_unlocked(boost::system::error_code());
}

void server_impl::discard_joining_groups_unlocked() {
    // The caller must hold the lock

    // Their Cancelled notification removes them
    for (const auto &g : joining_groups_) {
        if (!g.second->is_cancelling())
            g.second->cancel();
    }
}

transport_parameters server_impl::make_parameters_unlocked() const {
    // The caller must hold the lock

    transport_parameters its_parameters;
    its_parameters.port_ = port_;
    if (interface_) {
        its_parameters.interface_ = factory_->resolve_interface(*interface_);
        if (!its_parameters.interface_) {
            UDPKIT_WARNING << instance_name_ << __func__ << ": interface \""
                    << *interface_ << "\" not found, using all interfaces";
        }
    }
    its_parameters.reuse_local_endpoint_ = reuse_local_endpoint_;
    its_parameters.fast_open_ = fast_open_;
    its_parameters.receive_buffer_size_ = receive_buffer_size_;
    return its_parameters;
}

void server_impl::update_listening_unlocked(const boost::system::error_code &_error) {
    // The caller must hold the lock

    const bool its_listening(is_listener_ready_ || !connection_groups_.empty());
    if (its_listening == is_listening_)
        return;

    is_listening_ = its_listening;
    UDPKIT_INFO << instance_name_ << __func__ << ": listening="
            << std::boolalpha << is_listening_
            << (_error ? ", " + _error.message() : "");
    notify_listening(is_listening_, _error);
}

// Transport notifications

void server_impl::on_listener_state(const std::shared_ptr<udp_listener> &_listener,
        transport_state_e _state, const boost::system::error_code &_error) {
    boost::asio::post(strand_, std::bind(&server_impl::listener_state_cbk,
            shared_from_this(), _listener, _state, _error));
}

void server_impl::on_new_flow(const std::shared_ptr<udp_listener> &_listener,
        const std::shared_ptr<udp_flow> &_flow) {
    boost::asio::post(strand_, std::bind(&server_impl::new_flow_cbk,
            shared_from_this(), _listener, _flow));
}

void server_impl::on_connection_state(
        const std::shared_ptr<server_connection> &_connection,
        transport_state_e _state, const boost::system::error_code &_error) {
    boost::asio::post(strand_, std::bind(&server_impl::connection_state_cbk,
            shared_from_this(), _connection, _state, _error));
}

void server_impl::on_connection_message(
        const std::shared_ptr<server_connection> &_connection,
        const std::shared_ptr<message_buffer_t> &_buffer) {
    boost::asio::post(strand_, std::bind(&server_impl::connection_message_cbk,
            shared_from_this(), _connection, _buffer));
}

void server_impl::on_connection_group_state(
        const std::shared_ptr<server_connection_group> &_connection_group,
        transport_state_e _state, const boost::system::error_code &_error) {
    boost::asio::post(strand_, std::bind(&server_impl::connection_group_state_cbk,
            shared_from_this(), _connection_group, _state, _error));
}

void server_impl::on_connection_group_message(
        const std::shared_ptr<server_connection_group> &_connection_group,
        const std::shared_ptr<message_buffer_t> &_buffer,
        const std::optional<endpoint_t> &_source) {
    boost::asio::post(strand_, std::bind(&server_impl::connection_group_message_cbk,
            shared_from_this(), _connection_group, _buffer, _source));
}

void server_impl::listener_state_cbk(const std::shared_ptr<udp_listener> &_listener,
        transport_state_e _state, const boost::system::error_code &_error) {

    std::scoped_lock its_lock(sync_);
    if (!_listener || _listener != listener_) {
        UDPKIT_DEBUG << instance_name_ << __func__
                << ": ignoring " << _state << " of a discarded listener";
        return;
    }

    switch (_state) {
    case transport_state_e::TS_SETUP:
        UDPKIT_DEBUG << instance_name_ << __func__ << ": setup, port " << port_;
        break;
    case transport_state_e::TS_WAITING:
        UDPKIT_INFO << instance_name_ << __func__ << ": waiting, port " << port_
                << ", " << _error.message();
        break;
    case transport_state_e::TS_READY:
        UDPKIT_INFO << instance_name_ << __func__ << ": ready, port " << port_;
        is_listener_ready_ = true;
        update_listening_unlocked(boost::system::error_code());
        break;
    case transport_state_e::TS_FAILED:
        UDPKIT_ERROR << instance_name_ << __func__ << ": failed, port " << port_
                << ", " << _error.message();
        is_listener_ready_ = false;
        update_listening_unlocked(_error);
        break;
    case transport_state_e::TS_CANCELLED:
        UDPKIT_INFO << instance_name_ << __func__ << ": cancelled, port " << port_;
        for (const auto &c : connections_)
            c.second->cancel();
        listener_.reset();
        is_listener_ready_ = false;
        is_listener_cancelling_ = false;
        update_listening_unlocked(boost::system::error_code());
        break;
    }
}

void server_impl::new_flow_cbk(const std::shared_ptr<udp_listener> &_listener,
        const std::shared_ptr<udp_flow> &_flow) {

    std::scoped_lock its_lock(sync_);
    if (!_listener || _listener != listener_ || is_listener_cancelling_) {
        UDPKIT_DEBUG << instance_name_ << __func__
                << ": rejecting flow of a discarded listener";
        _flow->cancel();
        return;
    }

    auto its_connection = std::make_shared<server_connection>(_flow,
            weak_from_this());
    UDPKIT_DEBUG << instance_name_ << __func__ << ": connection "
            << its_connection->get_id() << " from "
            << its_connection->get_remote_endpoint();
    its_connection->start();
}

void server_impl::connection_state_cbk(
        const std::shared_ptr<server_connection> &_connection,
        transport_state_e _state, const boost::system::error_code &_error) {

    std::scoped_lock its_lock(sync_);
    switch (_state) {
    case transport_state_e::TS_READY:
        if (!listener_ || is_listener_cancelling_) {
            _connection->cancel();
            return;
        }
        connections_[_connection->get_id()] = _connection;
        _connection->receive();
        break;
    case transport_state_e::TS_FAILED:
    case transport_state_e::TS_CANCELLED:
        connections_.erase(_connection->get_id());
        if (_error) {
            UDPKIT_WARNING << instance_name_ << __func__ << ": connection "
                    << _connection->get_id() << " " << _state << ", "
                    << _error.message();
        }
        break;
    default:
        break;
    }
}

void server_impl::connection_message_cbk(
        const std::shared_ptr<server_connection> &_connection,
        const std::shared_ptr<message_buffer_t> &_buffer) {

    notify_message(_buffer, _connection->get_remote_endpoint());

    std::scoped_lock its_lock(sync_);
    if (is_listening_
            && connections_.find(_connection->get_id()) != connections_.end()) {
        _connection->receive();
    }
}

void server_impl::connection_group_state_cbk(
        const std::shared_ptr<server_connection_group> &_connection_group,
        transport_state_e _state, const boost::system::error_code &_error) {

    std::scoped_lock its_lock(sync_);
    const auto its_id(_connection_group->get_id());
    switch (_state) {
    case transport_state_e::TS_READY: {
        auto found_group = joining_groups_.find(its_id);
        if (found_group == joining_groups_.end()) {
            UDPKIT_WARNING << instance_name_ << __func__ << ": ignoring ready "
                    << _connection_group->get_host() << " of a discarded group";
            _connection_group->cancel();
            return;
        }
        joining_groups_.erase(found_group);
        connection_groups_[its_id] = _connection_group;
        joined_multicast_groups_.insert(_connection_group->get_host());
        update_listening_unlocked(boost::system::error_code());
        break;
    }
    case transport_state_e::TS_FAILED:
    case transport_state_e::TS_CANCELLED:
        joining_groups_.erase(its_id);
        if (connection_groups_.erase(its_id) > 0) {
            // A rejoin of the same host may already be ready
            bool is_still_joined(false);
            for (const auto &g : connection_groups_) {
                if (g.second->get_host() == _connection_group->get_host())
                    is_still_joined = true;
            }
            if (!is_still_joined)
                joined_multicast_groups_.erase(_connection_group->get_host());
        }
        update_listening_unlocked(_error);
        break;
    default:
        break;
    }
}

void server_impl::connection_group_message_cbk(
        const std::shared_ptr<server_connection_group> &_connection_group,
        const std::shared_ptr<message_buffer_t> &_buffer,
        const std::optional<endpoint_t> &_source) {

    {
        std::scoped_lock its_lock(sync_);
        if (connection_groups_.find(_connection_group->get_id())
                == connection_groups_.end()) {
            return;
        }
    }
    notify_message(_buffer, _source);
}

// Delegate notifications

void server_impl::notify_listening(bool _is_listening,
        const boost::system::error_code &_error) {
    auto its_me = weak_from_this().lock();
    if (!its_me)
        return;

    boost::asio::post(strand_, [its_me, _is_listening, _error]() {
        auto its_delegate = its_me->get_delegate();
        if (!its_delegate)
            return;

        if (_is_listening) {
            its_delegate->on_started_listening(*its_me);
        } else {
            its_delegate->on_stopped_listening(*its_me, _error);
        }
    });
}

void server_impl::notify_message(const std::shared_ptr<message_buffer_t> &_buffer,
        const std::optional<endpoint_t> &_source) {
    auto its_me = weak_from_this().lock();
    if (!its_me)
        return;

    boost::asio::post(strand_, [its_me, _buffer, _source]() {
        auto its_delegate = its_me->get_delegate();
        if (!its_delegate)
            return;

        its_delegate->on_message_received(*its_me, _buffer->data(),
                static_cast<length_t>(_buffer->size()), _source);
    });
}

} // namespace udpkit_v1
