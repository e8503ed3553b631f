// Copyright (C) 2025 Bayerische Motoren Werke Aktiengesellschaft (BMW AG)
// This Source Code Form is subject to the terms of the Mozilla Public
// License, v. 2.0. If a copy of the MPL was not distributed with this
// file, You can obtain one at http://mozilla.org/MPL/2.0/.

#ifndef UDPKIT_V1_FAKE_TRANSPORT_FACTORY_
#define UDPKIT_V1_FAKE_TRANSPORT_FACTORY_

#include <deque>
#include <memory>
#include <set>
#include <string>
#include <vector>

#include <boost/asio/error.hpp>
#include <boost/system/system_error.hpp>

#include "../../../implementation/endpoints/include/abstract_transport_factory.hpp"

namespace udpkit_v1::testing {

/**
 * Scripted transport handles. Nothing happens unless the test reports a
 * state or delivers a datagram, except for cancel which is confirmed
 * immediately. Like the real handles, they drop their handlers after
 * reporting a terminal state.
 **/
class fake_flow : public udp_flow {
public:
    explicit fake_flow(const endpoint_t &_remote) : remote_(_remote) {}

    const endpoint_t &get_remote_endpoint() const override { return remote_; }

    void set_state_handler(state_handler_t _handler) override {
        state_handler_ = std::move(_handler);
    }

    void start() override {
        start_count_++;
        if (auto_ready_)
            report(transport_state_e::TS_READY);
    }

    void cancel() override {
        cancel_count_++;
        abort();
        report(transport_state_e::TS_CANCELLED);
    }

    void async_receive_message(receive_handler_t _handler) override {
        receive_count_++;
        if (!queue_.empty()) {
            auto its_buffer = queue_.front();
            queue_.pop_front();
            _handler(boost::system::error_code(), its_buffer, true);
            return;
        }
        receive_handler_ = std::move(_handler);
    }

    void report(transport_state_e _state,
            const boost::system::error_code &_error = boost::system::error_code()) {
        auto its_handler = state_handler_;
        if (is_terminal(_state))
            state_handler_ = nullptr;
        if (its_handler)
            its_handler(_state, _error);
    }

    void deliver(const message_buffer_t &_payload, bool _is_complete = true) {
        auto its_buffer = std::make_shared<message_buffer_t>(_payload);
        if (!receive_handler_) {
            queue_.push_back(its_buffer);
            return;
        }
        receive_handler_t its_handler;
        its_handler.swap(receive_handler_);
        its_handler(boost::system::error_code(), its_buffer, _is_complete);
    }

    void abort() {
        if (receive_handler_) {
            receive_handler_t its_handler;
            its_handler.swap(receive_handler_);
            its_handler(boost::asio::error::operation_aborted, nullptr, false);
        }
    }

    bool has_pending_receive() const { return bool(receive_handler_); }

    bool auto_ready_{true};
    int start_count_{0};
    int cancel_count_{0};
    int receive_count_{0};

private:
    endpoint_t remote_;
    state_handler_t state_handler_;
    receive_handler_t receive_handler_;
    std::deque<std::shared_ptr<message_buffer_t>> queue_;
};

class fake_listener : public udp_listener {
public:
    explicit fake_listener(const transport_parameters &_parameters)
        : parameters_(_parameters) {}

    void set_state_handler(state_handler_t _handler) override {
        state_handler_ = std::move(_handler);
    }

    void set_new_connection_handler(new_connection_handler_t _handler) override {
        new_connection_handler_ = std::move(_handler);
    }

    void start() override { start_count_++; }

    void cancel() override {
        cancel_count_++;
        if (auto_cancel_)
            report(transport_state_e::TS_CANCELLED);
    }

    void report(transport_state_e _state,
            const boost::system::error_code &_error = boost::system::error_code()) {
        auto its_handler = state_handler_;
        if (is_terminal(_state)) {
            state_handler_ = nullptr;
            new_connection_handler_ = nullptr;
        }
        if (its_handler)
            its_handler(_state, _error);
    }

    std::shared_ptr<fake_flow> connect(const endpoint_t &_remote) {
        auto its_flow = std::make_shared<fake_flow>(_remote);
        flows_.push_back(its_flow);
        if (new_connection_handler_)
            new_connection_handler_(its_flow);
        return its_flow;
    }

    bool has_handlers() const {
        return bool(state_handler_) && bool(new_connection_handler_);
    }

    const transport_parameters parameters_;
    // Confirm cancellation right away
    bool auto_cancel_{true};
    int start_count_{0};
    int cancel_count_{0};
    std::vector<std::shared_ptr<fake_flow>> flows_;

private:
    state_handler_t state_handler_;
    new_connection_handler_t new_connection_handler_;
};

class fake_membership : public multicast_membership {
public:
    fake_membership(const boost::asio::ip::address &_group,
            const transport_parameters &_parameters)
        : group_(_group), parameters_(_parameters) {}

    const boost::asio::ip::address &get_group() const override { return group_; }

    void set_state_handler(state_handler_t _handler) override {
        state_handler_ = std::move(_handler);
    }

    void set_receive_handler(length_t _max_size, bool _reject_oversized,
            receive_handler_t _handler) override {
        max_size_ = _max_size;
        reject_oversized_ = _reject_oversized;
        receive_handler_ = std::move(_handler);
    }

    void start() override { start_count_++; }

    void cancel() override {
        cancel_count_++;
        report(transport_state_e::TS_CANCELLED);
    }

    void report(transport_state_e _state,
            const boost::system::error_code &_error = boost::system::error_code()) {
        auto its_handler = state_handler_;
        if (is_terminal(_state)) {
            state_handler_ = nullptr;
            receive_handler_ = nullptr;
        }
        if (its_handler)
            its_handler(_state, _error);
    }

    void deliver(const message_buffer_t &_payload, const endpoint_t &_source) {
        if (_payload.size() > max_size_ && reject_oversized_)
            return;
        if (receive_handler_)
            receive_handler_(std::make_shared<message_buffer_t>(_payload),
                    _source, true);
    }

    const boost::asio::ip::address group_;
    const transport_parameters parameters_;
    length_t max_size_{0};
    bool reject_oversized_{false};
    int start_count_{0};
    int cancel_count_{0};

private:
    state_handler_t state_handler_;
    receive_handler_t receive_handler_;
};

class fake_transport_factory : public abstract_transport_factory {
public:
    std::shared_ptr<udp_listener> create_listener(boost::asio::io_context &_io,
            const transport_parameters &_parameters) override {
        (void)_io;
        if (fail_listener_)
            throw boost::system::system_error(
                    boost::asio::error::address_in_use, "create_listener");

        auto its_listener = std::make_shared<fake_listener>(_parameters);
        listeners_.push_back(its_listener);
        return its_listener;
    }

    std::shared_ptr<multicast_membership> create_multicast_membership(
            boost::asio::io_context &_io, const boost::asio::ip::address &_group,
            const transport_parameters &_parameters) override {
        (void)_io;
        if (failing_hosts_.find(_group.to_string()) != failing_hosts_.end())
            throw boost::system::system_error(
                    boost::asio::error::no_such_device, _group.to_string());

        auto its_membership = std::make_shared<fake_membership>(_group, _parameters);
        memberships_.push_back(its_membership);
        return its_membership;
    }

    std::optional<network_interface> resolve_interface(
            const std::string &_name_or_address) const override {
        if (known_interfaces_.find(_name_or_address) == known_interfaces_.end())
            return std::nullopt;
        return network_interface { _name_or_address, 7, std::nullopt };
    }

    std::shared_ptr<fake_listener> last_listener() const {
        return (listeners_.empty() ? nullptr : listeners_.back());
    }

    // Latest membership created for the given group
    std::shared_ptr<fake_membership> membership(const std::string &_group) const {
        for (auto it = memberships_.rbegin(); it != memberships_.rend(); ++it) {
            if ((*it)->get_group().to_string() == _group)
                return *it;
        }
        return nullptr;
    }

    bool fail_listener_{false};
    std::set<std::string> failing_hosts_;
    std::set<std::string> known_interfaces_;

    std::vector<std::shared_ptr<fake_listener>> listeners_;
    std::vector<std::shared_ptr<fake_membership>> memberships_;
};

} // namespace udpkit_v1::testing

#endif // UDPKIT_V1_FAKE_TRANSPORT_FACTORY_
