// Copyright (C) 2025 Bayerische Motoren Werke Aktiengesellschaft (BMW AG)
// This Source Code Form is subject to the terms of the Mozilla Public
// License, v. 2.0. If a copy of the MPL was not distributed with this
// file, You can obtain one at http://mozilla.org/MPL/2.0/.

#ifndef UDPKIT_V1_ASIO_UDP_FLOW_HPP_
#define UDPKIT_V1_ASIO_UDP_FLOW_HPP_

#include <deque>
#include <memory>
#include <mutex>
#include <string>

#include <boost/asio/io_context.hpp>
#include <boost/asio/io_context_strand.hpp>

#include "udp_flow.hpp"

namespace udpkit_v1 {

class asio_udp_listener;

class asio_udp_flow : public udp_flow,
        public std::enable_shared_from_this<asio_udp_flow> {
public:
    asio_udp_flow(boost::asio::io_context &_io,
            const std::weak_ptr<asio_udp_listener> &_listener,
            const endpoint_t &_remote, std::size_t _queue_limit);
    ~asio_udp_flow() override;

    const endpoint_t &get_remote_endpoint() const override;

    void set_state_handler(state_handler_t _handler) override;

    void start() override;
    void cancel() override;

    void async_receive_message(receive_handler_t _handler) override;

    // Called by the listener
    void enqueue(const std::shared_ptr<message_buffer_t> &_buffer);
    void fail(const boost::system::error_code &_error);

private:
    void start_cbk();
    void cancel_cbk(bool _notify_listener);
    void fail_cbk(const boost::system::error_code &_error);

    void deliver_unlocked();
    void abort_receive_unlocked();
    void report(transport_state_e _state, const boost::system::error_code &_error);

private:
    boost::asio::io_context::strand strand_;
    std::weak_ptr<asio_udp_listener> listener_;
    const endpoint_t remote_;
    const std::size_t queue_limit_;

    std::mutex sync_;
    transport_state_e state_;
    state_handler_t state_handler_;
    receive_handler_t receive_handler_;
    std::deque<std::shared_ptr<message_buffer_t>> queue_;
    std::size_t dropped_;

    std::string instance_name_;
};

} // namespace udpkit_v1

#endif // UDPKIT_V1_ASIO_UDP_FLOW_HPP_
