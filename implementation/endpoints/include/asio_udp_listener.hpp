// Copyright (C) 2025 Bayerische Motoren Werke Aktiengesellschaft (BMW AG)
// This Source Code Form is subject to the terms of the Mozilla Public
// License, v. 2.0. If a copy of the MPL was not distributed with this
// file, You can obtain one at http://mozilla.org/MPL/2.0/.

#ifndef UDPKIT_V1_ASIO_UDP_LISTENER_HPP_
#define UDPKIT_V1_ASIO_UDP_LISTENER_HPP_

#include <atomic>
#include <map>
#include <memory>
#include <mutex>
#include <string>

#include <boost/asio/io_context.hpp>
#include <boost/asio/io_context_strand.hpp>
#include <boost/asio/ip/udp.hpp>

#include <udpkit/endpoint.hpp>

#include "transport_parameters.hpp"
#include "udp_listener.hpp"

namespace udpkit_v1 {

class asio_udp_flow;

// Binds one socket and demultiplexes its datagrams into one flow per
// remote endpoint.
class asio_udp_listener : public udp_listener,
        public std::enable_shared_from_this<asio_udp_listener> {
public:
    typedef boost::asio::ip::udp::socket socket_type;

    asio_udp_listener(boost::asio::io_context &_io,
            const transport_parameters &_parameters);
    ~asio_udp_listener() override;

    void set_state_handler(state_handler_t _handler) override;
    void set_new_connection_handler(new_connection_handler_t _handler) override;

    void start() override;
    void cancel() override;

    endpoint_t get_local_endpoint() const;

    void remove_flow(const endpoint_t &_remote);

private:
    void start_cbk();
    void cancel_cbk();

    void init_unlocked(boost::system::error_code &_error);
    std::shared_ptr<asio_udp_flow> evict_flow_unlocked();
    void receive_unlocked();
    void receive_cbk(std::uint32_t _lifecycle_idx,
            const boost::system::error_code &_error, std::size_t _bytes);

    void report(transport_state_e _state, const boost::system::error_code &_error);

private:
    boost::asio::io_context &io_;
    boost::asio::io_context::strand strand_;
    const transport_parameters parameters_;

    mutable std::mutex sync_;
    transport_state_e state_;
    bool is_started_;
    std::unique_ptr<socket_type> socket_;
    endpoint_t local_;

    state_handler_t state_handler_;
    new_connection_handler_t new_connection_handler_;

    message_buffer_t recv_buffer_;
    endpoint_t remote_;

    std::map<endpoint_t, std::shared_ptr<asio_udp_flow>> flows_;
    // Sequence number of the latest datagram per flow
    std::map<endpoint_t, std::uint64_t> flow_activity_;
    std::uint64_t activity_counter_;

    // Incremented whenever the socket is replaced, to ignore stale receives
    std::atomic<std::uint32_t> lifecycle_idx_;

    std::string instance_name_;
};

} // namespace udpkit_v1

#endif // UDPKIT_V1_ASIO_UDP_LISTENER_HPP_
