// Copyright (C) 2025 Bayerische Motoren Werke Aktiengesellschaft (BMW AG)
// This Source Code Form is subject to the terms of the Mozilla Public
// License, v. 2.0. If a copy of the MPL was not distributed with this
// file, You can obtain one at http://mozilla.org/MPL/2.0/.

#ifndef UDPKIT_V1_ASIO_MULTICAST_MEMBERSHIP_HPP_
#define UDPKIT_V1_ASIO_MULTICAST_MEMBERSHIP_HPP_

#include <atomic>
#include <memory>
#include <mutex>
#include <string>

#include <boost/asio/io_context.hpp>
#include <boost/asio/io_context_strand.hpp>
#include <boost/asio/ip/udp.hpp>

#include "multicast_membership.hpp"
#include "transport_parameters.hpp"

namespace udpkit_v1 {

class asio_multicast_membership : public multicast_membership,
        public std::enable_shared_from_this<asio_multicast_membership> {
public:
    typedef boost::asio::ip::udp::socket socket_type;

    asio_multicast_membership(boost::asio::io_context &_io,
            const boost::asio::ip::address &_group,
            const transport_parameters &_parameters);
    ~asio_multicast_membership() override;

    const boost::asio::ip::address &get_group() const override;

    void set_state_handler(state_handler_t _handler) override;
    void set_receive_handler(length_t _max_size, bool _reject_oversized,
            receive_handler_t _handler) override;

    void start() override;
    void cancel() override;

private:
    void start_cbk();
    void cancel_cbk();

    void join_unlocked(boost::system::error_code &_error);
    void leave_unlocked();
    void receive_unlocked();
    void receive_cbk(std::uint32_t _lifecycle_idx,
            const boost::system::error_code &_error);
    std::size_t receive_message_unlocked(boost::asio::ip::address &_destination,
            boost::system::error_code &_error);

    void report(transport_state_e _state, const boost::system::error_code &_error);

private:
    boost::asio::io_context &io_;
    boost::asio::io_context::strand strand_;
    const boost::asio::ip::address group_;
    const transport_parameters parameters_;

    std::mutex sync_;
    transport_state_e state_;
    bool is_started_;
    bool is_joined_;
    std::unique_ptr<socket_type> socket_;

    state_handler_t state_handler_;
    receive_handler_t receive_handler_;
    length_t max_size_;
    bool reject_oversized_;

    message_buffer_t recv_buffer_;
    endpoint_t remote_;

    std::atomic<std::uint32_t> lifecycle_idx_;

    std::string instance_name_;
};

} // namespace udpkit_v1

#endif // UDPKIT_V1_ASIO_MULTICAST_MEMBERSHIP_HPP_
