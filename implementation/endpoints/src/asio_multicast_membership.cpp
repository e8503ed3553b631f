// Copyright (C) 2025 Bayerische Motoren Werke Aktiengesellschaft (BMW AG)
// This Source Code Form is subject to the terms of the Mozilla Public
// License, v. 2.0. If a copy of the MPL was not distributed with this
// file, You can obtain one at http://mozilla.org/MPL/2.0/.

#include <cerrno>
#include <cstring>
#include <functional>
#include <tuple>

#include <netinet/in.h>
#include <sys/socket.h>
#include <sys/types.h>
#include <sys/uio.h>

#include <boost/asio/buffer.hpp>
#include <boost/asio/error.hpp>
#include <boost/asio/ip/multicast.hpp>
#include <boost/asio/post.hpp>

#include <udpkit/defines.hpp>
#include <udpkit/internal/logger.hpp>

#include "../include/asio_multicast_membership.hpp"

namespace ip = boost::asio::ip;

namespace udpkit_v1 {

asio_multicast_membership::asio_multicast_membership(
        boost::asio::io_context &_io, const ip::address &_group,
        const transport_parameters &_parameters)
    : io_(_io),
      strand_(_io),
      group_(_group),
      parameters_(_parameters),
      state_(transport_state_e::TS_SETUP),
      is_started_(false),
      is_joined_(false),
      max_size_(UDPKIT_MAX_MULTICAST_MESSAGE_SIZE),
      reject_oversized_(true),
      lifecycle_idx_(0) {

    static std::atomic<unsigned> instance_count = 0;
    instance_name_ = "amm#" + std::to_string(++instance_count) + "::"
            + _group.to_string() + ":" + std::to_string(_parameters.port_) + "::";

    UDPKIT_INFO << instance_name_ << __func__ << ": interface="
            << (parameters_.interface_ ? parameters_.interface_->name_ : "any");
}

asio_multicast_membership::~asio_multicast_membership() {
    UDPKIT_INFO << instance_name_ << __func__ << ": lifecycle_idx="
            << lifecycle_idx_.load();
}

const ip::address &asio_multicast_membership::get_group() const {
    return group_;
}

void asio_multicast_membership::set_state_handler(state_handler_t _handler) {
    std::scoped_lock its_lock(sync_);
    state_handler_ = std::move(_handler);
}

void asio_multicast_membership::set_receive_handler(length_t _max_size,
        bool _reject_oversized, receive_handler_t _handler) {
    std::scoped_lock its_lock(sync_);
    max_size_ = _max_size;
    reject_oversized_ = _reject_oversized;
    receive_handler_ = std::move(_handler);
}

void asio_multicast_membership::start() {
    boost::asio::post(strand_,
            std::bind(&asio_multicast_membership::start_cbk, shared_from_this()));
}

void asio_multicast_membership::start_cbk() {
    boost::system::error_code its_error;
    transport_state_e its_state;
    {
        std::scoped_lock its_lock(sync_);
        if (state_ == transport_state_e::TS_CANCELLED) {
            UDPKIT_WARNING << instance_name_ << __func__
                    << ": cannot start a cancelled membership";
            return;
        }
        if (is_started_) {
            UDPKIT_DEBUG << instance_name_ << __func__
                    << ": already started, state=" << state_;
            return;
        }

        is_started_ = true;
        join_unlocked(its_error);
        state_ = (its_error ? transport_state_e::TS_FAILED
                            : transport_state_e::TS_READY);
        its_state = state_;
    }

    report(its_state, its_error);
    if (its_error)
        return;

    std::scoped_lock its_lock(sync_);
    receive_unlocked();
}

void asio_multicast_membership::join_unlocked(boost::system::error_code &_error) {
    // The caller must hold the lock

    lifecycle_idx_++;

    const bool is_v4(group_.is_v4());
    endpoint_t its_local(
            is_v4 ? ip::address(ip::address_v4::any())
                  : ip::address(ip::address_v6::any()),
            parameters_.port_);

    socket_ = std::make_unique<socket_type>(io_);
    std::ignore = socket_->open(its_local.protocol(), _error);
    if (_error) {
        UDPKIT_ERROR << instance_name_ << __func__ << ": failed to open socket, "
                << _error.message();
        socket_.reset();
        return;
    }

    if (parameters_.reuse_local_endpoint_) {
        std::ignore = socket_->set_option(ip::udp::socket::reuse_address(true), _error);
        if (_error) {
            UDPKIT_ERROR << instance_name_ << __func__
                    << ": failed to configure reuse address, " << _error.message();
            socket_.reset();
            return;
        }
    }

    // Sockets bound to the wildcard address receive the datagrams of every
    // group joined on the port. The destination filters them.
    int its_pktinfo_option(1);
    if (setsockopt(socket_->native_handle(),
            (is_v4 ? IPPROTO_IP : IPPROTO_IPV6),
            (is_v4 ? IP_PKTINFO : IPV6_RECVPKTINFO),
            &its_pktinfo_option, sizeof(its_pktinfo_option)) == -1) {
        _error = boost::system::error_code(errno,
                boost::asio::error::get_system_category());
        UDPKIT_ERROR << instance_name_ << __func__
                << ": failed to enable packet info, " << _error.message();
        socket_.reset();
        return;
    }

#if defined(__linux__)
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
        UDPKIT_ERROR << instance_name_ << __func__ << ": failed to bind, "
                << _error.message();
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

    ip::multicast::join_group its_join_option;
    if (is_v4) {
        ip::address_v4 its_interface_address(ip::address_v4::any());
        if (parameters_.interface_ && parameters_.interface_->address_
                && parameters_.interface_->address_->is_v4()) {
            its_interface_address = parameters_.interface_->address_->to_v4();
        }
        its_join_option = ip::multicast::join_group(group_.to_v4(),
                its_interface_address);
    } else {
        unsigned int its_index(0);
        if (parameters_.interface_)
            its_index = parameters_.interface_->index_;
        its_join_option = ip::multicast::join_group(group_.to_v6(), its_index);
    }

    // "Both ADD_MEMBERSHIP and DROP_MEMBERSHIP are nonblocking operations. They
    // should return immediately indicating either success or failure."
    std::ignore = socket_->set_option(its_join_option, _error);
    if (_error) {
        UDPKIT_ERROR << instance_name_ << __func__ << ": join failure, "
                << _error.message();
        boost::system::error_code its_error;
        std::ignore = socket_->close(its_error);
        socket_.reset();
        return;
    }

    is_joined_ = true;
    UDPKIT_INFO << instance_name_ << __func__ << ": join successful, lifecycle_idx="
            << lifecycle_idx_.load();
}

void asio_multicast_membership::leave_unlocked() {
    // The caller must hold the lock

    if (!socket_)
        return;

    boost::system::error_code its_error;
    if (is_joined_) {
        ip::multicast::leave_group its_leave_option(group_);
        std::ignore = socket_->set_option(its_leave_option, its_error);
        if (its_error) {
            UDPKIT_ERROR << instance_name_ << __func__ << ": leave failure, "
                    << its_error.message();
        } else {
            UDPKIT_INFO << instance_name_ << __func__ << ": leave successful";
        }
        is_joined_ = false;
    }

    std::ignore = socket_->close(its_error);
    socket_.reset();
}

void asio_multicast_membership::receive_unlocked() {
    // The caller must hold the lock

    if (!socket_ || state_ != transport_state_e::TS_READY)
        return;

    socket_->async_wait(socket_type::wait_read,
            strand_.wrap(std::bind(&asio_multicast_membership::receive_cbk,
                    shared_from_this(), lifecycle_idx_.load(),
                    std::placeholders::_1)));
}

std::size_t asio_multicast_membership::receive_message_unlocked(
        ip::address &_destination, boost::system::error_code &_error) {
    // The caller must hold the lock

    // One additional byte to detect oversized datagrams
    recv_buffer_.resize(static_cast<std::size_t>(max_size_) + 1);

    struct iovec its_vec[1];
    its_vec[0].iov_base = recv_buffer_.data();
    its_vec[0].iov_len = recv_buffer_.size();

    union {
        struct sockaddr_in v4;
        struct sockaddr_in6 v6;
    } its_sender;

    union {
        struct cmsghdr cmh;
        union {
            char v4[CMSG_SPACE(sizeof(struct in_pktinfo))];
            char v6[CMSG_SPACE(sizeof(struct in6_pktinfo))];
        } control;
    } its_control;

    const bool is_v4(group_.is_v4());
    struct msghdr its_header;
    std::memset(&its_header, 0, sizeof(its_header));
    its_header.msg_iov = its_vec;
    its_header.msg_iovlen = 1;
    its_header.msg_name = &its_sender;
    its_header.msg_namelen = static_cast<socklen_t>(is_v4 ? sizeof(sockaddr_in)
                                                          : sizeof(sockaddr_in6));
    its_header.msg_control = (is_v4 ? its_control.control.v4 : its_control.control.v6);
    its_header.msg_controllen = (is_v4 ? sizeof(its_control.control.v4)
                                       : sizeof(its_control.control.v6));

    ssize_t its_result;
    do {
        errno = 0;
        its_result = ::recvmsg(socket_->native_handle(), &its_header, MSG_DONTWAIT);
    } while (its_result < 0 && errno == EINTR);

    if (its_result < 0) {
        _error = boost::system::error_code(errno,
                boost::asio::error::get_system_category());
        return 0;
    }

    if (is_v4) {
        remote_ = endpoint_t(ip::address_v4(ntohl(its_sender.v4.sin_addr.s_addr)),
                ntohs(its_sender.v4.sin_port));

        for (struct cmsghdr *cmsg = CMSG_FIRSTHDR(&its_header); cmsg != nullptr;
                cmsg = CMSG_NXTHDR(&its_header, cmsg)) {
            if (cmsg->cmsg_level == IPPROTO_IP && cmsg->cmsg_type == IP_PKTINFO
                    && cmsg->cmsg_len == CMSG_LEN(sizeof(struct in_pktinfo))) {
                struct in_pktinfo its_pktinfo;
                std::memcpy(&its_pktinfo, CMSG_DATA(cmsg), sizeof(its_pktinfo));
                _destination = ip::address_v4(ntohl(its_pktinfo.ipi_addr.s_addr));
                break;
            }
        }
    } else {
        ip::address_v6::bytes_type its_bytes;
        std::memcpy(its_bytes.data(), &its_sender.v6.sin6_addr, its_bytes.size());
        remote_ = endpoint_t(ip::address_v6(its_bytes, its_sender.v6.sin6_scope_id),
                ntohs(its_sender.v6.sin6_port));

        for (struct cmsghdr *cmsg = CMSG_FIRSTHDR(&its_header); cmsg != nullptr;
                cmsg = CMSG_NXTHDR(&its_header, cmsg)) {
            if (cmsg->cmsg_level == IPPROTO_IPV6 && cmsg->cmsg_type == IPV6_PKTINFO
                    && cmsg->cmsg_len == CMSG_LEN(sizeof(struct in6_pktinfo))) {
                struct in6_pktinfo its_pktinfo;
                std::memcpy(&its_pktinfo, CMSG_DATA(cmsg), sizeof(its_pktinfo));
                std::memcpy(its_bytes.data(), &its_pktinfo.ipi6_addr, its_bytes.size());
                _destination = ip::address_v6(its_bytes);
                break;
            }
        }
    }

    return static_cast<std::size_t>(its_result);
}

void asio_multicast_membership::receive_cbk(std::uint32_t _lifecycle_idx,
        const boost::system::error_code &_error) {

    receive_handler_t its_handler;
    std::shared_ptr<message_buffer_t> its_buffer;
    endpoint_t its_remote;
    bool is_complete(true);
    boost::system::error_code its_error(_error);
    {
        std::scoped_lock its_lock(sync_);
        if (_lifecycle_idx != lifecycle_idx_
                || state_ != transport_state_e::TS_READY) {
            return;
        }

        if (its_error == boost::asio::error::operation_aborted)
            return;

        ip::address its_destination;
        std::size_t its_size(0);
        if (!its_error)
            its_size = receive_message_unlocked(its_destination, its_error);

        if (its_error == boost::asio::error::would_block
                || its_error == boost::asio::error::try_again) {
            receive_unlocked();
            return;
        }

        if (its_error) {
            UDPKIT_ERROR << instance_name_ << __func__ << ": "
                    << its_error.message() << " (" << its_error.value() << ")";
            state_ = transport_state_e::TS_FAILED;
            leave_unlocked();
        } else {
            if (its_destination != group_) {
                UDPKIT_TRACE << instance_name_ << __func__
                        << ": dropped datagram for " << its_destination;
                receive_unlocked();
                return;
            }

            if (its_size > max_size_) {
                if (reject_oversized_) {
                    UDPKIT_WARNING << instance_name_ << __func__
                            << ": rejected oversized datagram from " << remote_;
                    receive_unlocked();
                    return;
                }
                its_size = max_size_;
                is_complete = false;
            }

            its_buffer = std::make_shared<message_buffer_t>(
                    recv_buffer_.begin(),
                    recv_buffer_.begin() + static_cast<std::ptrdiff_t>(its_size));
            its_remote = remote_;
            its_handler = receive_handler_;
        }
    }

    if (its_error) {
        report(transport_state_e::TS_FAILED, its_error);
        return;
    }

    if (its_handler)
        its_handler(its_buffer, its_remote, is_complete);

    std::scoped_lock its_lock(sync_);
    receive_unlocked();
}

void asio_multicast_membership::cancel() {
    boost::asio::post(strand_,
            std::bind(&asio_multicast_membership::cancel_cbk, shared_from_this()));
}

void asio_multicast_membership::cancel_cbk() {
    {
        std::scoped_lock its_lock(sync_);
        if (state_ == transport_state_e::TS_CANCELLED)
            return;

        state_ = transport_state_e::TS_CANCELLED;
        lifecycle_idx_++;
        leave_unlocked();
    }

    report(transport_state_e::TS_CANCELLED, boost::system::error_code());
}

void asio_multicast_membership::report(transport_state_e _state,
        const boost::system::error_code &_error) {

    UDPKIT_INFO << instance_name_ << __func__ << ": " << _state
            << (_error ? ", " + _error.message() : "");

    state_handler_t its_handler;
    {
        std::scoped_lock its_lock(sync_);
        its_handler = state_handler_;
        if (is_terminal(_state)) {
            state_handler_ = nullptr;
            receive_handler_ = nullptr;
        }
    }

    if (its_handler)
        its_handler(_state, _error);
}

} // namespace udpkit_v1
