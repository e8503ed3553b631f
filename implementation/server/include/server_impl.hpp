// Copyright (C) 2025 Bayerische Motoren Werke Aktiengesellschaft (BMW AG)
// This Source Code Form is subject to the terms of the Mozilla Public
// License, v. 2.0. If a copy of the MPL was not distributed with this
// file, You can obtain one at http://mozilla.org/MPL/2.0/.

#ifndef UDPKIT_V1_SERVER_IMPL_HPP_
#define UDPKIT_V1_SERVER_IMPL_HPP_

#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <vector>

#include <boost/asio/io_context.hpp>
#include <boost/asio/io_context_strand.hpp>
#include <boost/asio/ip/address.hpp>

#include <udpkit/export.hpp>
#include <udpkit/server.hpp>

#include "../../endpoints/include/transport_parameters.hpp"
#include "../../endpoints/include/transport_state.hpp"

namespace udpkit_v1 {

class abstract_transport_factory;
class server_connection;
class server_connection_group;
class udp_flow;
class udp_listener;

class server_impl : public server,
        public std::enable_shared_from_this<server_impl> {
public:
    UDPKIT_EXPORT server_impl(boost::asio::io_context &_io,
            const std::optional<std::string> &_interface, port_t _port,
            const std::optional<std::vector<std::string>> &_multicast_groups,
            const std::shared_ptr<abstract_transport_factory> &_factory);
    UDPKIT_EXPORT ~server_impl() override;

    UDPKIT_EXPORT void start_listening() override;
    UDPKIT_EXPORT void stop_listening(bool _clearing_multicast = false) override;

    UDPKIT_EXPORT void join_multicast_group(const std::string &_group) override;
    UDPKIT_EXPORT void leave_multicast_group(const std::string &_group) override;
    UDPKIT_EXPORT std::vector<std::string> get_joined_multicast_groups() const override;

    UDPKIT_EXPORT bool is_listening() const override;

    UDPKIT_EXPORT std::optional<std::string> get_interface() const override;
    UDPKIT_EXPORT void set_interface(const std::optional<std::string> &_interface) override;
    UDPKIT_EXPORT port_t get_port() const override;
    UDPKIT_EXPORT void set_port(port_t _port) override;

    UDPKIT_EXPORT void set_local_endpoint_reuse(bool _allow) override;

    UDPKIT_EXPORT std::shared_ptr<server_delegate> get_delegate() const override;
    UDPKIT_EXPORT void set_delegate(const std::shared_ptr<server_delegate> &_delegate) override;

    UDPKIT_EXPORT void disconnect_from(const endpoint_t &_remote) override;
    UDPKIT_EXPORT std::size_t get_connection_count() const override;
    UDPKIT_EXPORT std::size_t get_connection_group_count() const override;

    UDPKIT_EXPORT void print_status() const override;

    // Settings taken from the configuration
    void set_fast_open(bool _allow);
    void set_receive_buffer_size(int _size);

    // Desired multicast groups, not set in unicast mode
    UDPKIT_EXPORT std::optional<std::set<std::string>> get_multicast_groups() const;

    // Entry points of the connections and connection groups. They may be
    // called from any thread and are re-dispatched to the server's strand.
    void on_connection_state(const std::shared_ptr<server_connection> &_connection,
            transport_state_e _state, const boost::system::error_code &_error);
    void on_connection_message(const std::shared_ptr<server_connection> &_connection,
            const std::shared_ptr<message_buffer_t> &_buffer);
    void on_connection_group_state(
            const std::shared_ptr<server_connection_group> &_connection_group,
            transport_state_e _state, const boost::system::error_code &_error);
    void on_connection_group_message(
            const std::shared_ptr<server_connection_group> &_connection_group,
            const std::shared_ptr<message_buffer_t> &_buffer,
            const std::optional<endpoint_t> &_source);

private:
    void configure_unlocked();
    void configure_listener_unlocked();
    void wire_listener_unlocked(const std::shared_ptr<udp_listener> &_listener);
    void discard_listener_unlocked();
    void discard_joining_groups_unlocked();
    transport_parameters make_parameters_unlocked() const;

    void stop_listening_unlocked(bool _clearing_multicast);
    void join_multicast_group_unlocked(const boost::asio::ip::address &_host);
    void leave_multicast_group_unlocked(const boost::asio::ip::address &_host,
            bool _preserve);

    void update_listening_unlocked(const boost::system::error_code &_error);

    void on_listener_state(const std::shared_ptr<udp_listener> &_listener,
            transport_state_e _state, const boost::system::error_code &_error);
    void on_new_flow(const std::shared_ptr<udp_listener> &_listener,
            const std::shared_ptr<udp_flow> &_flow);

    void listener_state_cbk(const std::shared_ptr<udp_listener> &_listener,
            transport_state_e _state, const boost::system::error_code &_error);
    void new_flow_cbk(const std::shared_ptr<udp_listener> &_listener,
            const std::shared_ptr<udp_flow> &_flow);
    void connection_state_cbk(const std::shared_ptr<server_connection> &_connection,
            transport_state_e _state, const boost::system::error_code &_error);
    void connection_message_cbk(const std::shared_ptr<server_connection> &_connection,
            const std::shared_ptr<message_buffer_t> &_buffer);
    void connection_group_state_cbk(
            const std::shared_ptr<server_connection_group> &_connection_group,
            transport_state_e _state, const boost::system::error_code &_error);
    void connection_group_message_cbk(
            const std::shared_ptr<server_connection_group> &_connection_group,
            const std::shared_ptr<message_buffer_t> &_buffer,
            const std::optional<endpoint_t> &_source);

    void notify_listening(bool _is_listening, const boost::system::error_code &_error);
    void notify_message(const std::shared_ptr<message_buffer_t> &_buffer,
            const std::optional<endpoint_t> &_source);

private:
    boost::asio::io_context &io_;
    boost::asio::io_context::strand strand_;
    const std::shared_ptr<abstract_transport_factory> factory_;

    mutable std::mutex sync_;

    std::optional<std::string> interface_;
    port_t port_;
    bool reuse_local_endpoint_;
    bool fast_open_;
    int receive_buffer_size_;

    // Not set: unicast mode
    std::optional<std::set<boost::asio::ip::address>> multicast_groups_;
    std::set<boost::asio::ip::address> joined_multicast_groups_;

    std::shared_ptr<udp_listener> listener_;
    bool is_listener_ready_;
    bool is_listener_cancelling_;

    std::map<connection_id_t, std::shared_ptr<server_connection>> connections_;
    // Ready groups
    std::map<connection_id_t, std::shared_ptr<server_connection_group>> connection_groups_;
    // Groups that are started but not yet ready
    std::map<connection_id_t, std::shared_ptr<server_connection_group>> joining_groups_;

    bool is_listening_;

    std::weak_ptr<server_delegate> delegate_;

    std::string instance_name_;
};

} // namespace udpkit_v1

#endif // UDPKIT_V1_SERVER_IMPL_HPP_
