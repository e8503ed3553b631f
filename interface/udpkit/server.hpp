// Copyright (C) 2014-2025 Bayerische Motoren Werke Aktiengesellschaft (BMW AG)
// This Source Code Form is subject to the terms of the Mozilla Public
// License, v. 2.0. If a copy of the MPL was not distributed with this
// file, You can obtain one at http://mozilla.org/MPL/2.0/.

#ifndef UDPKIT_V1_SERVER_HPP_
#define UDPKIT_V1_SERVER_HPP_

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include <udpkit/endpoint.hpp>
#include <udpkit/primitive_types.hpp>

namespace udpkit_v1 {

class server_delegate;

/**
 * \defgroup udpkit
 *
 * @{
 */

/**
 *
 * \brief This class contains the public API of a UDP server.
 *
 * A server owns one UDP port. It either listens on the port as a plain
 * unicast listener, or, once multicast groups have been joined, maintains one
 * membership per group. Received datagrams of both modes are passed to the
 * @ref server_delegate.
 *
 * Servers are created using the API of @ref runtime. All methods may be
 * called from any thread. None of them waits for network I/O: the outcome
 * of starting or stopping is reported to the delegate.
 *
 */
class server {
public:
    virtual ~server() {}

    /**
     *
     * \brief Starts listening for datagrams.
     *
     * If the server was stopped but its unicast listener still exists, the
     * listener is restarted. Otherwise the server is configured from its
     * current interface, port and multicast groups. When multicast groups are
     * configured, one membership per group is created.
     *
     * \throws server_error INVALID_PORT if the port is zero,
     * INVALID_MULTICAST_GROUP or MULTIPLE_ERRORS if joining the configured
     * groups failed.
     * \throws boost::system::system_error if the transport refused to create
     * the listener or a membership.
     *
     */
    virtual void start_listening() = 0;

    /**
     *
     * \brief Stops listening for datagrams.
     *
     * Does nothing if the server is not listening. By default the joined
     * multicast groups are remembered and rejoined by the next call to
     * @ref start_listening.
     *
     * \param _clearing_multicast Forget the joined multicast groups, so that
     * the next start listens in unicast mode.
     *
     */
    virtual void stop_listening(bool _clearing_multicast = false) = 0;

    /**
     *
     * \brief Joins a multicast group.
     *
     * If the server currently is a unicast listener, it is switched to
     * multicast mode and stopped. It must be started again by calling @ref
     * start_listening, which allows to join further groups before.
     * If the server already is in multicast mode, the group is joined
     * immediately.
     *
     * \param _group IPv4 or IPv6 multicast address.
     *
     * \throws server_error INVALID_MULTICAST_GROUP if the address is not a
     * multicast address, INVALID_PORT if the port is zero.
     *
     */
    virtual void join_multicast_group(const std::string &_group) = 0;

    /**
     *
     * \brief Leaves a multicast group.
     *
     * Does nothing if the group is not joined. Leaving the last group
     * switches the server back to unicast mode for the next start.
     *
     * \param _group IPv4 or IPv6 multicast address.
     *
     * \throws server_error INVALID_MULTICAST_GROUP if the address is not a
     * multicast address.
     *
     */
    virtual void leave_multicast_group(const std::string &_group) = 0;

    /**
     *
     * \brief Returns the multicast groups that were successfully joined.
     *
     */
    virtual std::vector<std::string> get_joined_multicast_groups() const = 0;

    /**
     *
     * \brief Returns whether the server is listening.
     *
     * The server is listening while its unicast listener or at least one of
     * its multicast memberships is ready.
     *
     */
    virtual bool is_listening() const = 0;

    virtual std::optional<std::string> get_interface() const = 0;

    /**
     *
     * \brief Sets the interface to listen on.
     *
     * The interface may be given by name (e.g. "eth0") or by one of its
     * addresses (e.g. "10.0.0.1"). If it is not set or cannot be found, the
     * server listens on all interfaces. Changing the interface stops the
     * server.
     *
     */
    virtual void set_interface(const std::optional<std::string> &_interface) = 0;

    virtual port_t get_port() const = 0;

    /**
     *
     * \brief Sets the port to listen on. Changing the port stops the server.
     *
     */
    virtual void set_port(port_t _port) = 0;

    /**
     *
     * \brief Configures whether local addresses and ports may be reused.
     *
     * Applies to listeners and memberships created afterwards. Enabled by
     * default.
     *
     */
    virtual void set_local_endpoint_reuse(bool _allow) = 0;

    virtual std::shared_ptr<server_delegate> get_delegate() const = 0;

    /**
     *
     * \brief Sets the delegate. Pass nullptr to stop receiving notifications.
     *
     * Only a weak reference is kept.
     *
     */
    virtual void set_delegate(const std::shared_ptr<server_delegate> &_delegate) = 0;

    /**
     *
     * \brief Disconnects the peer with the given endpoint.
     *
     * \throws server_error NO_CONNECTION_FOR_ENDPOINT if no connection of
     * this peer is tracked.
     *
     */
    virtual void disconnect_from(const endpoint_t &_remote) = 0;

    virtual std::size_t get_connection_count() const = 0;
    virtual std::size_t get_connection_group_count() const = 0;

    /**
     *
     * \brief Logs the current state of the server.
     *
     */
    virtual void print_status() const = 0;
};

/** @} */

} // namespace udpkit_v1

#endif // UDPKIT_V1_SERVER_HPP_
