// Copyright (C) 2014-2025 Bayerische Motoren Werke Aktiengesellschaft (BMW AG)
// This Source Code Form is subject to the terms of the Mozilla Public
// License, v. 2.0. If a copy of the MPL was not distributed with this
// file, You can obtain one at http://mozilla.org/MPL/2.0/.

#ifndef UDPKIT_V1_RUNTIME_HPP_
#define UDPKIT_V1_RUNTIME_HPP_

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include <boost/asio/io_context.hpp>

#include <udpkit/export.hpp>
#include <udpkit/primitive_types.hpp>

namespace udpkit_v1 {

class server;

/**
 *
 * \defgroup udpkit
 *
 * @{
 *
 */

/**
 *
 * \brief Singleton class containing all public resource management
 * facilities of udpkit.
 *
 * It is the entry point to create instances of the @ref server class.
 * Servers do not run their own threads: the application runs the
 * io_context it passes to the server.
 *
 */
class UDPKIT_IMPORT_EXPORT runtime {
public:
    static std::shared_ptr<runtime> get();

    virtual ~runtime() {
    }

    /**
     *
     * \brief Creates a server from the configuration.
     *
     * The configuration is searched for a server entry with the given name.
     * If the name is empty, it is taken from the environment variable
     * "UDPKIT_SERVER_NAME". If no matching entry exists, nullptr is returned.
     *
     * \param _io The io_context that processes the server's network events
     * and delegate notifications.
     * \param _name Name of the server entry in the configuration.
     *
     */
    virtual std::shared_ptr<server> create_server(boost::asio::io_context &_io,
            const std::string &_name = "") = 0;

    /**
     *
     * \brief Creates a server from explicit parameters.
     *
     * Invalid multicast addresses within _multicast_groups are dropped. If
     * _multicast_groups is not set, the server starts as a unicast listener.
     *
     * \param _io The io_context that processes the server's network events
     * and delegate notifications.
     * \param _interface Interface name or address to listen on, or all
     * interfaces if not set.
     * \param _port UDP port to listen on.
     * \param _multicast_groups Multicast groups to join when started.
     *
     */
    virtual std::shared_ptr<server> create_server(boost::asio::io_context &_io,
            const std::optional<std::string> &_interface, port_t _port,
            const std::optional<std::vector<std::string>> &_multicast_groups
                = std::nullopt) = 0;
};

/** @} */

} // namespace udpkit_v1

#endif // UDPKIT_V1_RUNTIME_HPP_
