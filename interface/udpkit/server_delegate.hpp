// Copyright (C) 2014-2025 Bayerische Motoren Werke Aktiengesellschaft (BMW AG)
// This Source Code Form is subject to the terms of the Mozilla Public
// License, v. 2.0. If a copy of the MPL was not distributed with this
// file, You can obtain one at http://mozilla.org/MPL/2.0/.

#ifndef UDPKIT_V1_SERVER_DELEGATE_HPP_
#define UDPKIT_V1_SERVER_DELEGATE_HPP_

#include <optional>

#include <boost/system/error_code.hpp>

#include <udpkit/endpoint.hpp>
#include <udpkit/primitive_types.hpp>

namespace udpkit_v1 {

class server;

/**
 *
 * \brief Receives the notifications of a @ref server.
 *
 * All notifications of one server are delivered in order from the server's
 * serial context, never concurrently. The server only keeps a weak
 * reference to its delegate; the application must keep it alive as long as
 * it wants to be notified.
 *
 */
class server_delegate {
public:
    virtual ~server_delegate() = default;

    /**
     *
     * \brief Called when the server has started listening.
     *
     * \param _server The server that started listening.
     *
     */
    virtual void on_started_listening(server &_server) = 0;

    /**
     *
     * \brief Called when the server has stopped listening.
     *
     * This is called whenever the server stops listening, even when this was
     * requested by the application. If the server stopped because of a
     * transport failure, the error is passed; otherwise it is empty.
     *
     * \param _server The server that stopped listening.
     * \param _error The transport error that caused the stop, if any.
     *
     */
    virtual void on_stopped_listening(server &_server,
            const boost::system::error_code &_error) = 0;

    /**
     *
     * \brief Called for every datagram the server received.
     *
     * The data is only valid for the duration of the call.
     *
     * \param _server The server that received the datagram.
     * \param _data Pointer to the datagram payload.
     * \param _length Length of the datagram payload.
     * \param _source Sender of the datagram, if known.
     *
     */
    virtual void on_message_received(server &_server,
            const byte_t *_data, length_t _length,
            const std::optional<endpoint_t> &_source) = 0;
};

} // namespace udpkit_v1

#endif // UDPKIT_V1_SERVER_DELEGATE_HPP_
