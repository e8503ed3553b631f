// Copyright (C) 2014-2025 Bayerische Motoren Werke Aktiengesellschaft (BMW AG)
// This Source Code Form is subject to the terms of the Mozilla Public
// License, v. 2.0. If a copy of the MPL was not distributed with this
// file, You can obtain one at http://mozilla.org/MPL/2.0/.

#ifndef UDPKIT_V1_ERROR_HPP_
#define UDPKIT_V1_ERROR_HPP_

#include <exception>
#include <stdexcept>
#include <string>
#include <vector>

#include <udpkit/export.hpp>
#include <udpkit/primitive_types.hpp>

namespace udpkit_v1 {

enum class error_code_e : uint8_t {
    INVALID_PORT,
    INVALID_MULTICAST_GROUP,
    MULTIPLE_ERRORS,
    NO_CONNECTION_FOR_ENDPOINT
};

extern const char *ERROR_INFO[];

/**
 *
 * \brief Exception thrown by the synchronous server operations.
 *
 * The error code identifies the failure, the message names the offending
 * value. An error of kind MULTIPLE_ERRORS carries every collected failure,
 * which may be further server_error instances or transport errors
 * (boost::system::system_error).
 *
 */
class UDPKIT_IMPORT_EXPORT server_error : public std::runtime_error {
public:
    server_error(error_code_e _code, const std::string &_what);
    server_error(std::vector<std::exception_ptr> _errors);

    error_code_e code() const noexcept { return code_; }
    const std::vector<std::exception_ptr> & errors() const noexcept { return errors_; }

private:
    error_code_e code_;
    std::vector<std::exception_ptr> errors_;
};

} // namespace udpkit_v1

#endif // UDPKIT_V1_ERROR_HPP_
