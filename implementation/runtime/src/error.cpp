// Copyright (C) 2015-2025 Bayerische Motoren Werke Aktiengesellschaft (BMW AG)
// This Source Code Form is subject to the terms of the Mozilla Public
// License, v. 2.0. If a copy of the MPL was not distributed with this
// file, You can obtain one at http://mozilla.org/MPL/2.0/.

#include <utility>

#include <udpkit/error.hpp>

namespace udpkit_v1 {

const char *ERROR_INFO[] = { "Invalid port", "Invalid multicast group",
        "Multiple errors", "No connection for endpoint" };

server_error::server_error(error_code_e _code, const std::string &_what)
    : std::runtime_error(std::string(ERROR_INFO[static_cast<int>(_code)])
            + ": " + _what),
      code_(_code) {
}

server_error::server_error(std::vector<std::exception_ptr> _errors)
    : std::runtime_error("There are multiple errors ("
            + std::to_string(_errors.size()) + ")."),
      code_(error_code_e::MULTIPLE_ERRORS),
      errors_(std::move(_errors)) {
}

} // namespace udpkit_v1
