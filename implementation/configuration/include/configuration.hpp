// Copyright (C) 2014-2025 Bayerische Motoren Werke Aktiengesellschaft (BMW AG)
// This Source Code Form is subject to the terms of the Mozilla Public
// License, v. 2.0. If a copy of the MPL was not distributed with this
// file, You can obtain one at http://mozilla.org/MPL/2.0/.

#ifndef UDPKIT_V1_CONFIGURATION_HPP_
#define UDPKIT_V1_CONFIGURATION_HPP_

#include <memory>
#include <set>
#include <string>

#include <udpkit/internal/logger.hpp>

namespace udpkit_v1 {

namespace cfg {
struct server;
}

class configuration {
public:
    virtual ~configuration() {}

    virtual bool load(const std::string &_name) = 0;

    virtual const std::string &get_path() const = 0;

    virtual logger::level_e get_loglevel() const = 0;
    virtual bool has_console_log() const = 0;
    virtual bool has_file_log() const = 0;
    virtual const std::string &get_logfile() const = 0;

    virtual std::shared_ptr<cfg::server> get_server(const std::string &_name) const = 0;
    virtual std::set<std::string> get_server_names() const = 0;

    virtual int get_udp_receive_buffer_size() const = 0;
};

} // namespace udpkit_v1

#endif // UDPKIT_V1_CONFIGURATION_HPP_
