// Copyright (C) 2014-2025 Bayerische Motoren Werke Aktiengesellschaft (BMW AG)
// This Source Code Form is subject to the terms of the Mozilla Public
// License, v. 2.0. If a copy of the MPL was not distributed with this
// file, You can obtain one at http://mozilla.org/MPL/2.0/.

#ifndef UDPKIT_V1_UTILITY_HPP
#define UDPKIT_V1_UTILITY_HPP

#include <optional>
#include <string>

#include <boost/asio/ip/address.hpp>

#include <udpkit/export.hpp>
#include <udpkit/primitive_types.hpp>

namespace udpkit_v1 {

struct network_interface {
    std::string name_;
    unsigned int index_;
    // Address to bind multicast memberships to, if the interface has one
    std::optional<boost::asio::ip::address> address_;
};

class utility {
public:
    static bool UDPKIT_IMPORT_EXPORT is_file(const std::string &_path);
    static bool UDPKIT_IMPORT_EXPORT is_folder(const std::string &_path);

    static inline bool is_valid_port(port_t _port) {
        return (_port != 0);
    }

    static bool is_valid_multicast_address(const std::string &_address);

    /**
     * Looks up a network interface either by one of its addresses (if
     * _name_or_address is a literal IPv4/IPv6 address) or by its name.
     * Returns std::nullopt if no interface matches.
     */
    static std::optional<network_interface> resolve_interface(
            const std::string &_name_or_address);
};

}  // namespace udpkit_v1

#endif // UDPKIT_V1_UTILITY_HPP
