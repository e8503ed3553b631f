// Copyright (C) 2014-2025 Bayerische Motoren Werke Aktiengesellschaft (BMW AG)
// This Source Code Form is subject to the terms of the Mozilla Public
// License, v. 2.0. If a copy of the MPL was not distributed with this
// file, You can obtain one at http://mozilla.org/MPL/2.0/.

#include <cerrno>
#include <cstring>

#include <ifaddrs.h>
#include <net/if.h>
#include <netinet/in.h>
#include <sys/stat.h>

#include <udpkit/internal/logger.hpp>

#include "../include/utility.hpp"

namespace udpkit_v1 {

namespace {

std::optional<boost::asio::ip::address> to_address(const struct sockaddr *_sa) {
    if (_sa == nullptr)
        return std::nullopt;

    if (_sa->sa_family == AF_INET) {
        const auto *its_sin = reinterpret_cast<const struct sockaddr_in *>(_sa);
        boost::asio::ip::address_v4::bytes_type its_bytes;
        std::memcpy(its_bytes.data(), &its_sin->sin_addr, its_bytes.size());
        return boost::asio::ip::address_v4(its_bytes);
    }

    if (_sa->sa_family == AF_INET6) {
        const auto *its_sin6 = reinterpret_cast<const struct sockaddr_in6 *>(_sa);
        boost::asio::ip::address_v6::bytes_type its_bytes;
        std::memcpy(its_bytes.data(), &its_sin6->sin6_addr, its_bytes.size());
        return boost::asio::ip::address_v6(its_bytes, its_sin6->sin6_scope_id);
    }

    return std::nullopt;
}

} // namespace

bool utility::is_file(const std::string &_path) {
    struct stat its_stat;
    if (stat(_path.c_str(), &its_stat) == 0) {
        if (its_stat.st_mode & S_IFREG)
            return true;
    }
    return false;
}

bool utility::is_folder(const std::string &_path) {
    struct stat its_stat;
    if (stat(_path.c_str(), &its_stat) == 0) {
        if (its_stat.st_mode & S_IFDIR)
            return true;
    }
    return false;
}

bool utility::is_valid_multicast_address(const std::string &_address) {
    boost::system::error_code ec;
    auto its_address = boost::asio::ip::make_address(_address, ec);
    if (ec)
        return false;
    return its_address.is_multicast();
}

std::optional<network_interface>
utility::resolve_interface(const std::string &_name_or_address) {

    if (_name_or_address.empty())
        return std::nullopt;

    boost::system::error_code ec;
    const auto its_literal = boost::asio::ip::make_address(_name_or_address, ec);
    const bool is_literal(!ec);

    struct ifaddrs *its_ifaddrs(nullptr);
    if (getifaddrs(&its_ifaddrs) != 0) {
        UDPKIT_ERROR << __func__ << ": getifaddrs failed: "
                << std::strerror(errno);
        return std::nullopt;
    }

    std::optional<network_interface> its_result;
    for (auto ifa = its_ifaddrs; ifa != nullptr; ifa = ifa->ifa_next) {
        if (ifa->ifa_name == nullptr)
            continue;

        auto its_address = to_address(ifa->ifa_addr);
        if (is_literal) {
            if (!its_address || *its_address != its_literal)
                continue;
            its_result = network_interface {
                ifa->ifa_name, if_nametoindex(ifa->ifa_name), its_address };
            break;
        }

        if (_name_or_address != ifa->ifa_name)
            continue;

        if (!its_result) {
            its_result = network_interface {
                ifa->ifa_name, if_nametoindex(ifa->ifa_name), std::nullopt };
        }

        // Prefer an IPv4 address for the interface
        if (its_address
                && (!its_result->address_ || (its_address->is_v4()
                        && !its_result->address_->is_v4()))) {
            its_result->address_ = its_address;
        }
    }

    freeifaddrs(its_ifaddrs);

    if (its_result && its_result->index_ == 0) {
        UDPKIT_WARNING << __func__ << ": Cannot determine index of interface "
                << its_result->name_;
    }

    return its_result;
}

}  // namespace udpkit_v1
