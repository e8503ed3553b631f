// Copyright (C) 2014-2025 Bayerische Motoren Werke Aktiengesellschaft (BMW AG)
// This Source Code Form is subject to the terms of the Mozilla Public
// License, v. 2.0. If a copy of the MPL was not distributed with this
// file, You can obtain one at http://mozilla.org/MPL/2.0/.

#ifndef UDPKIT_V1_CFG_CONFIGURATION_IMPL_HPP_
#define UDPKIT_V1_CFG_CONFIGURATION_IMPL_HPP_

#include <map>
#include <memory>
#include <mutex>
#include <set>
#include <string>
#include <vector>

#include <boost/property_tree/ptree.hpp>

#include <udpkit/export.hpp>

#include "configuration.hpp"
#include "configuration_element.hpp"

namespace udpkit_v1 {
namespace cfg {

struct server;

class configuration_impl : public configuration,
        public std::enable_shared_from_this<configuration_impl> {
public:
    UDPKIT_EXPORT configuration_impl(const std::string &_path = "");
    UDPKIT_EXPORT virtual ~configuration_impl();

    UDPKIT_EXPORT bool load(const std::string &_name) override;

    UDPKIT_EXPORT const std::string &get_path() const override;

    UDPKIT_EXPORT logger::level_e get_loglevel() const override;
    UDPKIT_EXPORT bool has_console_log() const override;
    UDPKIT_EXPORT bool has_file_log() const override;
    UDPKIT_EXPORT const std::string &get_logfile() const override;

    UDPKIT_EXPORT std::shared_ptr<cfg::server> get_server(const std::string &_name) const override;
    UDPKIT_EXPORT std::set<std::string> get_server_names() const override;

    UDPKIT_EXPORT int get_udp_receive_buffer_size() const override;

private:
    void read_data(const std::set<std::string> &_input,
            std::vector<configuration_element> &_elements,
            std::set<std::string> &_failed);
    void read_file(const std::string &_input,
            std::vector<configuration_element> &_elements,
            std::set<std::string> &_failed);
    void load_data(const std::vector<configuration_element> &_elements);

    bool load_logging(const configuration_element &_element,
            std::set<std::string> &_warnings);
    void load_servers(const configuration_element &_element);
    void load_server(const boost::property_tree::ptree &_tree,
            const std::string &_file_name);
    void load_udp_receive_buffer_size(const configuration_element &_element);

    bool is_true(const std::string &_value) const;

private:
    std::string path_;

    mutable std::mutex mutex_;

    bool is_logging_loaded_;
    bool has_console_log_;
    bool has_file_log_;
    std::string logfile_;
    logger::level_e loglevel_;

    std::map<std::string, std::shared_ptr<cfg::server>> servers_;

    int udp_receive_buffer_size_;

    enum element_type_e {
        ET_LOGGING_CONSOLE,
        ET_LOGGING_FILE,
        ET_LOGGING_LEVEL,
        ET_UDP_RECEIVE_BUFFER_SIZE,
        ET_MAX
    };

    bool is_configured_[ET_MAX];
};

} // namespace cfg
} // namespace udpkit_v1

#endif // UDPKIT_V1_CFG_CONFIGURATION_IMPL_HPP_
