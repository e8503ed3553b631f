// Copyright (C) 2014-2025 Bayerische Motoren Werke Aktiengesellschaft (BMW AG)
// This Source Code Form is subject to the terms of the Mozilla Public
// License, v. 2.0. If a copy of the MPL was not distributed with this
// file, You can obtain one at http://mozilla.org/MPL/2.0/.

#include <cstdlib>
#include <limits>
#include <sstream>

#include <boost/filesystem.hpp>
#include <boost/property_tree/json_parser.hpp>

#include <udpkit/defines.hpp>
#include <udpkit/internal/logger.hpp>

#include "../include/configuration_impl.hpp"
#include "../include/server.hpp"
#include "../../logger/include/logger_impl.hpp"
#include "../../utility/include/utility.hpp"

namespace udpkit_v1 {
namespace cfg {

configuration_impl::configuration_impl(const std::string &_path)
    : path_(_path),
      is_logging_loaded_(false),
      has_console_log_(true),
      has_file_log_(false),
      logfile_("/tmp/udpkit.log"),
      loglevel_(logger::level_e::LL_INFO),
      udp_receive_buffer_size_(UDPKIT_DEFAULT_UDP_RECEIVE_BUFFER_SIZE) {

    for (auto i = 0; i < ET_MAX; i++)
        is_configured_[i] = false;
}

configuration_impl::~configuration_impl() {
}

bool configuration_impl::load(const std::string &_name) {
    std::scoped_lock its_lock(mutex_);

    std::string its_file;
    std::string its_folder;

    if (!path_.empty()) {
        if (utility::is_file(path_)) {
            its_file = path_;
        } else {
            its_folder = path_;
        }
    } else {
        // Local file overrides the system wide default
        if (utility::is_file(UDPKIT_LOCAL_CONFIGURATION_FILE)) {
            its_file = UDPKIT_LOCAL_CONFIGURATION_FILE;
        } else {
            its_file = UDPKIT_DEFAULT_CONFIGURATION_FILE;
        }

        // Override with path from environment (if existing)
        std::string its_named_configuration(UDPKIT_ENV_CONFIGURATION);
        its_named_configuration += "_" + _name;

        const char *its_env = getenv(its_named_configuration.c_str());
        if (nullptr == its_env)
            its_env = getenv(UDPKIT_ENV_CONFIGURATION);
        if (nullptr != its_env) {
            if (utility::is_file(its_env)) {
                its_file = its_env;
                its_folder = "";
            } else if (utility::is_folder(its_env)) {
                its_folder = its_env;
                its_file = "";
            }
        }
    }

    std::set<std::string> its_input;
    if (!its_file.empty() && utility::is_file(its_file))
        its_input.insert(its_file);
    if (!its_folder.empty() && utility::is_folder(its_folder))
        its_input.insert(its_folder);

    std::set<std::string> its_failed;
    std::vector<configuration_element> its_elements;
    read_data(its_input, its_elements, its_failed);
    load_data(its_elements);

    if (!is_logging_loaded_) {
        // Apply the defaults
        logger::logger_impl::init(shared_from_this());
    }

    for (const auto &f : its_failed)
        UDPKIT_WARNING << "Reading of configuration file \""
            << f << "\" failed. Configuration may be incomplete.";

    if (its_input.empty()) {
        UDPKIT_INFO << "No configuration found, using defaults.";
    }

    return its_failed.empty();
}

void configuration_impl::read_data(const std::set<std::string> &_input,
        std::vector<configuration_element> &_elements,
        std::set<std::string> &_failed) {
    for (const auto &i : _input) {
        if (utility::is_file(i)) {
            read_file(i, _elements, _failed);
        } else if (utility::is_folder(i)) {
            // Read in ascending order of the file names, so that later
            // files can be named to override generic ones.
            std::set<std::string> its_names;
            boost::filesystem::path its_path(i);
            for (auto j = boost::filesystem::directory_iterator(its_path);
                    j != boost::filesystem::directory_iterator();
                    j++) {
                if (!boost::filesystem::is_directory(j->path())
                        && j->path().extension() == ".json") {
                    its_names.insert(j->path().string());
                }
            }

            for (const auto &n : its_names)
                read_file(n, _elements, _failed);
        }
    }
}

void configuration_impl::read_file(const std::string &_input,
        std::vector<configuration_element> &_elements,
        std::set<std::string> &_failed) {
    boost::property_tree::ptree its_tree;
    try {
        boost::property_tree::json_parser::read_json(_input, its_tree);
        _elements.push_back({ _input, its_tree });
    }
    catch (boost::property_tree::json_parser_error&) {
        _failed.insert(_input);
    }
}

void configuration_impl::load_data(
        const std::vector<configuration_element> &_elements) {
    std::set<std::string> its_warnings;

    if (!is_logging_loaded_) {
        for (const auto& e : _elements)
            is_logging_loaded_
                = load_logging(e, its_warnings) || is_logging_loaded_;

        if (is_logging_loaded_) {
            logger::logger_impl::init(shared_from_this());
            for (const auto& w : its_warnings)
                UDPKIT_WARNING << w;
        }
    }

    for (const auto& e : _elements) {
        load_servers(e);
        load_udp_receive_buffer_size(e);
    }
}

bool configuration_impl::load_logging(
        const configuration_element &_element, std::set<std::string> &_warnings) {
    auto its_logging = _element.tree_.get_child_optional("logging");
    if (!its_logging)
        return false;

    for (auto i = its_logging->begin(); i != its_logging->end(); ++i) {
        std::string its_key(i->first);
        if (its_key == "console") {
            if (is_configured_[ET_LOGGING_CONSOLE]) {
                _warnings.insert("Multiple definitions for logging.console."
                        " Ignoring definition from " + _element.name_);
            } else {
                has_console_log_ = is_true(i->second.data());
                is_configured_[ET_LOGGING_CONSOLE] = true;
            }
        } else if (its_key == "file") {
            if (is_configured_[ET_LOGGING_FILE]) {
                _warnings.insert("Multiple definitions for logging.file."
                        " Ignoring definition from " + _element.name_);
            } else {
                for (const auto &j : i->second) {
                    std::string its_sub_key(j.first);
                    std::string its_sub_value(j.second.data());
                    if (its_sub_key == "enable") {
                        has_file_log_ = is_true(its_sub_value);
                    } else if (its_sub_key == "path") {
                        logfile_ = its_sub_value;
                    }
                }
                is_configured_[ET_LOGGING_FILE] = true;
            }
        } else if (its_key == "level") {
            if (is_configured_[ET_LOGGING_LEVEL]) {
                _warnings.insert("Multiple definitions for logging.level."
                        " Ignoring definition from " + _element.name_);
            } else {
                std::string its_value(i->second.data());
                loglevel_ = logger::to_level(its_value);
                is_configured_[ET_LOGGING_LEVEL] = true;
            }
        }
    }
    return true;
}

void configuration_impl::load_servers(const configuration_element &_element) {
    auto its_servers = _element.tree_.get_child_optional("servers");
    if (!its_servers)
        return;

    for (auto i = its_servers->begin(); i != its_servers->end(); ++i)
        load_server(i->second, _element.name_);
}

void configuration_impl::load_server(const boost::property_tree::ptree &_tree,
        const std::string &_file_name) {
    auto its_server = std::make_shared<cfg::server>();

    for (auto i = _tree.begin(); i != _tree.end(); ++i) {
        std::string its_key(i->first);
        std::string its_value(i->second.data());

        if (its_key == "name") {
            its_server->name_ = its_value;
        } else if (its_key == "interface") {
            if (!its_value.empty())
                its_server->interface_ = its_value;
        } else if (its_key == "port") {
            std::stringstream its_converter;
            unsigned long its_port(0);
            its_converter << std::dec << its_value;
            its_converter >> its_port;
            if (its_converter.fail()
                    || its_port > std::numeric_limits<port_t>::max()) {
                UDPKIT_WARNING << "Invalid port \"" << its_value
                    << "\" in " << _file_name;
                its_port = 0;
            }
            its_server->port_ = static_cast<port_t>(its_port);
        } else if (its_key == "multicast") {
            std::vector<std::string> its_groups;
            for (const auto &j : i->second) {
                std::string its_group(j.second.data());
                if (!its_group.empty())
                    its_groups.push_back(its_group);
            }
            its_server->multicast_groups_ = its_groups;
        } else if (its_key == "reuse-local-endpoint") {
            its_server->reuse_local_endpoint_ = is_true(its_value);
        } else if (its_key == "fast-open") {
            its_server->fast_open_ = is_true(its_value);
        }
    }

    if (its_server->name_.empty()) {
        UDPKIT_WARNING << "Ignoring unnamed server in " << _file_name;
        return;
    }

    if (servers_.find(its_server->name_) != servers_.end()) {
        UDPKIT_WARNING << "Multiple definitions for server \""
            << its_server->name_ << "\". Ignoring definition from "
            << _file_name;
        return;
    }

    servers_[its_server->name_] = its_server;
}

void configuration_impl::load_udp_receive_buffer_size(
        const configuration_element &_element) {
    const std::string urbs("udp-receive-buffer-size");
    try {
        if (_element.tree_.get_child_optional(urbs)) {
            if (is_configured_[ET_UDP_RECEIVE_BUFFER_SIZE]) {
                UDPKIT_WARNING << "Multiple definitions of " << urbs
                        << " Ignoring definition from " << _element.name_;
            } else {
                const std::string s(_element.tree_.get_child(urbs).data());
                std::stringstream its_converter;
                its_converter << std::dec << s;
                its_converter >> udp_receive_buffer_size_;
                is_configured_[ET_UDP_RECEIVE_BUFFER_SIZE] = true;
            }
        }
    } catch (const std::exception &e) {
        UDPKIT_ERROR << __func__ << ": " << urbs << " " << e.what();
    }
}

bool configuration_impl::is_true(const std::string &_value) const {
    return _value == "true";
}

const std::string &configuration_impl::get_path() const {
    return path_;
}

logger::level_e configuration_impl::get_loglevel() const {
    return loglevel_;
}

bool configuration_impl::has_console_log() const {
    return has_console_log_;
}

bool configuration_impl::has_file_log() const {
    return has_file_log_;
}

const std::string &configuration_impl::get_logfile() const {
    return logfile_;
}

std::shared_ptr<cfg::server>
configuration_impl::get_server(const std::string &_name) const {
    std::scoped_lock its_lock(mutex_);
    auto found_server = servers_.find(_name);
    if (found_server != servers_.end())
        return found_server->second;
    return nullptr;
}

std::set<std::string> configuration_impl::get_server_names() const {
    std::scoped_lock its_lock(mutex_);
    std::set<std::string> its_names;
    for (const auto &s : servers_)
        its_names.insert(s.first);
    return its_names;
}

int configuration_impl::get_udp_receive_buffer_size() const {
    return udp_receive_buffer_size_;
}

} // namespace cfg
} // namespace udpkit_v1
