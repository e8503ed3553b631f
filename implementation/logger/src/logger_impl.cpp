// Copyright (C) 2020-2025 Bayerische Motoren Werke Aktiengesellschaft (BMW AG)
// This Source Code Form is subject to the terms of the Mozilla Public
// License, v. 2.0. If a copy of the MPL was not distributed with this
// file, You can obtain one at http://mozilla.org/MPL/2.0/.

#include <ctime>
#include <iomanip>
#include <iostream>
#include <sstream>

#include "../include/logger_impl.hpp"
#include "../../configuration/include/configuration.hpp"

namespace udpkit_v1 {
namespace logger {

namespace {

const char *level_name(level_e _level) {
    switch (_level) {
    case level_e::LL_ERROR:
        return "error";
    case level_e::LL_WARNING:
        return "warning";
    case level_e::LL_INFO:
        return "info";
    case level_e::LL_DEBUG:
        return "debug";
    case level_e::LL_TRACE:
        return "trace";
    default:
        return "none";
    }
}

// YYYY-MM-DD hh:mm:ss.uuuuuu
std::string format_time(std::chrono::system_clock::time_point _when) {
    const auto its_time_t = std::chrono::system_clock::to_time_t(_when);
    struct tm its_time {};
    localtime_r(&its_time_t, &its_time);
    const auto its_us = std::chrono::duration_cast<std::chrono::microseconds>(
            _when.time_since_epoch()).count() % 1000000;

    std::stringstream its_stream;
    its_stream << std::put_time(&its_time, "%Y-%m-%d %H:%M:%S") << "."
            << std::setfill('0') << std::setw(6) << its_us;
    return its_stream.str();
}

} // namespace

level_e to_level(const std::string &_name) {
    if (_name == "trace")
        return level_e::LL_TRACE;
    if (_name == "debug")
        return level_e::LL_DEBUG;
    if (_name == "warning")
        return level_e::LL_WARNING;
    if (_name == "error")
        return level_e::LL_ERROR;
    if (_name == "none")
        return level_e::LL_NONE;
    return level_e::LL_INFO;
}

// Until a configuration is loaded, info and above go to the console
logger_impl::logger_impl()
    : level_(level_e::LL_INFO),
      console_enabled_(true),
      file_enabled_(false) {
}

void logger_impl::init(const std::shared_ptr<configuration> &_configuration) {
    auto its_logger = logger_impl::get();
    if (its_logger && _configuration)
        its_logger->set_configuration(_configuration);
}

logger_impl *logger_impl::get() {
    // Logging during static deinitialization must not touch a destroyed
    // logger. No threads are expected to run at that point.
    static bool is_destroyed{false};
    static auto deleter = [](logger_impl *_ptr) {
        is_destroyed = true;
        delete _ptr;
    };
    static std::unique_ptr<logger_impl, decltype(deleter)> instance{new logger_impl, deleter};
    return is_destroyed ? nullptr : instance.get();
}

bool logger_impl::is_enabled(level_e _level) const {
    return _level != level_e::LL_NONE && _level <= level_
            && (console_enabled_ || file_enabled_);
}

void logger_impl::set_configuration(const std::shared_ptr<configuration> &_configuration) {
    std::scoped_lock its_lock(write_mutex_);
    if (_configuration->has_file_log()) {
        if (log_file_.is_open())
            log_file_.close();
        log_file_.open(_configuration->get_logfile(), std::ios::app);
        if (!log_file_.is_open()) {
            std::cerr << "udpkit: cannot open log file "
                    << _configuration->get_logfile() << std::endl;
        }
    } else if (log_file_.is_open()) {
        log_file_.close();
    }

    file_enabled_ = log_file_.is_open();
    console_enabled_ = _configuration->has_console_log();
    level_ = _configuration->get_loglevel();
}

void logger_impl::write(level_e _level,
        std::chrono::system_clock::time_point _when, const std::string &_text) {
    std::string its_line(format_time(_when));
    its_line += " [";
    its_line += level_name(_level);
    its_line += "] ";
    its_line += _text;
    its_line += '\n';

    std::scoped_lock its_lock(write_mutex_);
    if (console_enabled_)
        std::cout << its_line << std::flush;
    if (file_enabled_ && log_file_.is_open()) {
        log_file_ << its_line;
        log_file_.flush();
    }
}

} // namespace logger
} // namespace udpkit_v1
