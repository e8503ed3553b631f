// Copyright (C) 2020-2025 Bayerische Motoren Werke Aktiengesellschaft (BMW AG)
// This Source Code Form is subject to the terms of the Mozilla Public
// License, v. 2.0. If a copy of the MPL was not distributed with this
// file, You can obtain one at http://mozilla.org/MPL/2.0/.

#ifndef UDPKIT_V1_LOGGER_IMPL_HPP_
#define UDPKIT_V1_LOGGER_IMPL_HPP_

#include <atomic>
#include <chrono>
#include <fstream>
#include <memory>
#include <mutex>
#include <string>

#include <udpkit/internal/logger.hpp>

namespace udpkit_v1 {

class configuration;

namespace logger {

// Process wide sink of the log lines
class logger_impl {
public:
    UDPKIT_IMPORT_EXPORT static void init(const std::shared_ptr<configuration> &_configuration);
    static logger_impl *get();

    logger_impl();

    bool is_enabled(level_e _level) const;
    void write(level_e _level, std::chrono::system_clock::time_point _when,
            const std::string &_text);

private:
    void set_configuration(const std::shared_ptr<configuration> &_configuration);

    std::atomic<level_e> level_;
    std::atomic<bool> console_enabled_;
    std::atomic<bool> file_enabled_;

    // Serializes both sinks so lines do not interleave
    std::mutex write_mutex_;
    std::ofstream log_file_;
};

} // namespace logger
} // namespace udpkit_v1

#endif // UDPKIT_V1_LOGGER_IMPL_HPP_
