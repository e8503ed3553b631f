// Copyright (C) 2014-2025 Bayerische Motoren Werke Aktiengesellschaft (BMW AG)
// This Source Code Form is subject to the terms of the Mozilla Public
// License, v. 2.0. If a copy of the MPL was not distributed with this
// file, You can obtain one at http://mozilla.org/MPL/2.0/.

#ifndef UDPKIT_V1_LOGGER_HPP_
#define UDPKIT_V1_LOGGER_HPP_

#include <cstdint>
#include <ostream>
#include <streambuf>
#include <string>

#include <udpkit/export.hpp>

namespace udpkit_v1 {
namespace logger {

enum class UDPKIT_IMPORT_EXPORT level_e : std::uint8_t {
    LL_NONE = 0,
    LL_ERROR = 1,
    LL_WARNING = 2,
    LL_INFO = 3,
    LL_DEBUG = 4,
    LL_TRACE = 5
};

// Maps "error", "warning", "info", "debug", "trace" and "none"; anything
// else is info.
UDPKIT_IMPORT_EXPORT level_e to_level(const std::string &_name);

// One log line. The text streamed into it is written when it goes out of
// scope, if its level is enabled.
class message : public std::ostream {
public:
    UDPKIT_IMPORT_EXPORT explicit message(level_e _level);
    UDPKIT_IMPORT_EXPORT ~message() override;

private:
    struct line_buffer : public std::streambuf {
        std::streambuf::int_type overflow(std::streambuf::int_type _c) override;
        std::streamsize xsputn(const char *_s, std::streamsize _n) override;

        std::string text_;
        bool is_enabled_{false};
    };

    line_buffer buffer_;
    const level_e level_;
};

} // namespace logger
} // namespace udpkit_v1

#define UDPKIT_ERROR   udpkit_v1::logger::message(udpkit_v1::logger::level_e::LL_ERROR)
#define UDPKIT_WARNING udpkit_v1::logger::message(udpkit_v1::logger::level_e::LL_WARNING)
#define UDPKIT_INFO    udpkit_v1::logger::message(udpkit_v1::logger::level_e::LL_INFO)
#define UDPKIT_DEBUG   udpkit_v1::logger::message(udpkit_v1::logger::level_e::LL_DEBUG)
#define UDPKIT_TRACE   udpkit_v1::logger::message(udpkit_v1::logger::level_e::LL_TRACE)

#endif // UDPKIT_V1_LOGGER_HPP_
