// Copyright (C) 2020-2025 Bayerische Motoren Werke Aktiengesellschaft (BMW AG)
// This Source Code Form is subject to the terms of the Mozilla Public
// License, v. 2.0. If a copy of the MPL was not distributed with this
// file, You can obtain one at http://mozilla.org/MPL/2.0/.

#include <chrono>
#include <exception>
#include <iostream>

#include <udpkit/internal/logger.hpp>

#include "../include/logger_impl.hpp"

namespace udpkit_v1 {
namespace logger {

message::message(level_e _level)
    : std::ostream(&buffer_), level_(_level) {

    // May be gone when logging during program termination
    const auto its_logger = logger_impl::get();
    buffer_.is_enabled_ = (its_logger && its_logger->is_enabled(level_));
}

message::~message() try {
    if (!buffer_.is_enabled_)
        return;

    auto its_logger = logger_impl::get();
    if (!its_logger) {
        std::cerr << "udpkit: logging after termination: " << buffer_.text_ << std::endl;
        return;
    }
    its_logger->write(level_, std::chrono::system_clock::now(), buffer_.text_);
} catch (const std::exception &e) {
    std::cerr << "udpkit: failed to write log line: " << e.what() << std::endl;
}

std::streambuf::int_type message::line_buffer::overflow(std::streambuf::int_type _c) {
    if (is_enabled_ && !traits_type::eq_int_type(_c, traits_type::eof()))
        text_.push_back(traits_type::to_char_type(_c));
    return _c;
}

std::streamsize message::line_buffer::xsputn(const char *_s, std::streamsize _n) {
    if (is_enabled_)
        text_.append(_s, static_cast<std::size_t>(_n));
    return _n;
}

} // namespace logger
} // namespace udpkit_v1
