// Copyright (C) 2014-2025 Bayerische Motoren Werke Aktiengesellschaft (BMW AG)
// This Source Code Form is subject to the terms of the Mozilla Public
// License, v. 2.0. If a copy of the MPL was not distributed with this
// file, You can obtain one at http://mozilla.org/MPL/2.0/.

#include <udpkit/runtime.hpp>

#include "../include/runtime_impl.hpp"

#include <mutex>

namespace udpkit_v1 {

static std::mutex get_mutex_;

std::shared_ptr<runtime> runtime::get() {
    std::scoped_lock lk {get_mutex_};
    return runtime_impl::get();
}

} // namespace udpkit_v1
