// Copyright (C) 2014-2025 Bayerische Motoren Werke Aktiengesellschaft (BMW AG)
// This Source Code Form is subject to the terms of the Mozilla Public
// License, v. 2.0. If a copy of the MPL was not distributed with this
// file, You can obtain one at http://mozilla.org/MPL/2.0/.

#ifndef UDPKIT_EXPORT_HPP_
#define UDPKIT_EXPORT_HPP_

#if _WIN32
    #define UDPKIT_EXPORT __declspec(dllexport)

    #if UDPKIT_DLL_COMPILATION
        #define UDPKIT_IMPORT_EXPORT __declspec(dllexport)
    #else
        #define UDPKIT_IMPORT_EXPORT __declspec(dllimport)
    #endif
#else
    #define UDPKIT_EXPORT
    #define UDPKIT_IMPORT_EXPORT
#endif

#endif // UDPKIT_EXPORT_HPP_
