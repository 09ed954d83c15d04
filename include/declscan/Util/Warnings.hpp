/*
 * Copyright (c) 2025, Trail of Bits, Inc.
 *
 * This source code is licensed in accordance with the terms specified in
 * the LICENSE file found in the root directory of this source tree.
 */

#pragma once

// Silences warnings raised from inside LLVM headers included between
// DS_RELAX_WARNINGS_BEGIN and DS_RELAX_WARNINGS_END.

#define DS_PRAGMA(X) _Pragma(#X)

#if defined(__clang__)
    #define DS_RELAX_WARNINGS_BEGIN \
        DS_PRAGMA(clang diagnostic push) \
        DS_PRAGMA(clang diagnostic ignored "-Wconversion") \
        DS_PRAGMA(clang diagnostic ignored "-Wshadow") \
        DS_PRAGMA(clang diagnostic ignored "-Wunused-parameter") \
        DS_PRAGMA(clang diagnostic ignored "-Wsign-conversion") \
        DS_PRAGMA(clang diagnostic ignored "-Wdeprecated-declarations")
    #define DS_RELAX_WARNINGS_END DS_PRAGMA(clang diagnostic pop)
#elif defined(__GNUC__)
    #define DS_RELAX_WARNINGS_BEGIN \
        DS_PRAGMA(GCC diagnostic push) \
        DS_PRAGMA(GCC diagnostic ignored "-Wconversion") \
        DS_PRAGMA(GCC diagnostic ignored "-Wshadow") \
        DS_PRAGMA(GCC diagnostic ignored "-Wunused-parameter") \
        DS_PRAGMA(GCC diagnostic ignored "-Wsign-conversion") \
        DS_PRAGMA(GCC diagnostic ignored "-Wdeprecated-declarations")
    #define DS_RELAX_WARNINGS_END DS_PRAGMA(GCC diagnostic pop)
#else
    #define DS_RELAX_WARNINGS_BEGIN
    #define DS_RELAX_WARNINGS_END
#endif
