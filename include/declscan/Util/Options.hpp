/*
 * Copyright (c) 2025, Trail of Bits, Inc.
 *
 * This source code is licensed in accordance with the terms specified in
 * the LICENSE file found in the root directory of this source tree.
 */

#pragma once

#include <string>
#include <vector>

namespace declscan {

    enum class OutputFormat { json, text };

    struct Options
    {
        // Header to scan and the flags shared by both clang passes
        std::string header_file;
        std::vector< std::string > include_paths;
        std::vector< std::string > defines;
        std::vector< std::string > extra_args;

        std::string clang_path = "clang";
        std::string language; // passed as `-x <language>` when set

        bool include_macros = true;
        std::vector< std::string > macro_prefixes;

        bool group_namespaces = true;
        unsigned timeout_secs = 0;
        bool verbose          = false;

        std::string output_file;
        OutputFormat format = OutputFormat::json;
    };

} // namespace declscan
