/*
 * Copyright (c) 2025, Trail of Bits, Inc.
 *
 * This source code is licensed in accordance with the terms specified in
 * the LICENSE file found in the root directory of this source tree.
 */

#pragma once

/**
 * @brief Decoded form of `clang -Xclang -ast-dump=json`.
 *
 * Only the attributes the extractor reads are kept; everything else in the
 * dump is dropped while decoding.
 */

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include <declscan/Util/Error.hpp>
#include <declscan/Util/Warnings.hpp>

DS_RELAX_WARNINGS_BEGIN
#include <llvm/ADT/StringRef.h>
#include <llvm/Support/JSON.h>
DS_RELAX_WARNINGS_END

namespace declscan::ast {
    using json_arr = llvm::json::Array;
    using json_obj = llvm::json::Object;
    using json_val = llvm::json::Value;

    struct SourcePoint
    {
        /**
         * @brief A bare source location
         *
         * `file` is only present when it differs from the location printed
         * just before it in the dump.
         */
        std::optional< std::string > file;
        std::optional< int64_t > offset;
        bool included = false; // carries an `includedFrom` marker
        std::optional< std::string > included_from;

        static auto from_json(const json_obj &point_obj) -> SourcePoint;
    };

    struct Location
    {
        /**
         * @brief A `loc` or `range.begin`/`range.end` entry
         *
         * Macro-expanded locations carry both a spelling and an expansion
         * point, printed in that order.
         */
        SourcePoint spelling;
        std::optional< SourcePoint > expansion;

        const SourcePoint &effective() const { return expansion ? *expansion : spelling; }

        static auto from_json(const json_obj &loc_obj) -> Location;
    };

    struct Node
    {
        std::string id;
        std::string kind;
        std::string name;
        std::optional< std::string > qual_type;
        std::optional< std::string > value;
        std::optional< std::string > fixed_underlying_type;
        std::string storage_class;
        std::string tag_used;
        std::string scoped_enum_tag;
        std::string text;

        bool is_implicit = false;
        bool is_inline   = false;
        bool is_virtual  = false;
        bool is_pure     = false;
        bool is_bitfield = false;

        std::optional< Location > loc;
        std::optional< Location > range_begin;
        std::optional< Location > range_end;

        std::vector< Node > inner;

        static auto from_json(const json_obj &node_obj) -> expected< Node >;
    };

    // Parses the AST dump text and decodes the root node.
    auto decode_tree(llvm::StringRef text) -> expected< Node >;

} // namespace declscan::ast
