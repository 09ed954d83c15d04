/*
 * Copyright (c) 2025, Trail of Bits, Inc.
 *
 * This source code is licensed in accordance with the terms specified in
 * the LICENSE file found in the root directory of this source tree.
 */

#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <utility>
#include <variant>
#include <vector>

namespace declscan {

    struct FieldDecl
    {
        std::string name; // empty only for an anonymous nested struct/union member
        std::string type;
        bool is_volatile = false;
        bool is_const    = false;
        bool is_array    = false;
        std::optional< uint64_t > array_size;
        std::optional< unsigned > bit_width;
    };

    struct FunctionDecl
    {
        std::string name;
        std::string return_type;
        std::vector< std::pair< std::string, std::string > > parameters; // (name, type)
        bool is_virtual = false;
        bool is_static  = false;
        bool is_inline  = false;
        std::optional< std::string > documentation;
    };

    struct StructDecl
    {
        std::string name; // empty for anonymous aggregates
        std::vector< FieldDecl > fields;
        bool is_union = false;
        std::optional< std::string > documentation;
    };

    struct EnumValue
    {
        std::string name;
        int64_t value = 0;
        std::optional< std::string > documentation;
    };

    struct EnumDecl
    {
        std::string name;
        std::vector< EnumValue > values;
        std::optional< std::string > underlying_type;
        bool is_scoped = false;
        std::optional< std::string > documentation;
    };

    struct TypedefInfo
    {
        std::string name;
        std::string underlying_type;
        std::optional< std::string > documentation;
    };

    /**
     * @brief Syntactic shape of a `#define` body.
     */
    struct SimpleValue
    {
        std::string value;
    };

    struct Expression
    {
        std::string text;
    };

    struct FunctionLike
    {
        std::vector< std::string > args;
        std::string body;
    };

    struct TypeCast
    {
        std::string target_type;
        std::string address;
    };

    using MacroKind = std::variant< SimpleValue, Expression, FunctionLike, TypeCast >;

    struct MacroDecl
    {
        std::string name;
        MacroKind kind;
        std::string raw_value;
    };

    struct ClassDecl
    {
        std::string name;
        std::vector< FunctionDecl > methods;
        std::vector< FieldDecl > fields;
        bool is_abstract = false;
        std::optional< std::string > documentation;
    };

    struct NamespaceDecl;

    using Declaration = std::variant<
        FunctionDecl, StructDecl, EnumDecl, TypedefInfo, MacroDecl, NamespaceDecl, ClassDecl >;

    struct NamespaceDecl
    {
        std::string name;
        std::vector< Declaration > declarations;
    };

    // Name of the declared entity, empty for anonymous aggregates.
    const std::string &declaration_name(const Declaration &decl);

    // Lower-case tag used in the JSON output ("struct", "macro", ...).
    const char *declaration_kind(const Declaration &decl);

} // namespace declscan
