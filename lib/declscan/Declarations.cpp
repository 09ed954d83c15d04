/*
 * Copyright (c) 2025, Trail of Bits, Inc.
 *
 * This source code is licensed in accordance with the terms specified in
 * the LICENSE file found in the root directory of this source tree.
 */

#include <type_traits>

#include <declscan/Declarations.hpp>

namespace declscan {

    const std::string &declaration_name(const Declaration &decl) {
        return std::visit([](const auto &d) -> const std::string & { return d.name; }, decl);
    }

    const char *declaration_kind(const Declaration &decl) {
        return std::visit(
            [](const auto &d) -> const char * {
                using T = std::decay_t< decltype(d) >;
                if constexpr (std::is_same_v< T, FunctionDecl >) {
                    return "function";
                } else if constexpr (std::is_same_v< T, StructDecl >) {
                    return "struct";
                } else if constexpr (std::is_same_v< T, EnumDecl >) {
                    return "enum";
                } else if constexpr (std::is_same_v< T, TypedefInfo >) {
                    return "typedef";
                } else if constexpr (std::is_same_v< T, MacroDecl >) {
                    return "macro";
                } else if constexpr (std::is_same_v< T, NamespaceDecl >) {
                    return "namespace";
                } else {
                    static_assert(std::is_same_v< T, ClassDecl >, "unhandled declaration");
                    return "class";
                }
            },
            decl
        );
    }

} // namespace declscan
