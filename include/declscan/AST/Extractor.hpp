/*
 * Copyright (c) 2025, Trail of Bits, Inc.
 *
 * This source code is licensed in accordance with the terms specified in
 * the LICENSE file found in the root directory of this source tree.
 */

#pragma once

#include <optional>
#include <string>
#include <vector>

#include <llvm/ADT/StringRef.h>

#include <declscan/AST/Node.hpp>
#include <declscan/AST/Provenance.hpp>
#include <declscan/Declarations.hpp>

namespace declscan::ast {

    enum class NodeKind {
        function,
        method,
        parameter,
        record,
        cxx_record,
        field,
        enumeration,
        enum_constant,
        typedef_decl,
        type_alias,
        namespace_decl,
        full_comment,
        text_comment,
        unknown
    };

    NodeKind get_node_kind(llvm::StringRef kind);

    // Splits a field's qualType into base type, qualifier flags and array extent.
    FieldDecl parse_field_type(llvm::StringRef type);

    struct ExtractorOptions
    {
        bool group_namespaces = true;
        bool verbose          = false;
    };

    /**
     * @brief Builds declarations for the nodes of an AST dump that belong to
     * the target header.
     *
     * The traversal visits every node once in document order, threading a
     * ProvenanceState through it, and hands each local, non-implicit node to
     * the builder registered for its kind.
     */
    class DeclarationExtractor
    {
      public:
        DeclarationExtractor(std::string target_file, ExtractorOptions options);

        std::vector< Declaration > extract(const Node &root);

      private:
        ProvenanceState
        visit(const Node &node, ProvenanceState state, std::vector< Declaration > &out);

        ProvenanceState visit_namespace(
            const Node &node, bool eligible, ProvenanceState state,
            std::vector< Declaration > &out
        );

        std::optional< Declaration > build(NodeKind kind, const Node &node) const;

        static std::optional< FunctionDecl > build_function(const Node &node);
        static std::optional< FieldDecl > build_field(const Node &node);
        static std::optional< StructDecl > build_record(const Node &node);
        static std::optional< EnumDecl > build_enum(const Node &node);
        static std::optional< TypedefInfo > build_typedef(const Node &node);
        static std::optional< ClassDecl > build_class(const Node &node);

        ProvenanceTracker tracker;
        ExtractorOptions options;
    };

} // namespace declscan::ast
