/*
 * Copyright (c) 2025, Trail of Bits, Inc.
 *
 * This source code is licensed in accordance with the terms specified in
 * the LICENSE file found in the root directory of this source tree.
 */

#include <declscan/AST/Extractor.hpp>

#include <llvm/ADT/SmallVector.h>
#include <llvm/ADT/StringExtras.h>
#include <llvm/ADT/StringMap.h>
#include <llvm/ADT/StringSet.h>
#include <llvm/Support/Regex.h>

#include <declscan/Util/Log.hpp>

namespace declscan::ast {

    namespace {

        std::optional< int64_t > parse_integer(llvm::StringRef text) {
            int64_t value = 0;
            if (!text.getAsInteger(10, value)) {
                return value;
            }
            // Enumerators of unsigned 64-bit enums can exceed INT64_MAX.
            uint64_t unsigned_value = 0;
            if (!text.getAsInteger(10, unsigned_value)) {
                return static_cast< int64_t >(unsigned_value);
            }
            return std::nullopt;
        }

        // Looks for a literal value on the children of `node`, then on their
        // children: `EnumConstantDecl -> ConstantExpr(value)` or
        // `EnumConstantDecl -> ImplicitCastExpr -> IntegerLiteral(value)`.
        std::optional< int64_t > find_literal_value(const Node &node) {
            for (const auto &child : node.inner) {
                if (child.value) {
                    if (auto value = parse_integer(*child.value)) {
                        return value;
                    }
                }
                for (const auto &nested : child.inner) {
                    if (nested.value) {
                        if (auto value = parse_integer(*nested.value)) {
                            return value;
                        }
                    }
                }
            }
            return std::nullopt;
        }

        void collect_comment_text(const Node &node, llvm::SmallVectorImpl< std::string > &lines) {
            if (get_node_kind(node.kind) == NodeKind::text_comment) {
                auto line = llvm::StringRef(node.text).trim();
                if (!line.empty()) {
                    lines.push_back(line.str());
                }
            }
            for (const auto &child : node.inner) {
                collect_comment_text(child, lines);
            }
        }

        std::optional< std::string > documentation_of(const Node &node) {
            llvm::SmallVector< std::string, 4 > lines;
            for (const auto &child : node.inner) {
                if (get_node_kind(child.kind) == NodeKind::full_comment) {
                    collect_comment_text(child, lines);
                }
            }
            if (lines.empty()) {
                return std::nullopt;
            }
            return llvm::join(lines, "\n");
        }

        bool is_anonymous_aggregate(llvm::StringRef type) {
            return type.contains("(anonymous") || type.contains("(unnamed");
        }

        std::string type_or_unknown(const Node &node) {
            return node.qual_type ? *node.qual_type : std::string("unknown");
        }

    } // namespace

    NodeKind get_node_kind(llvm::StringRef kind) {
        static const llvm::StringMap< NodeKind > kind_map = {
            {    "FunctionDecl",       NodeKind::function },
            {   "CXXMethodDecl",         NodeKind::method },
            {      "ParmVarDecl",      NodeKind::parameter },
            {      "RecordDecl",         NodeKind::record },
            {   "CXXRecordDecl",     NodeKind::cxx_record },
            {       "FieldDecl",          NodeKind::field },
            {        "EnumDecl",    NodeKind::enumeration },
            {"EnumConstantDecl",  NodeKind::enum_constant },
            {     "TypedefDecl",   NodeKind::typedef_decl },
            {   "TypeAliasDecl",     NodeKind::type_alias },
            {   "NamespaceDecl", NodeKind::namespace_decl },
            {     "FullComment",   NodeKind::full_comment },
            {     "TextComment",   NodeKind::text_comment },
        };

        auto iter = kind_map.find(kind);
        return iter != kind_map.end() ? iter->second : NodeKind::unknown;
    }

    FieldDecl parse_field_type(llvm::StringRef type) {
        static const llvm::StringSet<> volatile_quals = { "volatile", "__IO", "__O", "__OM",
                                                          "__IOM" };
        static const llvm::StringSet<> read_only_quals = { "__I", "__IM" };
        static const llvm::Regex array_extent("\\[([0-9]+)\\]");

        FieldDecl field;

        std::string base = type.str();
        llvm::SmallVector< llvm::StringRef, 2 > matches;
        if (array_extent.match(base, &matches)) {
            field.is_array = true;
            uint64_t size  = 0;
            if (!matches[1].getAsInteger(10, size)) {
                field.array_size = size;
            }
            while (array_extent.match(base)) {
                base = array_extent.sub("", base);
            }
        }

        llvm::SmallVector< llvm::StringRef, 8 > tokens;
        llvm::StringRef(base).split(tokens, ' ', -1, /*KeepEmpty=*/false);

        llvm::SmallVector< std::string, 8 > kept;
        for (auto token : tokens) {
            // `char *const` prints the pointer qualifier glued to the star
            auto word  = token.ltrim('*');
            auto stars = token.take_front(token.size() - word.size());

            bool is_qualifier = true;
            if (word == "const") {
                field.is_const = true;
            } else if (volatile_quals.contains(word)) {
                field.is_volatile = true;
            } else if (read_only_quals.contains(word)) {
                field.is_const    = true;
                field.is_volatile = true;
            } else {
                is_qualifier = false;
            }

            if (!is_qualifier) {
                kept.push_back(token.str());
            } else if (!stars.empty()) {
                kept.push_back(stars.str());
            }
        }

        field.type = llvm::StringRef(llvm::join(kept, " ")).trim().str();
        return field;
    }

    DeclarationExtractor::DeclarationExtractor(std::string target_file, ExtractorOptions options)
        : tracker(FileMatcher(std::move(target_file))), options(options) {}

    std::vector< Declaration > DeclarationExtractor::extract(const Node &root) {
        std::vector< Declaration > declarations;
        visit(root, ProvenanceState{}, declarations);
        return declarations;
    }

    ProvenanceState DeclarationExtractor::visit(
        const Node &node, ProvenanceState state, std::vector< Declaration > &out
    ) {
        auto [provenance, located] = tracker.locate(node, std::move(state));
        state = ProvenanceTracker::advance(node, std::move(located));

        const auto kind     = get_node_kind(node.kind);
        const bool eligible = provenance.local && !node.is_implicit;

        if (kind == NodeKind::namespace_decl) {
            return visit_namespace(node, eligible, std::move(state), out);
        }

        if (eligible) {
            VLOG(options.verbose, INFO)
                << "Processing " << node.kind << ": "
                << (node.name.empty() ? "<anonymous>" : node.name)
                << " (file: " << provenance.file << ")\n";

            if (auto decl = build(kind, node)) {
                out.push_back(std::move(*decl));
            }
        }

        for (const auto &child : node.inner) {
            state = visit(child, std::move(state), out);
        }
        return state;
    }

    ProvenanceState DeclarationExtractor::visit_namespace(
        const Node &node, bool eligible, ProvenanceState state, std::vector< Declaration > &out
    ) {
        // Anonymous namespaces stay transparent.
        if (!eligible || !options.group_namespaces || node.name.empty()) {
            for (const auto &child : node.inner) {
                state = visit(child, std::move(state), out);
            }
            return state;
        }

        NamespaceDecl ns;
        ns.name = node.name;
        for (const auto &child : node.inner) {
            state = visit(child, std::move(state), ns.declarations);
        }

        if (!ns.declarations.empty()) {
            out.emplace_back(std::move(ns));
        }
        return state;
    }

    std::optional< Declaration >
    DeclarationExtractor::build(NodeKind kind, const Node &node) const {
        switch (kind) {
            case NodeKind::function:
                if (auto decl = build_function(node)) {
                    return Declaration(std::move(*decl));
                }
                break;
            case NodeKind::record:
                if (auto decl = build_record(node)) {
                    return Declaration(std::move(*decl));
                }
                break;
            case NodeKind::cxx_record:
                if (auto decl = build_class(node)) {
                    return Declaration(std::move(*decl));
                }
                break;
            case NodeKind::enumeration:
                if (auto decl = build_enum(node)) {
                    return Declaration(std::move(*decl));
                }
                break;
            case NodeKind::typedef_decl:
            case NodeKind::type_alias:
                if (auto decl = build_typedef(node)) {
                    return Declaration(std::move(*decl));
                }
                break;
            case NodeKind::method:
            case NodeKind::parameter:
            case NodeKind::field:
            case NodeKind::enum_constant:
            case NodeKind::namespace_decl:
            case NodeKind::full_comment:
            case NodeKind::text_comment:
            case NodeKind::unknown:
                break;
        }
        return std::nullopt;
    }

    std::optional< FunctionDecl > DeclarationExtractor::build_function(const Node &node) {
        if (node.name.empty()) {
            return std::nullopt;
        }

        FunctionDecl func;
        func.name = node.name;

        unsigned index = 0;
        for (const auto &child : node.inner) {
            if (get_node_kind(child.kind) != NodeKind::parameter) {
                continue;
            }
            auto param_name =
                child.name.empty() ? "param" + std::to_string(index) : child.name;
            func.parameters.emplace_back(std::move(param_name), type_or_unknown(child));
            ++index;
        }

        // "int (const char *, ...)" -> "int"
        const auto signature = type_or_unknown(node);
        func.return_type     = llvm::StringRef(signature)
                               .take_until([](char c) { return c == '('; })
                               .trim()
                               .str();

        func.is_static     = node.storage_class == "static";
        func.is_inline     = node.is_inline;
        func.is_virtual    = node.is_virtual;
        func.documentation = documentation_of(node);
        return func;
    }

    std::optional< FieldDecl > DeclarationExtractor::build_field(const Node &node) {
        auto type = type_or_unknown(node);
        if (node.name.empty() && !is_anonymous_aggregate(type)) {
            return std::nullopt;
        }

        auto field = parse_field_type(type);
        field.name = node.name;
        if (node.is_bitfield) {
            if (auto width = find_literal_value(node)) {
                field.bit_width = static_cast< unsigned >(*width);
            }
        }
        return field;
    }

    std::optional< StructDecl > DeclarationExtractor::build_record(const Node &node) {
        StructDecl record;
        record.name     = node.name;
        record.is_union = node.tag_used == "union";

        for (const auto &child : node.inner) {
            if (get_node_kind(child.kind) != NodeKind::field) {
                continue;
            }
            if (auto field = build_field(child)) {
                record.fields.push_back(std::move(*field));
            }
        }

        if (record.name.empty() && record.fields.empty()) {
            return std::nullopt;
        }
        record.documentation = documentation_of(node);
        return record;
    }

    std::optional< EnumDecl > DeclarationExtractor::build_enum(const Node &node) {
        EnumDecl decl;
        decl.name            = node.name;
        decl.underlying_type = node.fixed_underlying_type;
        decl.is_scoped       = !node.scoped_enum_tag.empty();

        // Enumerators without an initializer continue from the previous one.
        int64_t next = 0;
        for (const auto &child : node.inner) {
            if (get_node_kind(child.kind) != NodeKind::enum_constant || child.name.empty()) {
                continue;
            }
            auto value = find_literal_value(child).value_or(next);
            next       = static_cast< int64_t >(static_cast< uint64_t >(value) + 1U);
            decl.values.push_back(EnumValue{
                .name = child.name, .value = value, .documentation = documentation_of(child) });
        }

        if (decl.name.empty() && decl.values.empty()) {
            return std::nullopt;
        }
        decl.documentation = documentation_of(node);
        return decl;
    }

    std::optional< TypedefInfo > DeclarationExtractor::build_typedef(const Node &node) {
        if (node.name.empty()) {
            return std::nullopt;
        }
        return TypedefInfo{ .name            = node.name,
                            .underlying_type = type_or_unknown(node),
                            .documentation   = documentation_of(node) };
    }

    std::optional< ClassDecl > DeclarationExtractor::build_class(const Node &node) {
        // Unlike structs, anonymous classes are never reported.
        if (node.name.empty()) {
            return std::nullopt;
        }

        ClassDecl decl;
        decl.name = node.name;
        for (const auto &child : node.inner) {
            switch (get_node_kind(child.kind)) {
                case NodeKind::method:
                    decl.is_abstract = decl.is_abstract || child.is_pure;
                    [[fallthrough]];
                case NodeKind::function:
                    if (child.is_implicit) {
                        break;
                    }
                    if (auto method = build_function(child)) {
                        decl.methods.push_back(std::move(*method));
                    }
                    break;
                case NodeKind::field:
                    if (auto field = build_field(child)) {
                        decl.fields.push_back(std::move(*field));
                    }
                    break;
                default:
                    break;
            }
        }
        decl.documentation = documentation_of(node);
        return decl;
    }

} // namespace declscan::ast
