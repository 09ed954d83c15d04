/*
 * Copyright (c) 2025, Trail of Bits, Inc.
 *
 * This source code is licensed in accordance with the terms specified in
 * the LICENSE file found in the root directory of this source tree.
 */

#include <declscan/Serialize/JsonWriter.hpp>

#include <type_traits>

#include <llvm/ADT/StringExtras.h>
#include <llvm/Support/FormatVariadic.h>

namespace declscan::serialize {

    using json_arr = llvm::json::Array;
    using json_obj = llvm::json::Object;
    using json_val = llvm::json::Value;

    namespace {

        void add_documentation(json_obj &obj, const std::optional< std::string > &doc) {
            if (doc) {
                obj["documentation"] = *doc;
            }
        }

        json_arr fields_to_json(const std::vector< FieldDecl > &fields) {
            json_arr array;
            for (const auto &field : fields) {
                array.push_back(to_json(field));
            }
            return array;
        }

        json_val struct_to_json(const StructDecl &decl) {
            json_obj obj{
                {     "kind",                  "struct" },
                {     "name",                 decl.name },
                {  "isUnion",             decl.is_union },
                {   "fields", fields_to_json(decl.fields) },
            };
            add_documentation(obj, decl.documentation);
            return json_val(std::move(obj));
        }

        json_val enum_to_json(const EnumDecl &decl) {
            json_arr values;
            for (const auto &value : decl.values) {
                json_obj entry{
                    {  "name",  value.name },
                    { "value", value.value },
                };
                add_documentation(entry, value.documentation);
                values.push_back(std::move(entry));
            }

            json_obj obj{
                {     "kind",          "enum" },
                {     "name",       decl.name },
                { "isScoped",  decl.is_scoped },
                {   "values", std::move(values) },
            };
            if (decl.underlying_type) {
                obj["underlyingType"] = *decl.underlying_type;
            }
            add_documentation(obj, decl.documentation);
            return json_val(std::move(obj));
        }

        json_val typedef_to_json(const TypedefInfo &decl) {
            json_obj obj{
                {           "kind",               "typedef" },
                {           "name",              decl.name },
                { "underlyingType", decl.underlying_type },
            };
            add_documentation(obj, decl.documentation);
            return json_val(std::move(obj));
        }

        json_val macro_to_json(const MacroDecl &decl) {
            return json_obj{
                {     "kind",             "macro" },
                {     "name",           decl.name },
                { "macroKind", to_json(decl.kind) },
                { "rawValue",      decl.raw_value },
            };
        }

        json_val namespace_to_json(const NamespaceDecl &decl) {
            return json_obj{
                {         "kind",                   "namespace" },
                {         "name",                     decl.name },
                { "declarations", to_json(decl.declarations) },
            };
        }

        json_val class_to_json(const ClassDecl &decl) {
            json_arr methods;
            for (const auto &method : decl.methods) {
                methods.push_back(to_json(method));
            }

            json_obj obj{
                {       "kind",                     "class" },
                {       "name",                   decl.name },
                { "isAbstract",            decl.is_abstract },
                {    "methods",          std::move(methods) },
                {     "fields", fields_to_json(decl.fields) },
            };
            add_documentation(obj, decl.documentation);
            return json_val(std::move(obj));
        }

        void write_fields(llvm::raw_ostream &os, const std::vector< FieldDecl > &fields,
                          unsigned indent) {
            for (const auto &field : fields) {
                os.indent(indent) << (field.name.empty() ? "<anonymous>" : field.name) << ": ";
                if (field.is_const) {
                    os << "const ";
                }
                if (field.is_volatile) {
                    os << "volatile ";
                }
                os << field.type;
                if (field.is_array) {
                    os << "[" << (field.array_size ? std::to_string(*field.array_size) : "")
                       << "]";
                }
                if (field.bit_width) {
                    os << " : " << *field.bit_width;
                }
                os << "\n";
            }
        }

        void write_function(llvm::raw_ostream &os, const FunctionDecl &func, unsigned indent) {
            os.indent(indent);
            if (func.is_static) {
                os << "static ";
            }
            if (func.is_inline) {
                os << "inline ";
            }
            if (func.is_virtual) {
                os << "virtual ";
            }
            os << func.return_type << " " << func.name << "(";
            llvm::ListSeparator sep;
            for (const auto &[name, type] : func.parameters) {
                os << sep << type << " " << name;
            }
            os << ")\n";
        }

        void write_declaration(llvm::raw_ostream &os, const Declaration &decl, unsigned indent);

        void write_all(llvm::raw_ostream &os, const std::vector< Declaration > &decls,
                       unsigned indent) {
            for (const auto &decl : decls) {
                write_declaration(os, decl, indent);
            }
        }

        void write_declaration(llvm::raw_ostream &os, const Declaration &decl, unsigned indent) {
            std::visit(
                [&](const auto &d) {
                    using T = std::decay_t< decltype(d) >;
                    if constexpr (std::is_same_v< T, FunctionDecl >) {
                        os.indent(indent) << "function ";
                        write_function(os, d, 0);
                    } else if constexpr (std::is_same_v< T, StructDecl >) {
                        os.indent(indent) << (d.is_union ? "union " : "struct ")
                                          << (d.name.empty() ? "<anonymous>" : d.name) << "\n";
                        write_fields(os, d.fields, indent + 2);
                    } else if constexpr (std::is_same_v< T, EnumDecl >) {
                        os.indent(indent) << "enum " << (d.name.empty() ? "<anonymous>" : d.name);
                        if (d.underlying_type) {
                            os << " : " << *d.underlying_type;
                        }
                        os << "\n";
                        for (const auto &value : d.values) {
                            os.indent(indent + 2) << value.name << " = " << value.value << "\n";
                        }
                    } else if constexpr (std::is_same_v< T, TypedefInfo >) {
                        os.indent(indent)
                            << "typedef " << d.name << " = " << d.underlying_type << "\n";
                    } else if constexpr (std::is_same_v< T, MacroDecl >) {
                        os.indent(indent) << "macro " << d.name << " " << d.raw_value << "\n";
                    } else if constexpr (std::is_same_v< T, NamespaceDecl >) {
                        os.indent(indent) << "namespace " << d.name << "\n";
                        write_all(os, d.declarations, indent + 2);
                    } else {
                        os.indent(indent) << (d.is_abstract ? "abstract class " : "class ")
                                          << d.name << "\n";
                        write_fields(os, d.fields, indent + 2);
                        for (const auto &method : d.methods) {
                            write_function(os, method, indent + 2);
                        }
                    }
                },
                decl
            );
        }

    } // namespace

    json_val to_json(const FieldDecl &field) {
        json_obj obj{
            {       "name",       field.name },
            {       "type",       field.type },
            { "isVolatile", field.is_volatile },
            {    "isConst",    field.is_const },
            {    "isArray",    field.is_array },
        };
        if (field.array_size) {
            obj["arraySize"] = static_cast< int64_t >(*field.array_size);
        }
        if (field.bit_width) {
            obj["bitWidth"] = static_cast< int64_t >(*field.bit_width);
        }
        return json_val(std::move(obj));
    }

    json_val to_json(const FunctionDecl &func) {
        json_arr params;
        for (const auto &[name, type] : func.parameters) {
            params.push_back(json_obj{
                { "name", name },
                { "type", type },
            });
        }

        json_obj obj{
            {       "kind",       "function" },
            {       "name",        func.name },
            { "returnType", func.return_type },
            { "parameters", std::move(params) },
            {  "isVirtual",  func.is_virtual },
            {   "isStatic",   func.is_static },
            {   "isInline",   func.is_inline },
        };
        add_documentation(obj, func.documentation);
        return json_val(std::move(obj));
    }

    json_val to_json(const MacroKind &kind) {
        return std::visit(
            [](const auto &k) -> json_val {
                using T = std::decay_t< decltype(k) >;
                if constexpr (std::is_same_v< T, SimpleValue >) {
                    return json_obj{
                        {  "kind", "simpleValue" },
                        { "value",       k.value },
                    };
                } else if constexpr (std::is_same_v< T, Expression >) {
                    return json_obj{
                        { "kind", "expression" },
                        { "text",       k.text },
                    };
                } else if constexpr (std::is_same_v< T, FunctionLike >) {
                    json_arr args;
                    for (const auto &arg : k.args) {
                        args.push_back(arg);
                    }
                    return json_obj{
                        { "kind", "functionLike" },
                        { "args",  std::move(args) },
                        { "body",         k.body },
                    };
                } else {
                    return json_obj{
                        {       "kind",    "typeCast" },
                        { "targetType", k.target_type },
                        {    "address",     k.address },
                    };
                }
            },
            kind
        );
    }

    json_val to_json(const Declaration &decl) {
        return std::visit(
            [](const auto &d) -> json_val {
                using T = std::decay_t< decltype(d) >;
                if constexpr (std::is_same_v< T, FunctionDecl >) {
                    return to_json(d);
                } else if constexpr (std::is_same_v< T, StructDecl >) {
                    return struct_to_json(d);
                } else if constexpr (std::is_same_v< T, EnumDecl >) {
                    return enum_to_json(d);
                } else if constexpr (std::is_same_v< T, TypedefInfo >) {
                    return typedef_to_json(d);
                } else if constexpr (std::is_same_v< T, MacroDecl >) {
                    return macro_to_json(d);
                } else if constexpr (std::is_same_v< T, NamespaceDecl >) {
                    return namespace_to_json(d);
                } else {
                    return class_to_json(d);
                }
            },
            decl
        );
    }

    json_val to_json(const std::vector< Declaration > &decls) {
        json_arr array;
        for (const auto &decl : decls) {
            array.push_back(to_json(decl));
        }
        return array;
    }

    void write_json(llvm::raw_ostream &os, const std::vector< Declaration > &decls) {
        os << llvm::formatv("{0:2}", to_json(decls)) << "\n";
    }

    void write_text(llvm::raw_ostream &os, const std::vector< Declaration > &decls) {
        write_all(os, decls, 0);
    }

} // namespace declscan::serialize
