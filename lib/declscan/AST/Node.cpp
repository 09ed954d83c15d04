/*
 * Copyright (c) 2025, Trail of Bits, Inc.
 *
 * This source code is licensed in accordance with the terms specified in
 * the LICENSE file found in the root directory of this source tree.
 */

#include <declscan/AST/Node.hpp>

namespace declscan::ast {

    namespace {

        auto error(const std::string &msg) -> llvm::Error {
            return llvm::make_error< TreeDecodeError >(msg);
        }

        std::optional< std::string > get_string(const json_obj &obj, llvm::StringRef field) {
            if (auto value = obj.getString(field)) {
                return value->str();
            }
            return std::nullopt;
        }

        bool get_flag(const json_obj &obj, llvm::StringRef field) {
            if (auto value = obj.getBoolean(field)) {
                return *value;
            }
            return false;
        }

        std::optional< std::string > get_qual_type(const json_obj &obj, llvm::StringRef field) {
            if (const auto *type_obj = obj.getObject(field)) {
                return get_string(*type_obj, "qualType");
            }
            return std::nullopt;
        }

        // Literal values are written as decimal strings; a few node kinds use
        // plain JSON numbers instead.
        std::optional< std::string > get_value(const json_obj &obj) {
            const auto *value = obj.get("value");
            if (value == nullptr) {
                return std::nullopt;
            }
            if (auto str = value->getAsString()) {
                return str->str();
            }
            if (auto num = value->getAsInteger()) {
                return std::to_string(*num);
            }
            if (auto num = value->getAsUINT64()) {
                return std::to_string(*num);
            }
            return std::nullopt;
        }

        std::optional< Location > get_location(const json_obj &obj, llvm::StringRef field) {
            if (const auto *loc_obj = obj.getObject(field)) {
                return Location::from_json(*loc_obj);
            }
            return std::nullopt;
        }

    } // namespace

    auto SourcePoint::from_json(const json_obj &point_obj) -> SourcePoint {
        SourcePoint point;
        point.file = get_string(point_obj, "file");
        if (!point.file) {
            if (const auto *begin_obj = point_obj.getObject("begin")) {
                point.file = get_string(*begin_obj, "file");
            }
        }

        if (auto offset = point_obj.getInteger("offset")) {
            point.offset = *offset;
        }

        if (const auto *included_obj = point_obj.getObject("includedFrom")) {
            point.included      = true;
            point.included_from = get_string(*included_obj, "file");
        }
        return point;
    }

    auto Location::from_json(const json_obj &loc_obj) -> Location {
        const auto *spelling_obj  = loc_obj.getObject("spellingLoc");
        const auto *expansion_obj = loc_obj.getObject("expansionLoc");
        if (spelling_obj == nullptr && expansion_obj == nullptr) {
            return Location{ .spelling = SourcePoint::from_json(loc_obj), .expansion = {} };
        }

        Location loc;
        if (spelling_obj != nullptr) {
            loc.spelling = SourcePoint::from_json(*spelling_obj);
        }
        if (expansion_obj != nullptr) {
            loc.expansion = SourcePoint::from_json(*expansion_obj);
        }
        return loc;
    }

    auto Node::from_json(const json_obj &node_obj) -> expected< Node > {
        auto kind = node_obj.getString("kind");
        if (!kind) {
            return error("invalid json value for node kind");
        }

        Node node;
        node.kind = kind->str();
        if (auto id = node_obj.getString("id")) {
            node.id = id->str();
        }
        if (auto name = node_obj.getString("name")) {
            node.name = name->str();
        }
        node.qual_type             = get_qual_type(node_obj, "type");
        node.fixed_underlying_type = get_qual_type(node_obj, "fixedUnderlyingType");
        node.value                 = get_value(node_obj);

        if (auto storage = node_obj.getString("storageClass")) {
            node.storage_class = storage->str();
        }
        if (auto tag = node_obj.getString("tagUsed")) {
            node.tag_used = tag->str();
        }
        if (auto scoped = node_obj.getString("scopedEnumTag")) {
            node.scoped_enum_tag = scoped->str();
        }
        if (auto text = node_obj.getString("text")) {
            node.text = text->str();
        }

        node.is_implicit = get_flag(node_obj, "isImplicit");
        node.is_inline   = get_flag(node_obj, "inline");
        node.is_virtual  = get_flag(node_obj, "virtual");
        node.is_pure     = get_flag(node_obj, "pure");
        node.is_bitfield = get_flag(node_obj, "isBitfield");

        node.loc = get_location(node_obj, "loc");
        if (const auto *range_obj = node_obj.getObject("range")) {
            node.range_begin = get_location(*range_obj, "begin");
            node.range_end   = get_location(*range_obj, "end");
        }

        if (const auto *array = node_obj.getArray("inner")) {
            node.inner.reserve(array->size());
            for (const json_val &elm : *array) {
                if (const json_obj *child_obj = elm.getAsObject()) {
                    auto child = Node::from_json(*child_obj);
                    if (!child) {
                        return child.takeError();
                    }
                    node.inner.push_back(std::move(*child));
                }
            }
        }

        return node;
    }

    auto decode_tree(llvm::StringRef text) -> expected< Node > {
        auto root = llvm::json::parse(text);
        if (!root) {
            return error(llvm::toString(root.takeError()));
        }

        const auto *root_obj = root->getAsObject();
        if (root_obj == nullptr) {
            return error("root of the AST dump is not an object");
        }

        return Node::from_json(*root_obj);
    }

} // namespace declscan::ast
