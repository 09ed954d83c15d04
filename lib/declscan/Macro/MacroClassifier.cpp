/*
 * Copyright (c) 2025, Trail of Bits, Inc.
 *
 * This source code is licensed in accordance with the terms specified in
 * the LICENSE file found in the root directory of this source tree.
 */

#include <declscan/Macro/MacroClassifier.hpp>

#include <cctype>

#include <llvm/ADT/SmallVector.h>

namespace declscan::macro {

    namespace {

        constexpr llvm::StringLiteral define_directive = "#define";

        const char *const function_like_pattern =
            "^([A-Za-z_][A-Za-z0-9_]*)\\(([^)]*)\\)([[:space:]]+(.*))?$";
        const char *const object_like_pattern =
            "^([A-Za-z_][A-Za-z0-9_]*)[[:space:]]+(.+)$";
        const char *const bare_name_pattern = "^[A-Za-z_][A-Za-z0-9_]*$";
        const char *const pointer_cast_pattern =
            "^\\(\\(([A-Za-z_][A-Za-z0-9_ ]*)\\*\\)[[:space:]]*(.+)\\)$";

        std::vector< std::string > split_arguments(llvm::StringRef args) {
            std::vector< std::string > result;
            if (args.trim().empty()) {
                return result;
            }

            llvm::SmallVector< llvm::StringRef, 4 > parts;
            args.split(parts, ',');
            for (auto part : parts) {
                result.push_back(part.trim().str());
            }
            return result;
        }

    } // namespace

    bool is_reserved_identifier(llvm::StringRef name) {
        if (name.size() >= 2 && name.startswith("__") && name.endswith("__")) {
            return true;
        }
        return name.size() >= 2 && name[0] == '_'
            && std::isupper(static_cast< unsigned char >(name[1]));
    }

    bool has_operator(llvm::StringRef value) {
        char quote = 0;
        for (size_t i = 0; i < value.size(); ++i) {
            char c = value[i];
            if (quote != 0) {
                if (c == '\\') {
                    ++i;
                } else if (c == quote) {
                    quote = 0;
                }
                continue;
            }

            switch (c) {
                case '"':
                case '\'':
                    quote = c;
                    break;
                case '+':
                case '-':
                case '*':
                case '/':
                case '%':
                case '|':
                case '&':
                case '^':
                case '~':
                    return true;
                case '<':
                case '>':
                    if (i + 1 < value.size() && value[i + 1] == c) {
                        return true;
                    }
                    break;
                default:
                    break;
            }
        }
        return false;
    }

    MacroClassifier::MacroClassifier(std::vector< std::string > prefixes)
        : prefixes(std::move(prefixes))
        , function_like(function_like_pattern)
        , object_like(object_like_pattern)
        , bare_name(bare_name_pattern)
        , pointer_cast(pointer_cast_pattern) {}

    bool MacroClassifier::is_user_macro(llvm::StringRef name) const {
        if (is_reserved_identifier(name)) {
            return false;
        }
        if (prefixes.empty()) {
            return true;
        }
        for (const auto &prefix : prefixes) {
            if (name.startswith(prefix)) {
                return true;
            }
        }
        return false;
    }

    MacroKind MacroClassifier::classify_value(llvm::StringRef value) const {
        llvm::SmallVector< llvm::StringRef, 3 > matches;
        if (pointer_cast.match(value, &matches)) {
            return TypeCast{ .target_type = matches[1].trim().str(),
                             .address     = matches[2].trim().str() };
        }
        if (has_operator(value)) {
            return Expression{ .text = value.str() };
        }
        return SimpleValue{ .value = value.str() };
    }

    std::optional< MacroDecl > MacroClassifier::classify_line(llvm::StringRef line) const {
        if (!line.startswith(define_directive)) {
            return std::nullopt;
        }
        auto rest = line.drop_front(define_directive.size());
        if (rest.empty() || !std::isspace(static_cast< unsigned char >(rest.front()))) {
            return std::nullopt;
        }
        rest = rest.trim();

        llvm::SmallVector< llvm::StringRef, 5 > matches;
        if (function_like.match(rest, &matches)) {
            auto body = matches[4].trim();
            return MacroDecl{ .name      = matches[1].str(),
                              .kind      = FunctionLike{ .args = split_arguments(matches[2]),
                                                         .body = body.str() },
                              .raw_value = body.str() };
        }

        if (object_like.match(rest, &matches)) {
            auto value = matches[2].trim();
            return MacroDecl{ .name      = matches[1].str(),
                              .kind      = classify_value(value),
                              .raw_value = value.str() };
        }

        if (bare_name.match(rest)) {
            return MacroDecl{ .name = rest.str(), .kind = SimpleValue{}, .raw_value = "" };
        }

        return std::nullopt;
    }

    std::vector< MacroDecl > MacroClassifier::classify(llvm::StringRef dump) const {
        llvm::SmallVector< llvm::StringRef, 64 > lines;
        dump.split(lines, '\n', -1, /*KeepEmpty=*/false);

        std::vector< MacroDecl > macros;
        for (auto line : lines) {
            line = line.rtrim('\r');
            if (line.empty()) {
                continue;
            }
            auto macro = classify_line(line);
            if (macro && is_user_macro(macro->name)) {
                macros.push_back(std::move(*macro));
            }
        }
        return macros;
    }

} // namespace declscan::macro
