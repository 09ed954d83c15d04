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
#include <llvm/Support/Regex.h>

#include <declscan/Declarations.hpp>

namespace declscan::macro {

    /**
     * @brief Classifies the lines of a `clang -E -dM` dump.
     *
     * A line is either `#define NAME(args) BODY`, `#define NAME VALUE` or
     * `#define NAME`; object-like values are further split into pointer
     * casts, operator expressions and plain values. Lines of any other shape
     * are dropped.
     */
    class MacroClassifier
    {
      public:
        explicit MacroClassifier(std::vector< std::string > prefixes = {});

        std::optional< MacroDecl > classify_line(llvm::StringRef line) const;

        // Reserved identifiers (`__NAME__`, `_Upper...`) never pass, whatever
        // the configured prefixes.
        bool is_user_macro(llvm::StringRef name) const;

        std::vector< MacroDecl > classify(llvm::StringRef dump) const;

      private:
        MacroKind classify_value(llvm::StringRef value) const;

        std::vector< std::string > prefixes;
        llvm::Regex function_like;
        llvm::Regex object_like;
        llvm::Regex bare_name;
        llvm::Regex pointer_cast;
    };

    bool is_reserved_identifier(llvm::StringRef name);

    // True if `value` uses an arithmetic, bitwise or shift operator outside
    // of string and character literals.
    bool has_operator(llvm::StringRef value);

} // namespace declscan::macro
