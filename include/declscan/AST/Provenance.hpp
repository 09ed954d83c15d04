/*
 * Copyright (c) 2025, Trail of Bits, Inc.
 *
 * This source code is licensed in accordance with the terms specified in
 * the LICENSE file found in the root directory of this source tree.
 */

#pragma once

#include <optional>
#include <string>
#include <utility>

#include <llvm/ADT/StringMap.h>
#include <llvm/ADT/StringRef.h>

#include <declscan/AST/Node.hpp>

namespace declscan::ast {

    /**
     * @brief Decides whether a file named in the AST dump is the target header.
     *
     * Paths are compared verbatim first, then by canonical path when both can
     * be resolved on disk. Only when canonicalization is unavailable does it
     * fall back to comparing the last path component, which cannot tell apart
     * two same-named headers from different include directories.
     */
    class FileMatcher
    {
      public:
        explicit FileMatcher(std::string target);

        bool matches(llvm::StringRef file);

        const std::string &target_file() const { return target; }

      private:
        std::optional< std::string > canonical(llvm::StringRef path);

        std::string target;
        std::string target_name;
        std::optional< std::string > target_real;
        llvm::StringMap< std::optional< std::string > > canonical_cache;
    };

    // File most recently stamped in the dump, in document order.
    struct ProvenanceState
    {
        std::string current_file;
    };

    struct NodeProvenance
    {
        std::string file;
        bool included = false;
        bool local    = false;
    };

    class ProvenanceTracker
    {
      public:
        explicit ProvenanceTracker(FileMatcher matcher) : matcher(std::move(matcher)) {}

        // Resolves the file of `node` from its `loc` and the incoming state.
        std::pair< NodeProvenance, ProvenanceState >
        locate(const Node &node, ProvenanceState state);

        // Folds the stamps of `node`'s source range into the state.
        static ProvenanceState advance(const Node &node, ProvenanceState state);

      private:
        FileMatcher matcher;
    };

} // namespace declscan::ast
