/*
 * Copyright (c) 2025, Trail of Bits, Inc.
 *
 * This source code is licensed in accordance with the terms specified in
 * the LICENSE file found in the root directory of this source tree.
 */

#include <declscan/AST/Provenance.hpp>

#include <llvm/ADT/SmallString.h>
#include <llvm/Support/FileSystem.h>
#include <llvm/Support/Path.h>

namespace declscan::ast {

    namespace {

        ProvenanceState fold(const SourcePoint &point, ProvenanceState state) {
            if (point.file) {
                state.current_file = *point.file;
            }
            return state;
        }

        ProvenanceState fold(const Location &loc, ProvenanceState state) {
            state = fold(loc.spelling, std::move(state));
            if (loc.expansion) {
                state = fold(*loc.expansion, std::move(state));
            }
            return state;
        }

    } // namespace

    FileMatcher::FileMatcher(std::string target)
        : target(std::move(target)), target_name(llvm::sys::path::filename(this->target).str()) {
        target_real = canonical(this->target);
    }

    std::optional< std::string > FileMatcher::canonical(llvm::StringRef path) {
        auto cached = canonical_cache.find(path);
        if (cached != canonical_cache.end()) {
            return cached->second;
        }

        std::optional< std::string > resolved;
        llvm::SmallString< 256 > real;
        if (!llvm::sys::fs::real_path(path, real, /*expand_tilde=*/false)) {
            resolved = real.str().str();
        }
        canonical_cache.try_emplace(path, resolved);
        return resolved;
    }

    bool FileMatcher::matches(llvm::StringRef file) {
        if (file.empty()) {
            return false;
        }
        if (file == target) {
            return true;
        }

        if (target_real) {
            if (auto file_real = canonical(file)) {
                return *file_real == *target_real;
            }
        }

        return llvm::sys::path::filename(file) == target_name;
    }

    std::pair< NodeProvenance, ProvenanceState >
    ProvenanceTracker::locate(const Node &node, ProvenanceState state) {
        NodeProvenance provenance;
        if (!node.loc) {
            provenance.file = state.current_file;
            return { provenance, std::move(state) };
        }

        state               = fold(*node.loc, std::move(state));
        provenance.file     = state.current_file;
        provenance.included = node.loc->effective().included;
        provenance.local    = !provenance.included && matcher.matches(provenance.file);
        return { provenance, std::move(state) };
    }

    ProvenanceState ProvenanceTracker::advance(const Node &node, ProvenanceState state) {
        if (node.range_begin) {
            state = fold(*node.range_begin, std::move(state));
        }
        if (node.range_end) {
            state = fold(*node.range_end, std::move(state));
        }
        return state;
    }

} // namespace declscan::ast
