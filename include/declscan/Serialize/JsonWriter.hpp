/*
 * Copyright (c) 2025, Trail of Bits, Inc.
 *
 * This source code is licensed in accordance with the terms specified in
 * the LICENSE file found in the root directory of this source tree.
 */

#pragma once

#include <vector>

#include <declscan/Declarations.hpp>
#include <declscan/Util/Warnings.hpp>

DS_RELAX_WARNINGS_BEGIN
#include <llvm/Support/JSON.h>
#include <llvm/Support/raw_ostream.h>
DS_RELAX_WARNINGS_END

namespace declscan::serialize {

    llvm::json::Value to_json(const FieldDecl &field);
    llvm::json::Value to_json(const FunctionDecl &func);
    llvm::json::Value to_json(const MacroKind &kind);
    llvm::json::Value to_json(const Declaration &decl);
    llvm::json::Value to_json(const std::vector< Declaration > &decls);

    // Pretty-printed JSON array, one object per declaration.
    void write_json(llvm::raw_ostream &os, const std::vector< Declaration > &decls);

    // Human-readable listing, nested members indented.
    void write_text(llvm::raw_ostream &os, const std::vector< Declaration > &decls);

} // namespace declscan::serialize
