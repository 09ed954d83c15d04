/*
 * Copyright (c) 2025, Trail of Bits, Inc.
 *
 * This source code is licensed in accordance with the terms specified in
 * the LICENSE file found in the root directory of this source tree.
 */

#include <declscan/YAML/YAMLParser.hpp>

#include <llvm/Support/ErrorOr.h>
#include <llvm/Support/FileSystem.h>

namespace declscan::yaml {

    expected< std::unique_ptr< llvm::MemoryBuffer > >
    YAMLParser::load_file(const std::string &file_path) {
        if (!llvm::sys::fs::exists(file_path)) {
            return llvm::createStringError(
                std::make_error_code(std::errc::no_such_file_or_directory),
                "File does not exist: %s", file_path.c_str()
            );
        }

        auto buffer_or_err = llvm::MemoryBuffer::getFile(file_path, /*IsText=*/true);
        if (!buffer_or_err) {
            return llvm::createStringError(
                buffer_or_err.getError(), "Failed to read file: %s - %s", file_path.c_str(),
                buffer_or_err.getError().message().c_str()
            );
        }

        return std::move(buffer_or_err.get());
    }

    void YAMLParser::collect_diagnostic(const llvm::SMDiagnostic &diag, void *context) {
        auto *diagnostics = static_cast< std::string * >(context);
        if (!diagnostics->empty()) {
            *diagnostics += "; ";
        }
        *diagnostics += diag.getMessage().str();
    }

} // namespace declscan::yaml
