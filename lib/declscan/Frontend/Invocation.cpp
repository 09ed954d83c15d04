/*
 * Copyright (c) 2025, Trail of Bits, Inc.
 *
 * This source code is licensed in accordance with the terms specified in
 * the LICENSE file found in the root directory of this source tree.
 */

#include <declscan/Frontend/Invocation.hpp>

#include <llvm/ADT/Optional.h>
#include <llvm/ADT/SmallString.h>
#include <llvm/ADT/SmallVector.h>
#include <llvm/ADT/StringExtras.h>
#include <llvm/ADT/StringRef.h>
#include <llvm/Support/FileSystem.h>
#include <llvm/Support/FileUtilities.h>
#include <llvm/Support/MemoryBuffer.h>
#include <llvm/Support/Program.h>

#include <declscan/Util/Log.hpp>

namespace declscan::frontend {

    namespace {

        auto read_capture(llvm::StringRef path) -> expected< std::string > {
            auto buffer = llvm::MemoryBuffer::getFile(path, /*IsText=*/true);
            if (!buffer) {
                return llvm::createStringError(
                    buffer.getError(), "failed to read captured output '%s'",
                    path.str().c_str()
                );
            }
            return buffer.get()->getBuffer().str();
        }

        auto make_capture(llvm::StringRef prefix, llvm::SmallVectorImpl< char > &path)
            -> llvm::Error {
            if (auto ec = llvm::sys::fs::createTemporaryFile(prefix, "txt", path)) {
                return llvm::createStringError(ec, "failed to create temporary file");
            }
            return llvm::Error::success();
        }

    } // namespace

    const char *to_string(Mode mode) {
        switch (mode) {
            case Mode::ast_dump:
                return "AST dump";
            case Mode::macro_dump:
                return "macro dump";
        }
        return "unknown";
    }

    std::vector< std::string > ClangInvocation::arguments(Mode mode) const {
        std::vector< std::string > args;
        if (!options.language.empty()) {
            args.emplace_back("-x");
            args.push_back(options.language);
        }
        for (const auto &path : options.include_paths) {
            args.push_back("-I" + path);
        }
        for (const auto &define : options.defines) {
            args.push_back("-D" + define);
        }
        args.insert(args.end(), options.extra_args.begin(), options.extra_args.end());

        switch (mode) {
            case Mode::ast_dump:
                args.insert(args.end(), { "-Xclang", "-ast-dump=json", "-fsyntax-only" });
                break;
            case Mode::macro_dump:
                args.insert(args.end(), { "-E", "-dM" });
                break;
        }

        args.push_back(options.header_file);
        return args;
    }

    auto ClangInvocation::run(Mode mode) -> expected< std::string > {
        using Reason = ToolInvocationError::Reason;

        auto program = llvm::sys::findProgramByName(options.clang_path);
        if (!program) {
            return llvm::make_error< ToolInvocationError >(
                Reason::not_found, options.clang_path, -1, program.getError().message()
            );
        }

        llvm::SmallString< 128 > stdout_path;
        llvm::SmallString< 128 > stderr_path;
        if (auto err = make_capture("declscan-stdout", stdout_path)) {
            return err;
        }
        llvm::FileRemover stdout_remover(stdout_path);
        if (auto err = make_capture("declscan-stderr", stderr_path)) {
            return err;
        }
        llvm::FileRemover stderr_remover(stderr_path);

        auto args = arguments(mode);
        llvm::SmallVector< llvm::StringRef, 16 > argv;
        argv.push_back(*program);
        for (const auto &arg : args) {
            argv.push_back(arg);
        }

        VLOG(options.verbose, INFO) << "Running: " << llvm::join(argv, " ") << "\n";

        const llvm::Optional< llvm::StringRef > redirects[] = {
            llvm::StringRef(""), llvm::StringRef(stdout_path), llvm::StringRef(stderr_path)
        };

        std::string exec_error;
        bool execution_failed = false;
        int status            = llvm::sys::ExecuteAndWait(
            *program, argv, /*Env=*/llvm::None, redirects, options.timeout_secs,
            /*MemoryLimit=*/0, &exec_error, &execution_failed
        );

        if (execution_failed) {
            return llvm::make_error< ToolInvocationError >(
                Reason::launch_failed, *program, status, exec_error
            );
        }

        auto captured_err = read_capture(stderr_path);
        if (!captured_err) {
            return captured_err.takeError();
        }
        auto diagnostics = llvm::StringRef(*captured_err).trim().str();

        if (status < 0) {
            return llvm::make_error< ToolInvocationError >(
                Reason::crashed, *program, status,
                diagnostics.empty() ? exec_error : diagnostics
            );
        }

        if (status != 0) {
            if (diagnostics.empty()) {
                diagnostics = "clang exited with code " + std::to_string(status);
            }
            return llvm::make_error< ToolInvocationError >(
                Reason::nonzero_exit, *program, status, diagnostics
            );
        }

        auto output = read_capture(stdout_path);
        if (!output) {
            return output.takeError();
        }

        VLOG(options.verbose, INFO) << "clang " << to_string(mode) << " completed, output: "
                                    << output->size() << " bytes\n";
        return output;
    }

} // namespace declscan::frontend
