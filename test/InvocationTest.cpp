/*
 * Copyright (c) 2025, Trail of Bits, Inc.
 *
 * This source code is licensed in accordance with the terms specified in
 * the LICENSE file found in the root directory of this source tree.
 */

#include <gtest/gtest.h>

#include <llvm/Support/Program.h>

#include <declscan/Frontend/Invocation.hpp>

#include "TestUtil.hpp"

using namespace declscan;
using namespace declscan::frontend;

namespace {

    Options board_options() {
        Options options;
        options.header_file   = "/src/board.h";
        options.include_paths = { "/src/inc", "/cmsis" };
        options.defines       = { "STM32L552xx", "USE_HAL=1" };
        options.extra_args    = { "-std=c11" };
        options.language      = "c";
        return options;
    }

} // namespace

TEST(InvocationTest, AstDumpArguments) {
    ClangInvocation invocation(board_options());
    std::vector< std::string > expected = {
        "-x", "c", "-I/src/inc", "-I/cmsis", "-DSTM32L552xx", "-DUSE_HAL=1", "-std=c11",
        "-Xclang", "-ast-dump=json", "-fsyntax-only", "/src/board.h"
    };
    EXPECT_EQ(invocation.arguments(Mode::ast_dump), expected);
}

TEST(InvocationTest, MacroDumpArguments) {
    auto options = board_options();
    options.language.clear();
    options.extra_args.clear();

    ClangInvocation invocation(options);
    std::vector< std::string > expected = {
        "-I/src/inc", "-I/cmsis", "-DSTM32L552xx", "-DUSE_HAL=1", "-E", "-dM", "/src/board.h"
    };
    EXPECT_EQ(invocation.arguments(Mode::macro_dump), expected);
}

TEST(InvocationTest, MissingFrontendIsNotFound) {
    auto options       = board_options();
    options.clang_path = "declscan-no-such-clang";

    ClangInvocation invocation(options);
    auto output = invocation.run(Mode::ast_dump);
    ASSERT_FALSE(static_cast< bool >(output));

    auto err = output.takeError();
    if (!err.isA< ToolInvocationError >()) {
        FAIL() << llvm::toString(std::move(err));
    }
    llvm::handleAllErrors(std::move(err), [](const ToolInvocationError &failure) {
        EXPECT_EQ(failure.get_reason(), ToolInvocationError::Reason::not_found);
        EXPECT_EQ(failure.get_tool(), "declscan-no-such-clang");
    });
}

TEST(InvocationTest, NonzeroExitCarriesCodeMessage) {
    if (!llvm::sys::findProgramByName("false")) {
        GTEST_SKIP() << "no `false` executable on PATH";
    }

    auto options       = board_options();
    options.clang_path = "false";

    ClangInvocation invocation(options);
    auto output = invocation.run(Mode::macro_dump);
    ASSERT_FALSE(static_cast< bool >(output));

    auto err = output.takeError();
    if (!err.isA< ToolInvocationError >()) {
        FAIL() << llvm::toString(std::move(err));
    }
    llvm::handleAllErrors(std::move(err), [](const ToolInvocationError &failure) {
        EXPECT_EQ(failure.get_reason(), ToolInvocationError::Reason::nonzero_exit);
        EXPECT_EQ(failure.get_exit_code(), 1);
        EXPECT_EQ(failure.get_diagnostics(), "clang exited with code 1");
    });
}

TEST(InvocationTest, CapturesStandardOutput) {
    if (!llvm::sys::findProgramByName("echo")) {
        GTEST_SKIP() << "no `echo` executable on PATH";
    }

    auto options       = board_options();
    options.clang_path = "echo";
    options.language.clear();
    options.include_paths.clear();
    options.defines.clear();
    options.extra_args.clear();

    ClangInvocation invocation(options);
    auto output = invocation.run(Mode::ast_dump);
    ASSERT_TRUE(static_cast< bool >(output)) << llvm::toString(output.takeError());
    EXPECT_EQ(*output, "-Xclang -ast-dump=json -fsyntax-only /src/board.h\n");
}
