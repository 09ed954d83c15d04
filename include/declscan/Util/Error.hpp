/*
 * Copyright (c) 2025, Trail of Bits, Inc.
 *
 * This source code is licensed in accordance with the terms specified in
 * the LICENSE file found in the root directory of this source tree.
 */

#pragma once

#include <string>
#include <system_error>

#include <llvm/Support/Error.h>
#include <llvm/Support/raw_ostream.h>

namespace declscan {

    template< typename T >
    using expected = llvm::Expected< T >;

    /**
     * @brief The external frontend could not be run or exited with failure.
     */
    class ToolInvocationError : public llvm::ErrorInfo< ToolInvocationError >
    {
      public:
        enum class Reason { not_found, launch_failed, crashed, nonzero_exit };

        static char ID; // NOLINT

        ToolInvocationError(
            Reason reason, std::string tool, int exit_code, std::string diagnostics
        )
            : reason(reason)
            , tool(std::move(tool))
            , exit_code(exit_code)
            , diagnostics(std::move(diagnostics)) {}

        void log(llvm::raw_ostream &os) const override;
        std::error_code convertToErrorCode() const override;

        Reason get_reason() const { return reason; }
        const std::string &get_tool() const { return tool; }
        int get_exit_code() const { return exit_code; }
        const std::string &get_diagnostics() const { return diagnostics; }

      private:
        Reason reason;
        std::string tool;
        int exit_code;
        std::string diagnostics;
    };

    /**
     * @brief The AST dump could not be decoded into a node tree.
     */
    class TreeDecodeError : public llvm::ErrorInfo< TreeDecodeError >
    {
      public:
        static char ID; // NOLINT

        explicit TreeDecodeError(std::string message) : message(std::move(message)) {}

        void log(llvm::raw_ostream &os) const override;
        std::error_code convertToErrorCode() const override;

        const std::string &get_message() const { return message; }

      private:
        std::string message;
    };

    /**
     * @brief Both passes succeeded but nothing usable was declared in the header.
     */
    class EmptyResultError : public llvm::ErrorInfo< EmptyResultError >
    {
      public:
        static char ID; // NOLINT

        explicit EmptyResultError(std::string header) : header(std::move(header)) {}

        void log(llvm::raw_ostream &os) const override;
        std::error_code convertToErrorCode() const override;

        const std::string &get_header() const { return header; }

      private:
        std::string header;
    };

} // namespace declscan
