/*
 * Copyright (c) 2025, Trail of Bits, Inc.
 *
 * This source code is licensed in accordance with the terms specified in
 * the LICENSE file found in the root directory of this source tree.
 */

#include <declscan/Util/Error.hpp>

namespace declscan {

    char ToolInvocationError::ID = 0;
    char TreeDecodeError::ID     = 0;
    char EmptyResultError::ID    = 0;

    void ToolInvocationError::log(llvm::raw_ostream &os) const {
        switch (reason) {
            case Reason::not_found:
                os << "unable to find frontend '" << tool << "'";
                break;
            case Reason::launch_failed:
                os << "failed to run " << tool;
                break;
            case Reason::crashed:
                os << tool << " crashed or timed out";
                break;
            case Reason::nonzero_exit:
                os << tool << " failed";
                break;
        }
        if (!diagnostics.empty()) {
            os << ": " << diagnostics;
        }
    }

    std::error_code ToolInvocationError::convertToErrorCode() const {
        if (reason == Reason::not_found) {
            return std::make_error_code(std::errc::no_such_file_or_directory);
        }
        return llvm::inconvertibleErrorCode();
    }

    void TreeDecodeError::log(llvm::raw_ostream &os) const {
        os << "failed to decode clang AST dump: " << message;
    }

    std::error_code TreeDecodeError::convertToErrorCode() const {
        return std::make_error_code(std::errc::invalid_argument);
    }

    void EmptyResultError::log(llvm::raw_ostream &os) const {
        os << "parse succeeded but no declarations found in " << header;
    }

    std::error_code EmptyResultError::convertToErrorCode() const {
        return llvm::inconvertibleErrorCode();
    }

} // namespace declscan
