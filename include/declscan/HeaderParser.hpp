/*
 * Copyright (c) 2025, Trail of Bits, Inc.
 *
 * This source code is licensed in accordance with the terms specified in
 * the LICENSE file found in the root directory of this source tree.
 */

#pragma once

#include <memory>
#include <vector>

#include <declscan/Declarations.hpp>
#include <declscan/Frontend/Invocation.hpp>
#include <declscan/Util/Error.hpp>
#include <declscan/Util/Options.hpp>

namespace declscan {

    struct ParseResult
    {
        std::vector< Declaration > declarations;
        std::vector< MacroDecl > macros;
    };

    /**
     * @brief Runs both frontend passes over one header and merges their output.
     *
     * The AST pass is mandatory: a failed invocation or an undecodable dump
     * fails the whole parse. The macro pass is best effort and an error there
     * only leaves the macro list empty.
     */
    class HeaderParser
    {
      public:
        explicit HeaderParser(Options options);
        HeaderParser(Options options, std::unique_ptr< frontend::FrontendRunner > runner);

        auto parse_full() -> expected< ParseResult >;

        // AST declarations followed by macros; fails with EmptyResultError
        // when both are empty.
        auto parse() -> expected< std::vector< Declaration > >;

      private:
        auto run_ast_pass() -> expected< std::vector< Declaration > >;
        std::vector< MacroDecl > run_macro_pass();

        Options options;
        std::unique_ptr< frontend::FrontendRunner > runner;
    };

} // namespace declscan
