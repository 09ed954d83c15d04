/*
 * Copyright (c) 2025, Trail of Bits, Inc.
 *
 * This source code is licensed in accordance with the terms specified in
 * the LICENSE file found in the root directory of this source tree.
 */

#pragma once

#include <string>
#include <vector>

#include <declscan/Util/Error.hpp>
#include <declscan/Util/Options.hpp>

namespace declscan::frontend {

    enum class Mode {
        ast_dump,  // -Xclang -ast-dump=json -fsyntax-only
        macro_dump // -E -dM
    };

    const char *to_string(Mode mode);

    /**
     * @brief Produces the raw output of one frontend pass.
     */
    class FrontendRunner
    {
      public:
        virtual ~FrontendRunner() = default;

        virtual auto run(Mode mode) -> expected< std::string > = 0;
    };

    /**
     * @brief Runs the clang driver on the target header.
     *
     * Standard output and standard error are redirected to temporary files
     * so the child can never stall on a full pipe, however large the dump.
     */
    class ClangInvocation : public FrontendRunner
    {
      public:
        explicit ClangInvocation(Options options) : options(std::move(options)) {}

        // Arguments after argv[0], in the order they are passed to clang.
        std::vector< std::string > arguments(Mode mode) const;

        auto run(Mode mode) -> expected< std::string > override;

      private:
        Options options;
    };

} // namespace declscan::frontend
