/*
 * Copyright (c) 2025, Trail of Bits, Inc.
 *
 * This source code is licensed in accordance with the terms specified in
 * the LICENSE file found in the root directory of this source tree.
 */

#include <declscan/HeaderParser.hpp>

#include <llvm/Support/Errc.h>
#include <llvm/Support/FileSystem.h>
#include <llvm/Support/Path.h>

#include <declscan/AST/Extractor.hpp>
#include <declscan/AST/Node.hpp>
#include <declscan/Macro/MacroClassifier.hpp>
#include <declscan/Util/Log.hpp>

namespace declscan {

    HeaderParser::HeaderParser(Options options)
        : options(options), runner(std::make_unique< frontend::ClangInvocation >(options)) {}

    HeaderParser::HeaderParser(
        Options options, std::unique_ptr< frontend::FrontendRunner > runner
    )
        : options(std::move(options)), runner(std::move(runner)) {}

    auto HeaderParser::run_ast_pass() -> expected< std::vector< Declaration > > {
        auto dump = runner->run(frontend::Mode::ast_dump);
        if (!dump) {
            return dump.takeError();
        }

        VLOG(options.verbose, INFO) << "Parsing JSON AST...\n";
        auto root = ast::decode_tree(*dump);
        if (!root) {
            return root.takeError();
        }

        ast::DeclarationExtractor extractor(
            options.header_file,
            ast::ExtractorOptions{ .group_namespaces = options.group_namespaces,
                                   .verbose          = options.verbose }
        );
        auto declarations = extractor.extract(*root);

        VLOG(options.verbose, INFO)
            << "Extracted " << declarations.size() << " AST declarations\n";
        return declarations;
    }

    std::vector< MacroDecl > HeaderParser::run_macro_pass() {
        if (!options.include_macros) {
            return {};
        }

        auto dump = runner->run(frontend::Mode::macro_dump);
        if (!dump) {
            auto message = llvm::toString(dump.takeError());
            VLOG(options.verbose, WARNING) << "Failed to extract macros: " << message << "\n";
            return {};
        }

        auto macros = macro::MacroClassifier(options.macro_prefixes).classify(*dump);
        VLOG(options.verbose, INFO) << "Extracted " << macros.size() << " macros\n";
        return macros;
    }

    auto HeaderParser::parse_full() -> expected< ParseResult > {
        if (!llvm::sys::fs::exists(options.header_file)) {
            return llvm::createStringError(
                llvm::errc::no_such_file_or_directory, "Header file not found: %s",
                options.header_file.c_str()
            );
        }

        VLOG(options.verbose, INFO) << "Parsing header: " << options.header_file << "\n";

        auto declarations = run_ast_pass();
        if (!declarations) {
            return declarations.takeError();
        }

        return ParseResult{ .declarations = std::move(*declarations),
                            .macros       = run_macro_pass() };
    }

    auto HeaderParser::parse() -> expected< std::vector< Declaration > > {
        auto result = parse_full();
        if (!result) {
            return result.takeError();
        }

        auto declarations = std::move(result->declarations);
        declarations.reserve(declarations.size() + result->macros.size());
        for (auto &macro : result->macros) {
            declarations.emplace_back(std::move(macro));
        }

        if (declarations.empty()) {
            return llvm::make_error< EmptyResultError >(
                llvm::sys::path::filename(options.header_file).str()
            );
        }
        return declarations;
    }

} // namespace declscan
