/*
 * Copyright (c) 2025, Trail of Bits, Inc.
 *
 * This source code is licensed in accordance with the terms specified in
 * the LICENSE file found in the root directory of this source tree.
 */

#include <cstdlib>
#include <string>
#include <vector>

#include <llvm/Support/CommandLine.h>
#include <llvm/Support/InitLLVM.h>
#include <llvm/Support/raw_ostream.h>

#include <declscan/HeaderParser.hpp>
#include <declscan/Serialize/JsonWriter.hpp>
#include <declscan/Util/Log.hpp>
#include <declscan/Util/Options.hpp>
#include <declscan/YAML/ConfigurationFile.hpp>

/*************************/
// Command line options
/**************************/

namespace {

    llvm::cl::OptionCategory declscan_category("declscan options");

    const llvm::cl::opt< std::string > input_filename(
        "input", llvm::cl::desc("Header file to scan"), llvm::cl::value_desc("filename"),
        llvm::cl::cat(declscan_category)
    );

    const llvm::cl::list< std::string > include_paths(
        "I", llvm::cl::desc("Add directory to the include search path"),
        llvm::cl::value_desc("dir"), llvm::cl::Prefix, llvm::cl::cat(declscan_category)
    );

    const llvm::cl::list< std::string > defines(
        "D", llvm::cl::desc("Predefine a macro (NAME or NAME=VALUE)"),
        llvm::cl::value_desc("define"), llvm::cl::Prefix, llvm::cl::cat(declscan_category)
    );

    const llvm::cl::opt< bool > include_macros(
        "macros", llvm::cl::desc("Extract #define macros"), llvm::cl::init(true),
        llvm::cl::cat(declscan_category)
    );

    const llvm::cl::list< std::string > macro_prefixes(
        "macro-prefix", llvm::cl::desc("Keep only macros starting with this prefix"),
        llvm::cl::value_desc("prefix"), llvm::cl::cat(declscan_category)
    );

    const llvm::cl::opt< std::string > clang_path(
        "clang", llvm::cl::desc("clang executable to invoke"), llvm::cl::value_desc("path"),
        llvm::cl::init("clang"), llvm::cl::cat(declscan_category)
    );

    const llvm::cl::opt< std::string > language(
        "x", llvm::cl::desc("Source language passed to clang as -x"),
        llvm::cl::value_desc("language"), llvm::cl::cat(declscan_category)
    );

    const llvm::cl::list< std::string > extra_args(
        "extra-arg", llvm::cl::desc("Additional argument forwarded to clang"),
        llvm::cl::value_desc("arg"), llvm::cl::cat(declscan_category)
    );

    const llvm::cl::opt< bool > group_namespaces(
        "group-namespaces", llvm::cl::desc("Nest declarations under their namespaces"),
        llvm::cl::init(true), llvm::cl::cat(declscan_category)
    );

    const llvm::cl::opt< unsigned > timeout_secs(
        "timeout", llvm::cl::desc("Seconds to wait for each clang run (0 waits forever)"),
        llvm::cl::init(0), llvm::cl::cat(declscan_category)
    );

    const llvm::cl::opt< std::string > config_filename(
        "config", llvm::cl::desc("YAML configuration file"), llvm::cl::value_desc("filename"),
        llvm::cl::cat(declscan_category)
    );

    const llvm::cl::opt< declscan::OutputFormat > output_format(
        "format", llvm::cl::desc("Output format"),
        llvm::cl::values(
            clEnumValN(declscan::OutputFormat::json, "json", "JSON array of declarations"),
            clEnumValN(declscan::OutputFormat::text, "text", "Indented text listing")
        ),
        llvm::cl::init(declscan::OutputFormat::json), llvm::cl::cat(declscan_category)
    );

    const llvm::cl::opt< std::string > output_filename(
        "output", llvm::cl::desc("Specify output filename (default: stdout)"),
        llvm::cl::value_desc("filename"), llvm::cl::init(""), llvm::cl::cat(declscan_category)
    );

    const llvm::cl::opt< bool > verbose(
        "verbose", llvm::cl::desc("Enable debug logs"), llvm::cl::init(false),
        llvm::cl::cat(declscan_category)
    );

    template< typename T >
    bool given(const llvm::cl::opt< T > &option) {
        return option.getNumOccurrences() > 0;
    }

    void append(std::vector< std::string > &into, const llvm::cl::list< std::string > &from) {
        into.insert(into.end(), from.begin(), from.end());
    }

    // Command-line scalars override the configuration file, lists extend it.
    declscan::expected< declscan::Options > parse_command_line_options(int argc, char **argv) {
        llvm::cl::HideUnrelatedOptions(declscan_category);
        llvm::cl::ParseCommandLineOptions(
            argc, argv, "declscan: extract declarations and macros from a C/C++ header\n"
        );

        declscan::Options opts;
        if (!config_filename.empty()) {
            auto loaded = declscan::yaml::load_configuration(config_filename.getValue());
            if (!loaded) {
                return loaded.takeError();
            }
            opts = std::move(*loaded);
        }

        if (given(input_filename)) {
            opts.header_file = input_filename.getValue();
        }
        if (given(clang_path) || opts.clang_path.empty()) {
            opts.clang_path = clang_path.getValue();
        }
        if (given(language)) {
            opts.language = language.getValue();
        }
        if (given(include_macros)) {
            opts.include_macros = include_macros.getValue();
        }
        if (given(group_namespaces)) {
            opts.group_namespaces = group_namespaces.getValue();
        }
        if (given(timeout_secs)) {
            opts.timeout_secs = timeout_secs.getValue();
        }
        if (given(output_format)) {
            opts.format = output_format.getValue();
        }
        if (given(output_filename)) {
            opts.output_file = output_filename.getValue();
        }
        if (given(verbose)) {
            opts.verbose = verbose.getValue();
        }

        append(opts.include_paths, include_paths);
        append(opts.defines, defines);
        append(opts.extra_args, extra_args);
        append(opts.macro_prefixes, macro_prefixes);

        if (opts.header_file.empty()) {
            return llvm::createStringError(
                std::make_error_code(std::errc::invalid_argument),
                "No header given: pass --input or set `header` in the configuration"
            );
        }

        return opts;
    }

    bool write_output(
        const declscan::Options &options, const std::vector< declscan::Declaration > &decls
    ) {
        auto emit = [&](llvm::raw_ostream &os) {
            if (options.format == declscan::OutputFormat::text) {
                declscan::serialize::write_text(os, decls);
            } else {
                declscan::serialize::write_json(os, decls);
            }
        };

        if (options.output_file.empty()) {
            emit(llvm::outs());
            return true;
        }

        std::error_code ec;
        llvm::raw_fd_ostream os(options.output_file, ec);
        if (ec) {
            LOG(ERROR) << "Failed to open output file: " << options.output_file << " - "
                       << ec.message() << "\n";
            return false;
        }
        emit(os);
        return true;
    }

} // namespace

int main(int argc, char **argv) {
    llvm::InitLLVM init(argc, argv);

    auto options = parse_command_line_options(argc, argv);
    if (!options) {
        LOG(ERROR) << llvm::toString(options.takeError()) << "\n";
        return EXIT_FAILURE;
    }

    declscan::HeaderParser parser(*options);
    auto declarations = parser.parse();
    if (!declarations) {
        LOG(ERROR) << llvm::toString(declarations.takeError()) << "\n";
        return EXIT_FAILURE;
    }

    VLOG(options->verbose, INFO) << "Writing " << declarations->size() << " declarations\n";
    if (!write_output(*options, *declarations)) {
        return EXIT_FAILURE;
    }

    return EXIT_SUCCESS;
}
