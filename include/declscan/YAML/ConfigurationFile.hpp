/*
 * Copyright (c) 2025, Trail of Bits, Inc.
 *
 * This source code is licensed in accordance with the terms specified in
 * the LICENSE file found in the root directory of this source tree.
 */

#pragma once

#include <string>

#include <declscan/Util/Error.hpp>
#include <declscan/Util/Options.hpp>
#include <declscan/Util/Warnings.hpp>

DS_RELAX_WARNINGS_BEGIN
#include <llvm/ADT/StringRef.h>
#include <llvm/Support/YAMLTraits.h>
DS_RELAX_WARNINGS_END

namespace declscan::yaml {

    // Resolves paths named in a configuration file against that file's directory.
    class ConfigurationFile
    {
      public:
        explicit ConfigurationFile(llvm::StringRef config_path);

        std::string resolve_path(const std::string &file) const;

        const std::string &directory() const { return base_directory; }

      private:
        std::string base_directory;
    };

    // Reads a YAML configuration into `Options`. Relative `header` and
    // `include_paths` entries are rebased onto the configuration's directory.
    expected< Options > load_configuration(const std::string &config_path);

} // namespace declscan::yaml

namespace llvm::yaml {

    template<>
    struct ScalarEnumerationTraits< declscan::OutputFormat >
    {
        static void enumeration(IO &io, declscan::OutputFormat &format) {
            io.enumCase(format, "json", declscan::OutputFormat::json);
            io.enumCase(format, "text", declscan::OutputFormat::text);
        }
    };

    // Parse Options
    template<>
    struct MappingTraits< declscan::Options >
    {
        static void mapping(IO &io, declscan::Options &options) {
            io.mapOptional("header", options.header_file);
            io.mapOptional("clang", options.clang_path);
            io.mapOptional("language", options.language);
            io.mapOptional("include_paths", options.include_paths);
            io.mapOptional("defines", options.defines);
            io.mapOptional("extra_args", options.extra_args);
            io.mapOptional("include_macros", options.include_macros);
            io.mapOptional("macro_prefixes", options.macro_prefixes);
            io.mapOptional("group_namespaces", options.group_namespaces);
            io.mapOptional("timeout", options.timeout_secs);
            io.mapOptional("verbose", options.verbose);
            io.mapOptional("format", options.format);
            io.mapOptional("output", options.output_file);
        }
    };

} // namespace llvm::yaml
