/*
 * Copyright (c) 2025, Trail of Bits, Inc.
 *
 * This source code is licensed in accordance with the terms specified in
 * the LICENSE file found in the root directory of this source tree.
 */

#include <declscan/YAML/ConfigurationFile.hpp>

#include <llvm/ADT/SmallString.h>
#include <llvm/Support/Path.h>

#include <declscan/Util/Log.hpp>
#include <declscan/YAML/YAMLParser.hpp>

namespace declscan::yaml {

    ConfigurationFile::ConfigurationFile(llvm::StringRef config_path)
        : base_directory(llvm::sys::path::parent_path(config_path).str()) {}

    std::string ConfigurationFile::resolve_path(const std::string &file) const {
        if (file.empty() || llvm::sys::path::is_absolute(file) || base_directory.empty()) {
            return file;
        }

        llvm::SmallString< 256 > path(base_directory);
        llvm::sys::path::append(path, file);
        llvm::sys::path::remove_dots(path, /*remove_dot_dot=*/true);
        return path.str().str();
    }

    expected< Options > load_configuration(const std::string &config_path) {
        YAMLParser parser;
        auto options = parser.parse_from_file< Options >(config_path);
        if (!options) {
            return options.takeError();
        }

        ConfigurationFile config(config_path);
        options->header_file = config.resolve_path(options->header_file);
        for (auto &dir : options->include_paths) {
            dir = config.resolve_path(dir);
        }

        VLOG(options->verbose, INFO) << "Loaded configuration " << config_path << "\n";
        return options;
    }

} // namespace declscan::yaml
