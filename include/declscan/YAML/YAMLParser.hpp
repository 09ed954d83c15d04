/*
 * Copyright (c) 2025, Trail of Bits, Inc.
 *
 * This source code is licensed in accordance with the terms specified in
 * the LICENSE file found in the root directory of this source tree.
 */

#pragma once

#include <memory>
#include <string>

#include <declscan/Util/Error.hpp>
#include <declscan/Util/Warnings.hpp>

DS_RELAX_WARNINGS_BEGIN
#include <llvm/Support/Error.h>
#include <llvm/Support/MemoryBuffer.h>
#include <llvm/Support/SourceMgr.h>
#include <llvm/Support/YAMLTraits.h>
#include <llvm/Support/raw_ostream.h>
DS_RELAX_WARNINGS_END

namespace declscan::yaml {

    class YAMLParser
    {
      public:
        YAMLParser()  = default;
        ~YAMLParser() = default;

        template< typename T >
        expected< T > parse_from_file(const std::string &file_path);

        template< typename T >
        expected< T > parse_from_string(const std::string &yaml_content);

        template< typename T >
        std::string serialize_to_string(const T &object);

      private:
        expected< std::unique_ptr< llvm::MemoryBuffer > > load_file(const std::string &file_path);

        template< typename T >
        expected< T > parse_yaml_content(llvm::StringRef content, llvm::StringRef origin);

        static void collect_diagnostic(const llvm::SMDiagnostic &diag, void *context);
    };

    template< typename T >
    expected< T > YAMLParser::parse_from_file(const std::string &file_path) {
        auto buffer = load_file(file_path);
        if (!buffer) {
            return buffer.takeError();
        }
        return parse_yaml_content< T >((*buffer)->getBuffer(), file_path);
    }

    template< typename T >
    expected< T > YAMLParser::parse_from_string(const std::string &yaml_content) {
        return parse_yaml_content< T >(yaml_content, "<string>");
    }

    template< typename T >
    std::string YAMLParser::serialize_to_string(const T &object) {
        std::string output;
        llvm::raw_string_ostream stream(output);
        llvm::yaml::Output yaml_output(stream);

        // yaml::Output takes a mutable reference
        T copy = object;
        yaml_output << copy;

        return stream.str();
    }

    template< typename T >
    expected< T > YAMLParser::parse_yaml_content(llvm::StringRef content, llvm::StringRef origin) {
        T result;
        std::string diagnostics;
        llvm::yaml::Input input(content, nullptr, &YAMLParser::collect_diagnostic, &diagnostics);

        input >> result;

        if (input.error()) {
            return llvm::createStringError(
                input.error(), "Failed to parse YAML from %s: %s", origin.str().c_str(),
                diagnostics.empty() ? input.error().message().c_str() : diagnostics.c_str()
            );
        }

        return result;
    }

} // namespace declscan::yaml
