/*
 * Copyright (c) 2025, Trail of Bits, Inc.
 *
 * This source code is licensed in accordance with the terms specified in
 * the LICENSE file found in the root directory of this source tree.
 */

#pragma once

#include <string>

#include <llvm/ADT/SmallString.h>
#include <llvm/ADT/StringRef.h>
#include <llvm/Support/Error.h>
#include <llvm/Support/FileSystem.h>
#include <llvm/Support/Path.h>
#include <llvm/Support/raw_ostream.h>

#include <gtest/gtest.h>

namespace declscan::test {

    // Scratch directory removed with everything in it on destruction.
    class TempDir
    {
      public:
        TempDir() {
            if (auto ec = llvm::sys::fs::createUniqueDirectory("declscan-test", path)) {
                ADD_FAILURE() << "cannot create temporary directory: " << ec.message();
            }
        }

        ~TempDir() { llvm::sys::fs::remove_directories(path); }

        TempDir(const TempDir &)            = delete;
        TempDir &operator=(const TempDir &) = delete;

        std::string file(llvm::StringRef name) const {
            llvm::SmallString< 256 > result(path);
            llvm::sys::path::append(result, name);
            return result.str().str();
        }

        std::string write(llvm::StringRef name, llvm::StringRef contents) const {
            auto file_path = file(name);
            std::error_code ec;
            llvm::raw_fd_ostream os(file_path, ec);
            if (ec) {
                ADD_FAILURE() << "cannot write " << file_path << ": " << ec.message();
                return file_path;
            }
            os << contents;
            return file_path;
        }

        std::string str() const { return path.str().str(); }

      private:
        llvm::SmallString< 256 > path;
    };

    // Substitutes every `@HEADER@` in a fixture with the header path.
    inline std::string with_header(std::string fixture, llvm::StringRef header) {
        const std::string marker = "@HEADER@";
        for (auto pos = fixture.find(marker); pos != std::string::npos;
             pos      = fixture.find(marker, pos + header.size()))
        {
            fixture.replace(pos, marker.size(), header.str());
        }
        return fixture;
    }

    template< typename ErrT >
    bool error_is(llvm::Error err) {
        bool matched = err.isA< ErrT >();
        llvm::consumeError(std::move(err));
        return matched;
    }

} // namespace declscan::test
