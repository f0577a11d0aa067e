/*
 * ebpfoci
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#include "filesystem.hpp"

#include <fstream>
#include <iterator>
#include <sys/stat.h>

#include <boost/format.hpp>

#include "libebpfoci/Error.hpp"
#include "libebpfoci/PathRAII.hpp"
#include "libebpfoci/utility/logging.hpp"
#include "libebpfoci/utility/string.hpp"

/**
 * Utility functions for filesystem manipulation
 */

namespace libebpfoci {
namespace filesystem {

void createFoldersIfNecessary(const boost::filesystem::path& path) {
    auto currentPath = boost::filesystem::path("");

    if(!boost::filesystem::exists(path)) {
        logMessage(boost::format{"Creating directory %s"} % path, LogLevel::DEBUG);
    }

    for(const auto& element : path) {
        currentPath /= element;
        if(!boost::filesystem::exists(currentPath)) {
            bool created = false;
            try {
                created = boost::filesystem::create_directory(currentPath);
            } catch(const std::exception& e) {
                auto message = boost::format("Failed to create directory %s") % currentPath;
                EBPFOCI_RETHROW_ERROR(e, message.str());
            }
            if(!created) {
                // the creation might have failed because another process concurrently
                // created the same directory. So check whether the directory was indeed
                // created by another process.
                if(!boost::filesystem::is_directory(currentPath)) {
                    auto message = boost::format("Failed to create directory %s") % currentPath;
                    EBPFOCI_THROW_ERROR(message.str());
                }
            }
        }
    }
}

size_t getFileSize(const boost::filesystem::path& filename) {
    struct stat st;
    if(stat(filename.c_str(), &st) != 0) {
        auto message = boost::format("Failed to retrieve size of file %s. Stat failed: %s")
            % filename % strerror(errno);
        EBPFOCI_THROW_ERROR(message.str());
    }
    return st.st_size;
}

/**
 * Reads the whole file in binary mode: compiled eBPF objects and blobs
 * are opaque bytes and must round-trip unchanged.
 */
std::string readFile(const boost::filesystem::path& path) {
    std::ifstream ifs(path.string(), std::ios::in | std::ios::binary);
    if(!ifs) {
        auto message = boost::format("Failed to open %s for reading") % path;
        EBPFOCI_THROW_ERROR(message.str());
    }
    auto s = std::string(   std::istreambuf_iterator<char>(ifs),
                            std::istreambuf_iterator<char>());
    if(ifs.bad()) {
        auto message = boost::format("Failed to read %s") % path;
        EBPFOCI_THROW_ERROR(message.str());
    }
    return s;
}

void writeFile(const std::string& content, const boost::filesystem::path& filename) {
    try {
        if(!filename.parent_path().empty()) {
            createFoldersIfNecessary(filename.parent_path());
        }
        auto ofs = std::ofstream{filename.string(), std::ios::out | std::ios::binary | std::ios::trunc};
        if (!ofs) {
            auto message = boost::format("Failed to open std::ofstream for %s") % filename;
            EBPFOCI_THROW_ERROR(message.str());
        }
        ofs.write(content.data(), content.size());
        ofs.close();
        if (!ofs) {
            auto message = boost::format("Failed to write %d bytes") % content.size();
            EBPFOCI_THROW_ERROR(message.str());
        }
    }
    catch(const std::exception& e) {
        auto message = boost::format("Failed to write file %s") % filename;
        EBPFOCI_RETHROW_ERROR(e, message.str());
    }
}

/**
 * Writes to a temporary sibling file and renames it over the destination,
 * so readers never observe a partially written file.
 */
void writeFileAtomically(const std::string& content, const boost::filesystem::path& filename) {
    auto temporaryFile = makeUniquePathWithRandomSuffix(filename);
    try {
        writeFile(content, temporaryFile);
        boost::filesystem::rename(temporaryFile, filename);
    }
    catch(const std::exception& e) {
        auto ec = boost::system::error_code{};
        boost::filesystem::remove(temporaryFile, ec);
        auto message = boost::format("Failed to atomically write file %s") % filename;
        EBPFOCI_RETHROW_ERROR(e, message.str());
    }
}

/**
 * Writes every file to a temporary sibling and renames them into place only
 * once all of them were written, so that a failed write leaves every target unchanged.
 */
void writeFilesAtomically(const std::vector<std::pair<std::string, boost::filesystem::path>>& contentsAndFilenames) {
    auto temporaryFiles = std::vector<libebpfoci::PathRAII>{};
    try {
        for(const auto& file : contentsAndFilenames) {
            temporaryFiles.emplace_back(makeUniquePathWithRandomSuffix(file.second));
            writeFile(file.first, temporaryFiles.back().getPath());
        }
        for(size_t i=0; i<contentsAndFilenames.size(); ++i) {
            boost::filesystem::rename(temporaryFiles[i].getPath(), contentsAndFilenames[i].second);
            temporaryFiles[i].release();
        }
    }
    catch(const std::exception& e) {
        auto message = boost::format("Failed to atomically write %d files") % contentsAndFilenames.size();
        EBPFOCI_RETHROW_ERROR(e, message.str());
    }
}

/**
 * Generates a random suffix and append it to the given path. If the generated random
 * path exists, tries again with another suffix until the operation succeedes.
 *
 * Note: boost::filesystem::unique_path offers a similar functionality. However, it
 * fails (throws exception) when the locale configuration is invalid.
 */
boost::filesystem::path makeUniquePathWithRandomSuffix(const boost::filesystem::path& path) {
    auto uniquePath = std::string{};

    do {
        const size_t sizeOfRandomSuffix = 16;
        uniquePath = path.string() + "-" + string::generateRandom(sizeOfRandomSuffix);
    } while(boost::filesystem::exists(uniquePath));

    return uniquePath;
}

}}
