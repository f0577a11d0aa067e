/*
 * ebpfoci
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#ifndef libebpfoci_utility_filesystem_hpp
#define libebpfoci_utility_filesystem_hpp

#include <string>
#include <utility>
#include <vector>

#include <boost/filesystem.hpp>

/**
 * Utility functions for filesystem manipulation and investigation
 */

namespace libebpfoci {
namespace filesystem {

void createFoldersIfNecessary(const boost::filesystem::path&);
size_t getFileSize(const boost::filesystem::path& filename);
std::string readFile(const boost::filesystem::path& path);
void writeFile(const std::string& content, const boost::filesystem::path& filename);
void writeFileAtomically(const std::string& content, const boost::filesystem::path& filename);
void writeFilesAtomically(const std::vector<std::pair<std::string, boost::filesystem::path>>& contentsAndFilenames);
boost::filesystem::path makeUniquePathWithRandomSuffix(const boost::filesystem::path&);

}}

#endif
