/*
 * ebpfoci
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#ifndef libebpfoci_Utility_hpp
#define libebpfoci_Utility_hpp

/*
 * All utility headers.
 */

#include "libebpfoci/utility/environment.hpp"
#include "libebpfoci/utility/filesystem.hpp"
#include "libebpfoci/utility/json.hpp"
#include "libebpfoci/utility/logging.hpp"
#include "libebpfoci/utility/process.hpp"
#include "libebpfoci/utility/string.hpp"

#endif
