//  Copyright (c) 2011-present, Facebook, Inc.  All rights reserved.
//  This source code is licensed under both the GPLv2 (found in the
//  COPYING file in the root directory) and Apache 2.0 License
//  (found in the LICENSE.Apache file in the root directory).

#pragma once

#include <string>

// Include the appropriate platform specific file below.  If you are
// porting to a new platform, see "port_posix.h" for documentation
// of what the new port_<platform>.h file must provide.
#include "port/port_posix.h"
