//  Copyright (c) 2011-present, Facebook, Inc.  All rights reserved.
//  This source code is licensed under both the GPLv2 (found in the
//  COPYING file in the root directory) and Apache 2.0 License
//  (found in the LICENSE.Apache file in the root directory).

#pragma once

// Embedders that link two copies of the library side by side can compile
// one of them with -DPAGEPOOL_NAMESPACE=<other name>.
#ifndef PAGEPOOL_NAMESPACE
#define PAGEPOOL_NAMESPACE pagepool
#endif
