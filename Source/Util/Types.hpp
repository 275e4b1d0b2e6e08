/*
 * Copyright (c) 2026, Alex <uni@vrsal.cc>
 * SPDX-License-Identifier: BSD-3-Clause
 */

#pragma once
#include <cstdint>

using HMsec = int64_t;    // milliseconds since the unix epoch
using HRecordId = int64_t; // surrogate key assigned by a store
using HBytes = int64_t;
using HBitsPerSecond = int64_t;
