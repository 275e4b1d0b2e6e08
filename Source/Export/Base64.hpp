/*
 * Copyright (c) 2026, Alex <uni@vrsal.cc>
 * SPDX-License-Identifier: BSD-3-Clause
 */

#pragma once
#include <optional>
#include <string>
#include <string_view>

class HBase64
{
public:
	// Standard alphabet with padding, whitespace anywhere in the input is ignored.
	// Returns empty on malformed input.
	static std::optional<std::string> Decode(std::string_view Encoded);
};
