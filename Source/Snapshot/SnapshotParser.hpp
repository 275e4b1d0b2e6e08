/*
 * Copyright (c) 2026, Alex <uni@vrsal.cc>
 * SPDX-License-Identifier: BSD-3-Clause
 */

#pragma once
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "HarvestError.hpp"

using HSnapshotRow = std::vector<std::string>;

struct HSnapshot
{
	HSnapshotRow              Header{};
	std::vector<HSnapshotRow> Rows{};
};

// The server directory feed is CSV with a few quirks:
//  - a block of '*' comment lines may precede and/or follow the data, never interrupt it
//  - the header is the first data line and is marked by a leading '#'
//  - rows may be shorter than the header (they are padded with empty cells), never longer
//  - quoted cells may contain line breaks
class HSnapshotParser
{
public:
	[[nodiscard]] static std::optional<HSnapshot> Parse(std::string_view Text, HError& OutError);

	// Double-quote CSV splitting into records. Quoted fields may span lines, lines that are
	// empty outside of quotes yield no record. Returns false on a quote still open at the end,
	// OutRecords then holds the records completed before it.
	static bool SplitRecords(std::string_view Text, std::vector<HSnapshotRow>& OutRecords);

private:
	static std::string_view Trim(std::string_view Str);
};
