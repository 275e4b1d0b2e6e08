/*
 * Copyright (c) 2026, Alex <uni@vrsal.cc>
 * SPDX-License-Identifier: BSD-3-Clause
 */

#pragma once
#include <optional>
#include <set>
#include <string>
#include <string_view>

#include "Types.hpp"
#include "Data/SnapshotColumns.hpp"

// One sample of the statistics a server reports about itself
struct HServerStat
{
	int64_t        Score{ 0 };
	int64_t        PingMs{ 0 };
	HBitsPerSecond SpeedBps{ 0 };
	int64_t        NumSessions{ 0 };
	int64_t        UptimeMs{ 0 };
	int64_t        TotalUsers{ 0 };
	HBytes         TotalTrafficBytes{ 0 };

	HMsec                    SavedAt{ 0 }; // key within the series
	std::optional<HRecordId> Id{};

	static HServerStat FromSnapshotRow(HSnapshotColumns const& Columns, HSnapshotRow const& Row, HMsec SavedAt);

	static std::set<std::string> GetSnapshotColumns();

	// Plain digit strings that fit into 64 bits, anything else counts as 0
	static int64_t ParseCount(std::string_view Cell);

	// Compares the reported values only, SavedAt and Id are ignored
	[[nodiscard]] bool HasSameValues(HServerStat const& Other) const
	{
		return Score == Other.Score && PingMs == Other.PingMs && SpeedBps == Other.SpeedBps
			&& NumSessions == Other.NumSessions && UptimeMs == Other.UptimeMs && TotalUsers == Other.TotalUsers
			&& TotalTrafficBytes == Other.TotalTrafficBytes;
	}

	template <class Archive>
	void serialize(Archive& archive)
	{
		archive(Score, PingMs, SpeedBps, NumSessions, UptimeMs, TotalUsers, TotalTrafficBytes, SavedAt, Id);
	}
};

inline bool operator==(HServerStat const& Lhs, HServerStat const& Rhs)
{
	return Lhs.HasSameValues(Rhs) && Lhs.SavedAt == Rhs.SavedAt && Lhs.Id == Rhs.Id;
}
