/*
 * Copyright (c) 2026, Alex <uni@vrsal.cc>
 * SPDX-License-Identifier: BSD-3-Clause
 */

#include "ServerStat.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>

HServerStat HServerStat::FromSnapshotRow(HSnapshotColumns const& Columns, HSnapshotRow const& Row, HMsec SavedAt)
{
	HServerStat Stat{};
	Stat.Score = ParseCount(Columns.Cell(Row, COL_SCORE));
	Stat.PingMs = ParseCount(Columns.Cell(Row, COL_PING));
	Stat.SpeedBps = ParseCount(Columns.Cell(Row, COL_SPEED));
	Stat.NumSessions = ParseCount(Columns.Cell(Row, COL_NUM_SESSIONS));
	Stat.UptimeMs = ParseCount(Columns.Cell(Row, COL_UPTIME));
	Stat.TotalUsers = ParseCount(Columns.Cell(Row, COL_TOTAL_USERS));
	Stat.TotalTrafficBytes = ParseCount(Columns.Cell(Row, COL_TOTAL_TRAFFIC));
	Stat.SavedAt = SavedAt;
	return Stat;
}

std::set<std::string> HServerStat::GetSnapshotColumns()
{
	return { COL_SCORE, COL_PING, COL_SPEED, COL_NUM_SESSIONS, COL_UPTIME, COL_TOTAL_USERS, COL_TOTAL_TRAFFIC };
}

int64_t HServerStat::ParseCount(std::string_view Cell)
{
	if (Cell.empty()
		|| !std::ranges::all_of(Cell, [](char C) { return std::isdigit(static_cast<unsigned char>(C)) != 0; }))
	{
		return 0;
	}

	int64_t    Value = 0;
	auto const Result = std::from_chars(Cell.data(), Cell.data() + Cell.size(), Value);
	if (Result.ec != std::errc())
	{
		return 0;
	}
	return Value;
}
