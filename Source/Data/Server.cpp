/*
 * Copyright (c) 2026, Alex <uni@vrsal.cc>
 * SPDX-License-Identifier: BSD-3-Clause
 */

#include "Server.hpp"

#include <iterator>
#include <ranges>
#include <vector>
#include <spdlog/spdlog.h>

#include "Time.hpp"

HServer HServer::FromSnapshotRow(HSnapshotColumns const& Columns, HSnapshotRow const& Row, HMsec SavedAt)
{
	HServer Server{ HServerConfig::FromSnapshotRow(Columns, Row) };
	Server.Stats.emplace(SavedAt, HServerStat::FromSnapshotRow(Columns, Row, SavedAt));
	return Server;
}

std::set<std::string> HServer::GetRequiredColumns()
{
	auto Columns = HServerConfig::GetSnapshotColumns();
	Columns.merge(HServerStat::GetSnapshotColumns());
	return Columns;
}

std::optional<HMsec> HServer::GetLastStatTime() const
{
	if (Stats.empty())
	{
		return std::nullopt;
	}
	return Stats.rbegin()->first;
}

std::optional<HMsec> HServer::GetLastTestTime() const
{
	if (Tests.empty())
	{
		return std::nullopt;
	}
	return Tests.rbegin()->first;
}

HError HServer::AddStat(HServerStat const& Stat, bool& bOutInserted)
{
	bOutInserted = false;

	auto const Next = Stats.lower_bound(Stat.SavedAt);
	if (Next != Stats.end() && Next->first == Stat.SavedAt)
	{
		if (Next->second.HasSameValues(Stat))
		{
			return {};
		}
		return { EHarvestError::ConflictingStatAtTimestamp,
			fmt::format("'{}' already has a different stat at {}", GetName(), HTime::FormatEpochMs(Stat.SavedAt)) };
	}

	bool const bSameAsNext = Next != Stats.end() && Next->second.HasSameValues(Stat);
	bool const bSameAsPrev = Next != Stats.begin() && std::prev(Next)->second.HasSameValues(Stat);
	if (bSameAsPrev || bSameAsNext)
	{
		return { EHarvestError::RedundantStat,
			fmt::format("stat of '{}' at {} equals its neighbour", GetName(), HTime::FormatEpochMs(Stat.SavedAt)) };
	}

	Stats.emplace_hint(Next, Stat.SavedAt, Stat);
	bOutInserted = true;
	return {};
}

HError HServer::AddTest(HUserTest const& Test, bool& bOutInserted)
{
	bOutInserted = false;

	if (auto const It = Tests.find(Test.SavedAt); It != Tests.end())
	{
		if (It->second.HasSameValues(Test))
		{
			return {};
		}
		return { EHarvestError::ConflictingTestAtTimestamp,
			fmt::format("'{}' already has a different test at {}", GetName(), HTime::FormatEpochMs(Test.SavedAt)) };
	}

	Tests.emplace(Test.SavedAt, Test);
	bOutInserted = true;
	return {};
}

HError HServer::MergeFrom(HServer const& Other, bool& bOutChanged)
{
	bOutChanged = false;

	// Stats and tests are only ever inserted, so restoring the config
	// and erasing what we inserted brings back the pre-merge state
	HServerConfig const ConfigBackup = Config;

	bool bConfigChanged = false;
	if (auto Error = Config.MergeFrom(Other.Config, bConfigChanged); !Error.IsOk())
	{
		Config = ConfigBackup;
		return Error;
	}

	std::vector<HMsec> InsertedStats{};
	for (auto const& Stat : Other.Stats | std::views::values)
	{
		bool bInserted = false;
		if (auto Error = AddStat(Stat, bInserted); !Error.IsOk())
		{
			for (auto const SavedAt : InsertedStats)
			{
				Stats.erase(SavedAt);
			}
			Config = ConfigBackup;
			return Error;
		}
		if (bInserted)
		{
			InsertedStats.push_back(Stat.SavedAt);
		}
	}

	bool bTestsChanged = false;
	for (auto const& Test : Other.Tests | std::views::values)
	{
		bool bInserted = false;
		if (auto Error = AddTest(Test, bInserted); !Error.IsOk())
		{
			spdlog::warn("Skipping user test: {}", Error.ToString());
			continue;
		}
		bTestsChanged |= bInserted;
	}

	bOutChanged = bConfigChanged || !InsertedStats.empty() || bTestsChanged;
	return {};
}
