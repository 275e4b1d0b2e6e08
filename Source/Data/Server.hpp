/*
 * Copyright (c) 2026, Alex <uni@vrsal.cc>
 * SPDX-License-Identifier: BSD-3-Clause
 */

#pragma once
#include <map>
#include <optional>
#include <set>
#include <string>
#include <utility>

#include "HarvestError.hpp"
#include "Types.hpp"
#include "Data/ServerConfig.hpp"
#include "Data/ServerStat.hpp"
#include "Data/UserTest.hpp"

using HStatSeries = std::map<HMsec, HServerStat>;
using HTestSeries = std::map<HMsec, HUserTest>;

// Aggregate root: one config plus two series keyed by their SavedAt timestamp.
// Merged and persisted as a unit.
struct HServer
{
	HServerConfig Config{};
	HStatSeries   Stats{};
	HTestSeries   Tests{};

	HServer() = default;
	explicit HServer(HServerConfig Config_) : Config(std::move(Config_)) {}

	// Transient aggregate for one feed row: the row's config and a single stat at SavedAt
	static HServer FromSnapshotRow(HSnapshotColumns const& Columns, HSnapshotRow const& Row, HMsec SavedAt);

	// Every column the feed has to provide, order does not matter
	static std::set<std::string> GetRequiredColumns();

	[[nodiscard]] std::string const& GetName() const { return Config.Name; }

	[[nodiscard]] std::optional<HMsec> GetLastStatTime() const;
	[[nodiscard]] std::optional<HMsec> GetLastTestTime() const;

	// An equal stat at the same timestamp is accepted as a no-op. A different one at the same
	// timestamp is a ConflictingStatAtTimestamp, a stat equal to its chronological predecessor
	// or successor is a RedundantStat. The series is unchanged on error.
	HError AddStat(HServerStat const& Stat, bool& bOutInserted);
	HError AddStat(HServerStat const& Stat)
	{
		bool bInserted = false;
		return AddStat(Stat, bInserted);
	}

	// One test per timestamp, ConflictingTestAtTimestamp if a different one is already there
	HError AddTest(HUserTest const& Test, bool& bOutInserted);
	HError AddTest(HUserTest const& Test)
	{
		bool bInserted = false;
		return AddTest(Test, bInserted);
	}

	// Merges config, stats and tests of Other into this server.
	// Config and stat errors leave the aggregate exactly as it was before the call,
	// conflicting tests are logged and skipped.
	HError MergeFrom(HServer const& Other, bool& bOutChanged);

	template <class Archive>
	void serialize(Archive& archive)
	{
		archive(Config, Stats, Tests);
	}
};

inline bool operator==(HServer const& Lhs, HServer const& Rhs)
{
	return Lhs.Config == Rhs.Config && Lhs.Stats == Rhs.Stats && Lhs.Tests == Rhs.Tests;
}
