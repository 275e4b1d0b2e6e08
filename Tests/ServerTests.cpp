/*
 * Copyright (c) 2026, Alex <uni@vrsal.cc>
 * SPDX-License-Identifier: BSD-3-Clause
 */

#include <gtest/gtest.h>

#include "Data/Server.hpp"

namespace
{
	HServerStat MakeStat(HMsec SavedAt, int64_t Score, int64_t PingMs = 10)
	{
		HServerStat Stat{};
		Stat.SavedAt = SavedAt;
		Stat.Score = Score;
		Stat.PingMs = PingMs;
		return Stat;
	}

	HUserTest MakeTest(HMsec SavedAt, int64_t PingMs)
	{
		HUserTest Test{};
		Test.SavedAt = SavedAt;
		Test.PingMs = PingMs;
		return Test;
	}

	HServerConfig MakeConfig(std::string Name, std::optional<HRecordId> Id = std::nullopt)
	{
		HServerConfig Config{};
		Config.Name = std::move(Name);
		Config.CountryCode = "JP";
		Config.Id = Id;
		return Config;
	}
} // namespace

TEST(ServerStat, ParseCountAcceptsPlainDigitsOnly)
{
	EXPECT_EQ(HServerStat::ParseCount("12345"), 12345);
	EXPECT_EQ(HServerStat::ParseCount(""), 0);
	EXPECT_EQ(HServerStat::ParseCount("-5"), 0);
	EXPECT_EQ(HServerStat::ParseCount("1.5"), 0);
	EXPECT_EQ(HServerStat::ParseCount("12a"), 0);
	EXPECT_EQ(HServerStat::ParseCount("99999999999999999999"), 0);
}

TEST(ServerConfig, MergeRejectsDifferentName)
{
	HServerConfig Mine = MakeConfig("a");
	bool          bChanged = true;
	auto          Error = Mine.MergeFrom(MakeConfig("b"), bChanged);

	EXPECT_EQ(Error.Code, EHarvestError::NameMismatch);
	EXPECT_FALSE(bChanged);
	EXPECT_EQ(Mine, MakeConfig("a"));
}

TEST(ServerConfig, MergeRejectsConflictingIds)
{
	HServerConfig Mine = MakeConfig("a", 1);
	HServerConfig Theirs = MakeConfig("a", 2);
	Theirs.CountryCode = "US";
	bool bChanged = false;

	EXPECT_EQ(Mine.MergeFrom(Theirs, bChanged).Code, EHarvestError::ConflictingId);
	EXPECT_EQ(Mine.CountryCode, "JP");
}

TEST(ServerConfig, MergeTakesDifferentFieldsAndAdoptsId)
{
	HServerConfig Mine = MakeConfig("a");
	HServerConfig Theirs = MakeConfig("a", 7);
	Theirs.OperatorName = "op";
	Theirs.Ip = HIPAddress::FromString("10.0.0.1");
	bool bChanged = false;

	ASSERT_TRUE(Mine.MergeFrom(Theirs, bChanged).IsOk());
	EXPECT_TRUE(bChanged);
	EXPECT_EQ(Mine.Id, std::optional<HRecordId>(7));
	EXPECT_EQ(Mine.OperatorName, "op");
	ASSERT_TRUE(Mine.Ip.has_value());
	EXPECT_EQ(Mine.Ip->ToString(), "10.0.0.1");
}

TEST(ServerConfig, MergeOfEqualConfigIsNoChange)
{
	HServerConfig Mine = MakeConfig("a", 3);
	bool          bChanged = true;

	ASSERT_TRUE(Mine.MergeFrom(MakeConfig("a"), bChanged).IsOk());
	EXPECT_FALSE(bChanged);
	EXPECT_EQ(Mine.Id, std::optional<HRecordId>(3));
}

TEST(Server, EqualStatAtSameTimestampIsNoOp)
{
	HServer Server{ MakeConfig("a") };
	ASSERT_TRUE(Server.AddStat(MakeStat(100, 5)).IsOk());

	bool bInserted = true;
	ASSERT_TRUE(Server.AddStat(MakeStat(100, 5), bInserted).IsOk());
	EXPECT_FALSE(bInserted);
	EXPECT_EQ(Server.Stats.size(), 1u);
}

TEST(Server, DifferentStatAtSameTimestampConflicts)
{
	HServer Server{ MakeConfig("a") };
	ASSERT_TRUE(Server.AddStat(MakeStat(100, 5)).IsOk());

	EXPECT_EQ(Server.AddStat(MakeStat(100, 6)).Code, EHarvestError::ConflictingStatAtTimestamp);
	EXPECT_EQ(Server.Stats.at(100).Score, 5);
}

TEST(Server, StatEqualToPredecessorIsRedundant)
{
	HServer Server{ MakeConfig("a") };
	ASSERT_TRUE(Server.AddStat(MakeStat(100, 5)).IsOk());

	EXPECT_EQ(Server.AddStat(MakeStat(200, 5)).Code, EHarvestError::RedundantStat);
	EXPECT_EQ(Server.Stats.size(), 1u);
	EXPECT_EQ(Server.GetLastStatTime(), std::optional<HMsec>(100));
}

TEST(Server, StatEqualToSuccessorIsRedundant)
{
	HServer Server{ MakeConfig("a") };
	ASSERT_TRUE(Server.AddStat(MakeStat(300, 5)).IsOk());
	ASSERT_TRUE(Server.AddStat(MakeStat(100, 7)).IsOk());

	EXPECT_EQ(Server.AddStat(MakeStat(200, 5)).Code, EHarvestError::RedundantStat);
	EXPECT_EQ(Server.AddStat(MakeStat(200, 7)).Code, EHarvestError::RedundantStat);
	ASSERT_TRUE(Server.AddStat(MakeStat(200, 6)).IsOk());
	EXPECT_EQ(Server.Stats.size(), 3u);
}

TEST(Server, ChangedStatIsAppended)
{
	HServer Server{ MakeConfig("a") };
	ASSERT_TRUE(Server.AddStat(MakeStat(100, 5)).IsOk());
	ASSERT_TRUE(Server.AddStat(MakeStat(200, 6)).IsOk());
	ASSERT_TRUE(Server.AddStat(MakeStat(300, 5)).IsOk());

	EXPECT_EQ(Server.Stats.size(), 3u);
	EXPECT_EQ(Server.GetLastStatTime(), std::optional<HMsec>(300));
}

TEST(Server, TestsConflictOnlyWhenValuesDiffer)
{
	HServer Server{ MakeConfig("a") };
	EXPECT_FALSE(Server.GetLastTestTime().has_value());
	ASSERT_TRUE(Server.AddTest(MakeTest(100, 20)).IsOk());

	bool bInserted = true;
	ASSERT_TRUE(Server.AddTest(MakeTest(100, 20), bInserted).IsOk());
	EXPECT_FALSE(bInserted);
	EXPECT_EQ(Server.AddTest(MakeTest(100, 21)).Code, EHarvestError::ConflictingTestAtTimestamp);

	// equal consecutive tests are fine, unlike stats
	ASSERT_TRUE(Server.AddTest(MakeTest(200, 20)).IsOk());
	EXPECT_EQ(Server.GetLastTestTime(), std::optional<HMsec>(200));
}

TEST(Server, MergeAddsStatsAndConfig)
{
	HServer Mine{ MakeConfig("a") };
	ASSERT_TRUE(Mine.AddStat(MakeStat(100, 5)).IsOk());

	HServer Theirs{ MakeConfig("a") };
	Theirs.Config.LogType = "2weeks";
	ASSERT_TRUE(Theirs.AddStat(MakeStat(200, 6)).IsOk());

	bool bChanged = false;
	ASSERT_TRUE(Mine.MergeFrom(Theirs, bChanged).IsOk());
	EXPECT_TRUE(bChanged);
	EXPECT_EQ(Mine.Config.LogType, "2weeks");
	EXPECT_EQ(Mine.Stats.size(), 2u);
}

TEST(Server, MergeOfIdenticalServerIsNoChange)
{
	HServer Mine{ MakeConfig("a", 1) };
	ASSERT_TRUE(Mine.AddStat(MakeStat(100, 5)).IsOk());
	HServer const Before = Mine;

	HServer Theirs{ MakeConfig("a") };
	ASSERT_TRUE(Theirs.AddStat(MakeStat(100, 5)).IsOk());

	bool bChanged = true;
	ASSERT_TRUE(Mine.MergeFrom(Theirs, bChanged).IsOk());
	EXPECT_FALSE(bChanged);
	EXPECT_EQ(Mine, Before);
}

TEST(Server, RedundantStatRollsBackWholeMerge)
{
	HServer Mine{ MakeConfig("a") };
	ASSERT_TRUE(Mine.AddStat(MakeStat(100, 5)).IsOk());
	HServer const Before = Mine;

	HServer Theirs{ MakeConfig("a") };
	Theirs.Config.CountryCode = "KR";
	// the first two merge fine, the last one repeats its predecessor
	Theirs.Stats.emplace(50, MakeStat(50, 9));
	Theirs.Stats.emplace(200, MakeStat(200, 6));
	Theirs.Stats.emplace(300, MakeStat(300, 6));

	bool bChanged = true;
	EXPECT_EQ(Mine.MergeFrom(Theirs, bChanged).Code, EHarvestError::RedundantStat);
	EXPECT_FALSE(bChanged);
	EXPECT_EQ(Mine, Before);
}

TEST(Server, ConflictingIdLeavesServerUntouched)
{
	HServer Mine{ MakeConfig("a", 1) };
	ASSERT_TRUE(Mine.AddStat(MakeStat(100, 5)).IsOk());
	HServer const Before = Mine;

	HServer Theirs{ MakeConfig("a", 2) };
	ASSERT_TRUE(Theirs.AddStat(MakeStat(200, 6)).IsOk());

	bool bChanged = true;
	EXPECT_EQ(Mine.MergeFrom(Theirs, bChanged).Code, EHarvestError::ConflictingId);
	EXPECT_EQ(Mine, Before);
}

TEST(Server, ConflictingTestIsSkipped)
{
	HServer Mine{ MakeConfig("a") };
	ASSERT_TRUE(Mine.AddTest(MakeTest(100, 20)).IsOk());

	HServer Theirs{ MakeConfig("a") };
	ASSERT_TRUE(Theirs.AddTest(MakeTest(100, 30)).IsOk());
	ASSERT_TRUE(Theirs.AddTest(MakeTest(200, 30)).IsOk());

	bool bChanged = false;
	ASSERT_TRUE(Mine.MergeFrom(Theirs, bChanged).IsOk());
	EXPECT_TRUE(bChanged);
	EXPECT_EQ(Mine.Tests.at(100).PingMs, 20);
	EXPECT_EQ(Mine.Tests.at(200).PingMs, 30);
}

TEST(Server, BuildsFromSnapshotRow)
{
	HSnapshotRow const     Header{ "HostName", "IP", "Score", "Ping", "Speed", "CountryShort" };
	HSnapshotColumns const Columns(Header);
	HSnapshotRow const     Row{ "public-vpn-1", "219.100.37.1", "1234", "7", "not a number", "JP" };

	HServer const Server = HServer::FromSnapshotRow(Columns, Row, 1000);
	EXPECT_EQ(Server.GetName(), "public-vpn-1");
	ASSERT_TRUE(Server.Config.Ip.has_value());
	EXPECT_EQ(Server.Config.Ip->Family, EIPFamily::IPv4);
	EXPECT_EQ(Server.Config.CountryCode, "JP");
	EXPECT_FALSE(Server.Config.Id.has_value());
	ASSERT_EQ(Server.Stats.size(), 1u);
	auto const& Stat = Server.Stats.at(1000);
	EXPECT_EQ(Stat.Score, 1234);
	EXPECT_EQ(Stat.PingMs, 7);
	EXPECT_EQ(Stat.SpeedBps, 0);
	EXPECT_EQ(Stat.SavedAt, 1000);
}

TEST(Server, RequiredColumnsCoverConfigAndStat)
{
	auto const Columns = HServer::GetRequiredColumns();
	EXPECT_EQ(Columns.size(), 15u);
	EXPECT_TRUE(Columns.contains("HostName"));
	EXPECT_TRUE(Columns.contains("OpenVPN_ConfigData_Base64"));
	EXPECT_TRUE(Columns.contains("TotalTraffic"));
}
