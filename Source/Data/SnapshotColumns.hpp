/*
 * Copyright (c) 2026, Alex <uni@vrsal.cc>
 * SPDX-License-Identifier: BSD-3-Clause
 */

#pragma once
#include <string>
#include <string_view>
#include <unordered_map>

#include "Snapshot/SnapshotParser.hpp"

// Column names of the server directory feed
#define hCOL static constexpr char const*

hCOL COL_HOST_NAME = "HostName";
hCOL COL_IP = "IP";
hCOL COL_COUNTRY_SHORT = "CountryShort";
hCOL COL_COUNTRY_LONG = "CountryLong";
hCOL COL_LOG_TYPE = "LogType";
hCOL COL_OPERATOR = "Operator";
hCOL COL_MESSAGE = "Message";
hCOL COL_OVPN_CONFIG = "OpenVPN_ConfigData_Base64";

hCOL COL_SCORE = "Score";
hCOL COL_PING = "Ping";
hCOL COL_SPEED = "Speed";
hCOL COL_NUM_SESSIONS = "NumVpnSessions";
hCOL COL_UPTIME = "Uptime";
hCOL COL_TOTAL_USERS = "TotalUsers";
hCOL COL_TOTAL_TRAFFIC = "TotalTraffic";

#undef hCOL

// Resolves column names to cell positions once per snapshot
class HSnapshotColumns
{
	std::unordered_map<std::string, size_t> Indices{};

public:
	explicit HSnapshotColumns(HSnapshotRow const& Header)
	{
		for (size_t i = 0; i < Header.size(); ++i)
		{
			// first occurrence wins
			Indices.emplace(Header[i], i);
		}
	}

	[[nodiscard]] bool Contains(std::string const& Column) const { return Indices.contains(Column); }

	// Empty for columns the header lacks or cells the row lacks
	[[nodiscard]] std::string const& Cell(HSnapshotRow const& Row, std::string const& Column) const
	{
		static std::string const Empty{};
		auto const               It = Indices.find(Column);
		if (It == Indices.end() || It->second >= Row.size())
		{
			return Empty;
		}
		return Row[It->second];
	}
};
