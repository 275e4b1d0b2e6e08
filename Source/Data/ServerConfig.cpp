/*
 * Copyright (c) 2026, Alex <uni@vrsal.cc>
 * SPDX-License-Identifier: BSD-3-Clause
 */

#include "ServerConfig.hpp"

#include <spdlog/fmt/fmt.h>

namespace
{
	template <typename T>
	void TakeIfDifferent(T& Mine, T const& Theirs, bool& bChanged)
	{
		if (Mine != Theirs)
		{
			Mine = Theirs;
			bChanged = true;
		}
	}
} // namespace

HServerConfig HServerConfig::FromSnapshotRow(HSnapshotColumns const& Columns, HSnapshotRow const& Row)
{
	HServerConfig Config{};
	Config.Name = Columns.Cell(Row, COL_HOST_NAME);
	Config.Ip = HIPAddress::FromString(Columns.Cell(Row, COL_IP));
	Config.CountryCode = Columns.Cell(Row, COL_COUNTRY_SHORT);
	Config.CountryName = Columns.Cell(Row, COL_COUNTRY_LONG);
	Config.LogType = Columns.Cell(Row, COL_LOG_TYPE);
	Config.OperatorName = Columns.Cell(Row, COL_OPERATOR);
	Config.OperatorMessage = Columns.Cell(Row, COL_MESSAGE);
	Config.ConfigBlob = Columns.Cell(Row, COL_OVPN_CONFIG);
	return Config;
}

std::set<std::string> HServerConfig::GetSnapshotColumns()
{
	return { COL_HOST_NAME, COL_IP, COL_COUNTRY_SHORT, COL_COUNTRY_LONG, COL_LOG_TYPE, COL_OPERATOR, COL_MESSAGE,
		COL_OVPN_CONFIG };
}

HError HServerConfig::MergeFrom(HServerConfig const& Other, bool& bOutChanged)
{
	bOutChanged = false;

	if (Other.Name != Name)
	{
		return { EHarvestError::NameMismatch, fmt::format("expected name '{}', got '{}'", Name, Other.Name) };
	}

	if (Other.Id && Id && *Other.Id != *Id)
	{
		return { EHarvestError::ConflictingId, fmt::format("conflicting ids {} and {} for '{}'", *Id, *Other.Id, Name) };
	}

	if (Other.Id && !Id)
	{
		// the other side has already been persisted
		Id = Other.Id;
		bOutChanged = true;
	}

	TakeIfDifferent(Ip, Other.Ip, bOutChanged);
	TakeIfDifferent(CountryCode, Other.CountryCode, bOutChanged);
	TakeIfDifferent(CountryName, Other.CountryName, bOutChanged);
	TakeIfDifferent(LogType, Other.LogType, bOutChanged);
	TakeIfDifferent(OperatorName, Other.OperatorName, bOutChanged);
	TakeIfDifferent(OperatorMessage, Other.OperatorMessage, bOutChanged);
	TakeIfDifferent(ConfigBlob, Other.ConfigBlob, bOutChanged);
	return {};
}

bool operator==(HServerConfig const& Lhs, HServerConfig const& Rhs)
{
	return Lhs.Name == Rhs.Name && Lhs.Ip == Rhs.Ip && Lhs.CountryCode == Rhs.CountryCode
		&& Lhs.CountryName == Rhs.CountryName && Lhs.LogType == Rhs.LogType && Lhs.OperatorName == Rhs.OperatorName
		&& Lhs.OperatorMessage == Rhs.OperatorMessage && Lhs.ConfigBlob == Rhs.ConfigBlob && Lhs.Id == Rhs.Id;
}
