/*
 * Copyright (c) 2026, Alex <uni@vrsal.cc>
 * SPDX-License-Identifier: BSD-3-Clause
 */

#pragma once
#include <optional>
#include <set>
#include <string>

#include "HarvestError.hpp"
#include "IPAddress.hpp"
#include "Types.hpp"
#include "Data/SnapshotColumns.hpp"

// Identity and descriptive attributes of one relay server,
// Name is the natural key and never changes once the server exists
struct HServerConfig
{
	std::string               Name{};
	std::optional<HIPAddress> Ip{}; // unparsable addresses end up empty
	std::string               CountryCode{};
	std::string               CountryName{};
	std::string               LogType{};
	std::string               OperatorName{};
	std::string               OperatorMessage{};
	std::string               ConfigBlob{}; // base64 OpenVPN profile

	std::optional<HRecordId> Id{};

	static HServerConfig FromSnapshotRow(HSnapshotColumns const& Columns, HSnapshotRow const& Row);

	static std::set<std::string> GetSnapshotColumns();

	// Takes over every attribute of Other that differs from ours.
	// Fails without touching anything on a name mismatch or when both sides carry different ids.
	HError MergeFrom(HServerConfig const& Other, bool& bOutChanged);

	template <class Archive>
	void serialize(Archive& archive)
	{
		archive(Name, Ip, CountryCode, CountryName, LogType, OperatorName, OperatorMessage, ConfigBlob, Id);
	}
};

bool operator==(HServerConfig const& Lhs, HServerConfig const& Rhs);
