/*
 * Copyright (c) 2025, Alex <uni@vrsal.xyz>
 * SPDX-License-Identifier: BSD-3-Clause
 */

#pragma once
#include <string>

#include <spdlog/common.h>

#include "HarvestError.hpp"

struct HHarvesterConfig
{
	std::string SnapshotUrl{ "http://www.vpngate.net/api/iphone/" };
	std::string SnapshotFile{}; // takes precedence over SnapshotUrl if set
	long        SnapshotTimeout{ 10 };
	std::string StorePath{ "./harvester.store" };
	long        SyncInterval{ 0 }; // seconds, 0 runs a single sync
	std::string OvpnExportDir{};   // export disabled if empty
	spdlog::level::level_enum LogLevel{ spdlog::level::info };

	// ExplicitPath comes from the command line and must exist if given,
	// otherwise the first of ./harvester.ini and /etc/harvester/harvester.ini is used
	HError Find(std::string const& ExplicitPath);

	// Values missing from the file keep their current value
	void Load(std::string const& Path);

	void LogConfig() const;
};
