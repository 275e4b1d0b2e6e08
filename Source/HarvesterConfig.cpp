/*
 * Copyright (c) 2025, Alex <uni@vrsal.xyz>
 * SPDX-License-Identifier: BSD-3-Clause
 */

#include "HarvesterConfig.hpp"

#include <INIReader.h>
#include <spdlog/spdlog.h>

#include "Filesystem.hpp"

HError HHarvesterConfig::Find(std::string const& ExplicitPath)
{
	if (!ExplicitPath.empty())
	{
		if (!HFilesystem::Exists(ExplicitPath))
		{
			return { EHarvestError::Config, "configuration file '" + ExplicitPath + "' does not exist" };
		}
		Load(ExplicitPath);
	}
	else if (HFilesystem::Exists("./harvester.ini"))
	{
		Load("./harvester.ini");
	}
	else if (HFilesystem::Exists("/etc/harvester/harvester.ini"))
	{
		Load("/etc/harvester/harvester.ini");
	}
	else
	{
		spdlog::info("no configuration file found, using defaults");
	}
	return {};
}

void HHarvesterConfig::LogConfig() const
{
	if (SnapshotFile.empty())
	{
		spdlog::info("snapshot url={} (timeout {}s)", SnapshotUrl, SnapshotTimeout);
	}
	else
	{
		spdlog::info("snapshot file={}", SnapshotFile);
	}
	spdlog::info("store path={}", StorePath);
	if (SyncInterval > 0)
	{
		spdlog::info("sync interval={}s", SyncInterval);
	}
	else
	{
		spdlog::info("sync interval=once");
	}
	if (!OvpnExportDir.empty())
	{
		spdlog::info("ovpn export dir={}", OvpnExportDir);
	}
	spdlog::info("log level={}", spdlog::level::to_string_view(LogLevel));
}

void HHarvesterConfig::Load(std::string const& Path)
{
	INIReader Reader(Path);

	auto SafeGet = [&](std::string const& Section, std::string const& Name, std::string& OutVal) {
		if (Reader.HasValue(Section, Name))
		{
			OutVal = Reader.Get(Section, Name, OutVal);
		}
	};

	if (Reader.ParseError() != 0)
	{
		if (Reader.ParseError() > 0)
		{
			spdlog::error("can't load '{}': syntax error on line {}", Path, Reader.ParseError());
		}
		else
		{
			spdlog::error("can't load '{}': {}", Path, Reader.ParseErrorMessage());
		}
		return;
	}

	spdlog::info("loading configuration from '{}'", Path);

	SafeGet("snapshot", "url", SnapshotUrl);
	SafeGet("snapshot", "file", SnapshotFile);
	SafeGet("store", "path", StorePath);
	SafeGet("export", "ovpn_dir", OvpnExportDir);

	if (long Timeout = Reader.GetInteger("snapshot", "timeout", SnapshotTimeout); Timeout > 0)
	{
		SnapshotTimeout = Timeout;
	}
	else
	{
		spdlog::error("snapshot.timeout must be positive, keeping {}", SnapshotTimeout);
	}

	if (long Interval = Reader.GetInteger("sync", "interval", SyncInterval); Interval >= 0)
	{
		SyncInterval = Interval;
	}
	else
	{
		spdlog::error("sync.interval can't be negative, keeping {}", SyncInterval);
	}

	if (Reader.HasValue("log", "level"))
	{
		std::string const LevelName = Reader.Get("log", "level", "info");
		auto const        Level = spdlog::level::from_str(LevelName);
		// from_str maps unknown names to off
		if (Level == spdlog::level::off && LevelName != "off")
		{
			spdlog::error("unknown log level '{}'", LevelName);
		}
		else
		{
			LogLevel = Level;
		}
	}
}
