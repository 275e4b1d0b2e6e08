/*
 * Copyright (c) 2026, Alex <uni@vrsal.cc>
 * SPDX-License-Identifier: BSD-3-Clause
 */

#include <chrono>
#include <cstdlib>
#include <string>
#include <thread>

#include <spdlog/spdlog.h>

#include "Filesystem.hpp"
#include "HarvesterConfig.hpp"
#include "HarvestError.hpp"
#include "SignalHandler.hpp"
#include "Time.hpp"
#include "Export/OvpnExporter.hpp"
#include "Net/LibCurl.hpp"
#include "Storage/FileServerStore.hpp"
#include "Sync/ServerManager.hpp"

static HError GetSnapshotText(HHarvesterConfig const& Config, HLibCurl& Curl, std::string& OutText)
{
	std::string Error{};
	if (!Config.SnapshotFile.empty())
	{
		if (!HFilesystem::ReadFile(Config.SnapshotFile, OutText, Error))
		{
			return { EHarvestError::Storage, Error };
		}
		return {};
	}

	if (!Curl.IsLoaded())
	{
		Curl.Load();
		if (!Curl.IsLoaded())
		{
			return { EHarvestError::Network, "libcurl is not available, set snapshot.file instead" };
		}
	}

	OutText = Curl.GetText(Config.SnapshotUrl, Config.SnapshotTimeout, Error);
	if (!Error.empty())
	{
		return { EHarvestError::Network, Config.SnapshotUrl + ": " + Error };
	}
	return {};
}

static HError RunSync(HHarvesterConfig const& Config, HLibCurl& Curl, HServerManager& Manager, HFileServerStore& Store)
{
	HMsec const SavedAt = HTime::GetEpochMs();
	spdlog::info("Sync started at {}", HTime::FormatEpochMs(SavedAt));

	std::string Text{};
	if (auto Error = GetSnapshotText(Config, Curl, Text); !Error.IsOk())
	{
		return Error;
	}

	HSyncSummary Summary{};
	if (auto Error = Manager.SyncFromSnapshot(Text, SavedAt, Summary); !Error.IsOk())
	{
		return Error;
	}

	// Changes that failed to save in an earlier round are still pending and get retried here
	if (auto Error = Manager.SaveChanges(Store); !Error.IsOk())
	{
		return Error;
	}

	if (!Config.OvpnExportDir.empty())
	{
		HError ExportError{};
		HOvpnExporter::Export(Manager.GetServers(), Config.OvpnExportDir, ExportError);
		if (!ExportError.IsOk())
		{
			return ExportError;
		}
	}
	return {};
}

int main(int argc, char** argv)
{
	if (std::getenv("INVOCATION_ID") != nullptr)
	{
		// Running under systemd so we don't need the timestamp from spdlog
		spdlog::set_pattern("[%^%l%$] %v");
	}

	HHarvesterConfig Config{};
	if (auto Error = Config.Find(argc > 1 ? argv[1] : ""); !Error.IsOk())
	{
		spdlog::critical("{}", Error.ToString());
		return 1;
	}
	spdlog::set_level(Config.LogLevel);
	spdlog::info("Harvester starting");
	Config.LogConfig();

	HFileServerStore Store(Config.StorePath);
	if (auto Error = Store.Open(); !Error.IsOk())
	{
		spdlog::critical("Failed to open store: {}", Error.ToString());
		return 1;
	}

	HServerManager Manager{};
	if (auto Error = Manager.ResetFromStore(Store); !Error.IsOk())
	{
		spdlog::critical("Failed to load servers from store: {}", Error.ToString());
		return 1;
	}

	HSignalHandler::Install();

	HLibCurl Curl{};
	bool     bLastOk = true;
	while (!HSignalHandler::bStop)
	{
		auto Error = RunSync(Config, Curl, Manager, Store);
		bLastOk = Error.IsOk();
		if (!bLastOk)
		{
			spdlog::error("Sync failed: {}", Error.ToString());
		}

		if (Config.SyncInterval <= 0)
		{
			break;
		}

		auto const WakeUp = std::chrono::steady_clock::now() + std::chrono::seconds(Config.SyncInterval);
		while (!HSignalHandler::bStop && std::chrono::steady_clock::now() < WakeUp)
		{
			std::this_thread::sleep_for(std::chrono::milliseconds(100));
		}
	}

	spdlog::info("Harvester stopped");
	return bLastOk ? 0 : 1;
}
