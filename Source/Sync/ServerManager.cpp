/*
 * Copyright (c) 2026, Alex <uni@vrsal.cc>
 * SPDX-License-Identifier: BSD-3-Clause
 */

#include "ServerManager.hpp"

#include <algorithm>
#include <iterator>
#include <ranges>
#include <vector>
#include <spdlog/spdlog.h>
#include <spdlog/fmt/ranges.h>

#include "Snapshot/SnapshotParser.hpp"

HError HServerManager::ResetFromStore(IServerStore& Store)
{
	std::vector<HServer> StoredServers{};
	if (auto Error = Store.ReadAll(StoredServers); !Error.IsOk())
	{
		return Error;
	}

	Servers.clear();
	PendingUpserts.clear();
	PendingDeletes.clear();

	for (auto& Server : StoredServers)
	{
		auto Name = Server.GetName();
		Servers.insert_or_assign(std::move(Name), std::move(Server));
	}

	State = EManagerState::Loaded;
	spdlog::info("Loaded {} servers from store", Servers.size());
	return {};
}

void HServerManager::MarkForUpsert(std::string const& Name)
{
	PendingDeletes.erase(Name);
	PendingUpserts.insert(Name);
	State = EManagerState::Dirty;
}

HError HServerManager::SyncFromSnapshot(std::string_view SnapshotText, HMsec SavedAt, HSyncSummary& OutSummary)
{
	OutSummary = {};

	HError     Error{};
	auto const Snapshot = HSnapshotParser::Parse(SnapshotText, Error);
	if (!Snapshot)
	{
		return Error;
	}

	auto const                  Required = HServer::GetRequiredColumns();
	std::set<std::string> const Actual(Snapshot->Header.begin(), Snapshot->Header.end());
	if (Actual != Required)
	{
		std::vector<std::string> Missing{};
		std::vector<std::string> Unexpected{};
		std::ranges::set_difference(Required, Actual, std::back_inserter(Missing));
		std::ranges::set_difference(Actual, Required, std::back_inserter(Unexpected));
		return { EHarvestError::SchemaMismatch,
			fmt::format("missing columns [{}], unexpected columns [{}]", fmt::join(Missing, ", "),
				fmt::join(Unexpected, ", ")) };
	}

	HSnapshotColumns const Columns(Snapshot->Header);
	std::set<std::string>  FreshNames{};

	for (auto const& Row : Snapshot->Rows)
	{
		HServer Fresh = HServer::FromSnapshotRow(Columns, Row, SavedAt);
		auto const Name = Fresh.GetName();
		if (Name.empty())
		{
			spdlog::warn("Ignoring snapshot row without a host name");
			++OutSummary.Skipped;
			continue;
		}
		FreshNames.insert(Name);

		auto It = Servers.find(Name);
		if (It == Servers.end())
		{
			Servers.emplace(Name, std::move(Fresh));
			MarkForUpsert(Name);
			++OutSummary.Added;
			continue;
		}

		bool bChanged = false;
		if (auto MergeError = It->second.MergeFrom(Fresh, bChanged); !MergeError.IsOk())
		{
			if (MergeError.Code == EHarvestError::RedundantStat)
			{
				spdlog::debug("Not updating server '{}': {}", Name, MergeError.ToString());
				++OutSummary.Redundant;
			}
			else
			{
				spdlog::warn("Could not update server '{}': {}", Name, MergeError.ToString());
				++OutSummary.Skipped;
			}
			continue;
		}

		if (bChanged)
		{
			MarkForUpsert(Name);
			++OutSummary.Updated;
		}
		else
		{
			++OutSummary.Unchanged;
		}
	}

	std::vector<std::string> StaleNames{};
	for (auto const& Name : Servers | std::views::keys)
	{
		if (!FreshNames.contains(Name))
		{
			StaleNames.push_back(Name);
		}
	}
	for (auto const& Name : StaleNames)
	{
		if (MarkForDeletion(Name))
		{
			++OutSummary.Removed;
		}
	}

	spdlog::info("Snapshot synced: {} rows, {} added, {} updated, {} unchanged, {} redundant, {} skipped, {} removed",
		Snapshot->Rows.size(), OutSummary.Added, OutSummary.Updated, OutSummary.Unchanged, OutSummary.Redundant,
		OutSummary.Skipped, OutSummary.Removed);
	return {};
}

bool HServerManager::MarkForDeletion(std::string const& Name)
{
	if (Servers.erase(Name) == 0)
	{
		spdlog::warn("Attempted to delete unknown server '{}'", Name);
		return false;
	}

	PendingUpserts.erase(Name);
	PendingDeletes.insert(Name);
	State = EManagerState::Dirty;
	spdlog::info("Server '{}' marked for deletion", Name);
	return true;
}

HError HServerManager::SaveChanges(IServerStore& Store)
{
	spdlog::info("Saving changes to the store...");

	for (auto const& Name : PendingUpserts)
	{
		auto It = Servers.find(Name);
		if (It == Servers.end())
		{
			continue;
		}
		if (auto Error = Store.Upsert(It->second); !Error.IsOk())
		{
			spdlog::error("Failed to upsert server '{}': {}", Name, Error.ToString());
			return Error;
		}
	}

	spdlog::info("  - Upserted {} servers", PendingUpserts.size());

	for (auto const& Name : PendingDeletes)
	{
		if (auto Error = Store.DeleteByName(Name); !Error.IsOk())
		{
			spdlog::error("Failed to delete server '{}': {}", Name, Error.ToString());
			return Error;
		}
	}
	spdlog::info("  - Deleted {} servers", PendingDeletes.size());

	PendingUpserts.clear();
	PendingDeletes.clear();
	State = EManagerState::Loaded;
	spdlog::info("Save complete");
	return {};
}

HServer const* HServerManager::GetServer(std::string const& Name) const
{
	if (auto const It = Servers.find(Name); It != Servers.end())
	{
		return &It->second;
	}
	return nullptr;
}
