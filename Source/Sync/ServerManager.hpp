/*
 * Copyright (c) 2026, Alex <uni@vrsal.cc>
 * SPDX-License-Identifier: BSD-3-Clause
 */

#pragma once
#include <cstdint>
#include <set>
#include <string>
#include <string_view>
#include <unordered_map>

#include "HarvestError.hpp"
#include "Time.hpp"
#include "Types.hpp"
#include "Data/Server.hpp"
#include "Sync/IServerStore.hpp"

namespace EManagerState
{
	enum Type : uint8_t
	{
		Empty = 0, // nothing loaded or ingested yet
		Loaded,    // in sync with the store
		Dirty      // has changes the store hasn't seen
	};
} // namespace EManagerState

struct HSyncSummary
{
	uint32_t Added{ 0 };
	uint32_t Updated{ 0 };
	uint32_t Unchanged{ 0 };
	uint32_t Redundant{ 0 }; // rows whose stat repeated the previous one
	uint32_t Skipped{ 0 };   // rows rejected because of a merge error
	uint32_t Removed{ 0 };
};

// Owns the authoritative in-memory set of servers and tracks which of them
// have to be written to or deleted from the store.
// Not thread safe, callers serialize access to one instance.
class HServerManager
{
	std::unordered_map<std::string, HServer> Servers{};

	// mutually exclusive, cleared after every successful SaveChanges
	std::set<std::string> PendingUpserts{};
	std::set<std::string> PendingDeletes{};

	EManagerState::Type State{ EManagerState::Empty };

	void MarkForUpsert(std::string const& Name);

public:
	// Replaces all in-memory state with the store's content.
	// On a read error the previous state is kept and the error returned.
	HError ResetFromStore(IServerStore& Store);

	// Merges the feed into the in-memory set. Every row gets a stat at SavedAt.
	// Format and schema errors reject the whole snapshot, a row that fails to merge
	// only skips that server. Servers missing from the feed are marked for deletion.
	HError SyncFromSnapshot(std::string_view SnapshotText, HMsec SavedAt, HSyncSummary& OutSummary);
	HError SyncFromSnapshot(std::string_view SnapshotText, HMsec SavedAt = HTime::GetEpochMs())
	{
		HSyncSummary Summary{};
		return SyncFromSnapshot(SnapshotText, SavedAt, Summary);
	}

	// Writes pending upserts and deletes. The first store error is returned and
	// the pending sets are kept so the call can simply be repeated.
	HError SaveChanges(IServerStore& Store);

	// Drops the server from memory and remembers to delete it from the store
	bool MarkForDeletion(std::string const& Name);

	[[nodiscard]] HServer const* GetServer(std::string const& Name) const;

	[[nodiscard]] std::unordered_map<std::string, HServer> const& GetServers() const { return Servers; }

	[[nodiscard]] std::set<std::string> const& GetPendingUpserts() const { return PendingUpserts; }
	[[nodiscard]] std::set<std::string> const& GetPendingDeletes() const { return PendingDeletes; }

	[[nodiscard]] bool HasPendingChanges() const { return !PendingUpserts.empty() || !PendingDeletes.empty(); }

	[[nodiscard]] EManagerState::Type GetState() const { return State; }
};
