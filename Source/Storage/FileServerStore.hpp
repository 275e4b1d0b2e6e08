/*
 * Copyright (c) 2026, Alex <uni@vrsal.cc>
 * SPDX-License-Identifier: BSD-3-Clause
 */

#pragma once
#include <cstdint>
#include <map>
#include <string>

#include "Filesystem.hpp"
#include "Types.hpp"
#include "Sync/IServerStore.hpp"

struct HStoreHeader
{
	uint32_t Magic{};   // "HVST"
	uint16_t Version{};
	HRecordId NextConfigId{ 1 };
	HRecordId NextStatId{ 1 };
	HRecordId NextTestId{ 1 };

	template <class Archive>
	void serialize(Archive& archive)
	{
		archive(Magic, Version, NextConfigId, NextStatId, NextTestId);
	}
};

// Keeps every server in memory and writes the whole store to a single
// cereal binary file on each change. A change is only visible in memory
// once the file has been replaced successfully.
class HFileServerStore final : public IServerStore
{
	using HServerMap = std::map<std::string, HServer>;

	stdfs::path  Path;
	HStoreHeader Header{};
	HServerMap   Servers{};
	bool         bOpen{ false };

	static HError Load(stdfs::path const& Path, HStoreHeader& OutHeader, HServerMap& OutServers);
	static HError Write(stdfs::path const& Path, HStoreHeader const& Header, HServerMap const& Servers);

	HError Flush() const { return Write(Path, Header, Servers); }

public:
	explicit HFileServerStore(stdfs::path Path_);

	// Writes an empty store at Path, replacing whatever is there
	static HError CreateEmpty(stdfs::path const& Path);

	// Loads the store, an empty one is created if the file doesn't exist yet
	HError Open();

	// True if the file on disk is a readable store of the current version
	[[nodiscard]] bool CheckStore() const;

	[[nodiscard]] bool IsOpen() const { return bOpen; }

	[[nodiscard]] std::size_t GetSize() const { return Servers.size(); }

	[[nodiscard]] stdfs::path const& GetPath() const { return Path; }

	HError ReadAll(std::vector<HServer>& OutServers) override;
	HError ReadByName(std::string const& Name, std::optional<HServer>& OutServer) override;
	HError Upsert(HServer& Server) override;
	HError DeleteByName(std::string const& Name) override;
};
