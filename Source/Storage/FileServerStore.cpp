/*
 * Copyright (c) 2026, Alex <uni@vrsal.cc>
 * SPDX-License-Identifier: BSD-3-Clause
 */

#include "FileServerStore.hpp"

#include <ranges>
#include <sstream>
#include <cereal/archives/binary.hpp>
#include <cereal/types/array.hpp>
#include <cereal/types/map.hpp>
#include <cereal/types/optional.hpp>
#include <cereal/types/string.hpp>
#include <spdlog/spdlog.h>

namespace
{
	constexpr uint32_t kStoreMagic = 0x54535648; // "HVST" on little endian hosts, cereal writes native byte order
	constexpr uint16_t kStoreVersion = 1;
} // namespace

HFileServerStore::HFileServerStore(stdfs::path Path_) : Path(std::move(Path_)) {}

HError HFileServerStore::Load(stdfs::path const& Path, HStoreHeader& OutHeader, HServerMap& OutServers)
{
	std::string Data{};
	std::string Error{};
	if (!HFilesystem::ReadFile(Path, Data, Error))
	{
		return { EHarvestError::Storage, Error };
	}

	try
	{
		std::istringstream          ss(Data);
		cereal::BinaryInputArchive iar(ss);
		iar(OutHeader);
		if (OutHeader.Magic != kStoreMagic)
		{
			return { EHarvestError::Storage, fmt::format("'{}' is not a server store", Path.string()) };
		}
		if (OutHeader.Version != kStoreVersion)
		{
			return { EHarvestError::Storage,
				fmt::format("'{}' has version {}, expected {}", Path.string(), OutHeader.Version, kStoreVersion) };
		}
		iar(OutServers);
	}
	catch (std::exception const& e)
	{
		return { EHarvestError::Storage, fmt::format("failed to read '{}': {}", Path.string(), e.what()) };
	}
	return {};
}

HError HFileServerStore::Write(stdfs::path const& Path, HStoreHeader const& Header, HServerMap const& Servers)
{
	std::ostringstream ss;
	try
	{
		cereal::BinaryOutputArchive oar(ss);
		oar(Header, Servers);
	}
	catch (std::exception const& e)
	{
		return { EHarvestError::Storage, fmt::format("failed to serialize store: {}", e.what()) };
	}

	std::string Error{};
	if (!HFilesystem::ReplaceFile(Path, ss.str(), Error))
	{
		return { EHarvestError::Storage, Error };
	}
	return {};
}

HError HFileServerStore::CreateEmpty(stdfs::path const& Path)
{
	HStoreHeader EmptyHeader{};
	EmptyHeader.Magic = kStoreMagic;
	EmptyHeader.Version = kStoreVersion;
	return Write(Path, EmptyHeader, {});
}

HError HFileServerStore::Open()
{
	if (!HFilesystem::Exists(Path))
	{
		spdlog::info("No store at '{}', creating an empty one", Path.string());
		if (auto Error = CreateEmpty(Path); !Error.IsOk())
		{
			return Error;
		}
	}

	HStoreHeader LoadedHeader{};
	HServerMap   LoadedServers{};
	if (auto Error = Load(Path, LoadedHeader, LoadedServers); !Error.IsOk())
	{
		return Error;
	}

	Header = LoadedHeader;
	Servers = std::move(LoadedServers);
	bOpen = true;
	spdlog::debug("Opened store '{}' with {} servers", Path.string(), Servers.size());
	return {};
}

bool HFileServerStore::CheckStore() const
{
	HStoreHeader DiskHeader{};
	HServerMap   DiskServers{};
	auto const   Error = Load(Path, DiskHeader, DiskServers);
	if (!Error.IsOk())
	{
		spdlog::debug("Store check failed: {}", Error.ToString());
		return false;
	}
	return true;
}

HError HFileServerStore::ReadAll(std::vector<HServer>& OutServers)
{
	if (!bOpen)
	{
		return { EHarvestError::Storage, "store is not open" };
	}

	OutServers.clear();
	OutServers.reserve(Servers.size());
	for (auto const& Server : Servers | std::views::values)
	{
		OutServers.push_back(Server);
	}
	return {};
}

HError HFileServerStore::ReadByName(std::string const& Name, std::optional<HServer>& OutServer)
{
	if (!bOpen)
	{
		return { EHarvestError::Storage, "store is not open" };
	}

	OutServer.reset();
	if (auto const It = Servers.find(Name); It != Servers.end())
	{
		OutServer = It->second;
	}
	return {};
}

HError HFileServerStore::Upsert(HServer& Server)
{
	if (!bOpen)
	{
		return { EHarvestError::Storage, "store is not open" };
	}

	auto const& Name = Server.GetName();
	if (Name.empty())
	{
		return { EHarvestError::Storage, "can't store a server without a name" };
	}

	HStoreHeader const     HeaderBackup = Header;
	std::optional<HServer> StoredBackup{};
	if (auto const It = Servers.find(Name); It != Servers.end())
	{
		StoredBackup = It->second;
	}

	// Ids are assigned on a copy, the caller only sees them once the file is written
	HServer Working = Server;
	HServer Stored{};

	if (!Working.Config.Id)
	{
		// a new server, or one that was deleted and came back: either way it starts over
		Working.Config.Id = Header.NextConfigId++;
		Stored.Config = Working.Config;
	}
	else
	{
		if (!StoredBackup)
		{
			return { EHarvestError::Storage, fmt::format("no stored server '{}' with id {}", Name, *Working.Config.Id) };
		}
		if (StoredBackup->Config.Id != Working.Config.Id)
		{
			return { EHarvestError::Storage,
				fmt::format("server '{}' is stored under id {}, not {}", Name, StoredBackup->Config.Id.value_or(0),
					*Working.Config.Id) };
		}
		Stored = *StoredBackup;
		Stored.Config = Working.Config;
	}

	for (auto& Stat : Working.Stats | std::views::values)
	{
		if (!Stat.Id)
		{
			Stat.Id = Header.NextStatId++;
			Stored.Stats.insert_or_assign(Stat.SavedAt, Stat);
		}
	}
	for (auto& Test : Working.Tests | std::views::values)
	{
		if (!Test.Id)
		{
			Test.Id = Header.NextTestId++;
			Stored.Tests.insert_or_assign(Test.SavedAt, Test);
		}
	}

	Servers.insert_or_assign(Name, std::move(Stored));

	if (auto Error = Flush(); !Error.IsOk())
	{
		Header = HeaderBackup;
		if (StoredBackup)
		{
			Servers.insert_or_assign(Name, std::move(*StoredBackup));
		}
		else
		{
			Servers.erase(Name);
		}
		return Error;
	}

	Server = std::move(Working);
	return {};
}

HError HFileServerStore::DeleteByName(std::string const& Name)
{
	if (!bOpen)
	{
		return { EHarvestError::Storage, "store is not open" };
	}

	auto Node = Servers.extract(Name);
	if (Node.empty())
	{
		return {};
	}

	if (auto Error = Flush(); !Error.IsOk())
	{
		Servers.insert(std::move(Node));
		return Error;
	}
	return {};
}
