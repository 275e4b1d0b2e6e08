/*
 * Copyright (c) 2026, Alex <uni@vrsal.cc>
 * SPDX-License-Identifier: BSD-3-Clause
 */

#include "OvpnExporter.hpp"

#include <system_error>
#include <vector>
#include <spdlog/spdlog.h>

#include "Export/Base64.hpp"

namespace
{
	constexpr char const* kProfileExtension = ".ovpn";
} // namespace

bool HOvpnExporter::IsSafeFileName(std::string const& Name)
{
	if (Name.empty() || Name == "." || Name == "..")
	{
		return false;
	}
	return Name.find('/') == std::string::npos && Name.find('\\') == std::string::npos
		&& Name.find('\0') == std::string::npos;
}

std::size_t HOvpnExporter::Export(
	std::unordered_map<std::string, HServer> const& Servers, stdfs::path const& Dir, HError& OutError)
{
	OutError = {};

	std::string Error{};
	if (!HFilesystem::EnsureDirectory(Dir, Error))
	{
		OutError = HError(EHarvestError::Storage, Error);
		return 0;
	}

	std::size_t Written = 0;
	for (auto const& [Name, Server] : Servers)
	{
		if (!IsSafeFileName(Name))
		{
			spdlog::warn("Not exporting '{}': name is not usable as a file name", Name);
			continue;
		}

		if (Server.Config.ConfigBlob.empty())
		{
			spdlog::warn("Not exporting '{}': no OpenVPN profile", Name);
			continue;
		}

		auto Profile = HBase64::Decode(Server.Config.ConfigBlob);
		if (!Profile)
		{
			spdlog::warn("Not exporting '{}': OpenVPN profile is not valid base64", Name);
			continue;
		}

		if (!HFilesystem::ReplaceFile(Dir / (Name + kProfileExtension), *Profile, Error))
		{
			spdlog::error("Failed to export '{}': {}", Name, Error);
			OutError = HError(EHarvestError::Storage, Error);
			continue;
		}
		++Written;
	}

	spdlog::info("Exported {} of {} OpenVPN profiles to {}", Written, Servers.size(), Dir.string());

	HError RemoveError{};
	if (std::size_t const Removed = RemoveStale(Servers, Dir, RemoveError); Removed > 0)
	{
		spdlog::info("Removed {} stale OpenVPN profiles from {}", Removed, Dir.string());
	}
	if (OutError.IsOk() && !RemoveError.IsOk())
	{
		OutError = RemoveError;
	}
	return Written;
}

std::size_t HOvpnExporter::RemoveStale(
	std::unordered_map<std::string, HServer> const& Servers, stdfs::path const& Dir, HError& OutError)
{
	OutError = {};

	std::error_code          ec;
	std::vector<stdfs::path> Stale{};
	for (stdfs::directory_iterator It(Dir, ec), End; !ec && It != End; It.increment(ec))
	{
		auto const&     Path = It->path();
		std::error_code TypeError;
		if (Path.extension() == stdfs::path(kProfileExtension) && It->is_regular_file(TypeError)
			&& !Servers.contains(Path.stem().string()))
		{
			Stale.push_back(Path);
		}
	}
	if (ec)
	{
		OutError = HError(EHarvestError::Storage, "failed to list '" + Dir.string() + "': " + ec.message());
		return 0;
	}

	std::size_t Removed = 0;
	for (auto const& Path : Stale)
	{
		stdfs::remove(Path, ec);
		if (ec)
		{
			spdlog::error("Failed to remove stale profile '{}': {}", Path.string(), ec.message());
			OutError = HError(EHarvestError::Storage, "failed to remove '" + Path.string() + "': " + ec.message());
			continue;
		}
		++Removed;
	}
	return Removed;
}
