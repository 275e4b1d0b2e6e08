/*
 * Copyright (c) 2026, Alex <uni@vrsal.cc>
 * SPDX-License-Identifier: BSD-3-Clause
 */

#pragma once
#include <cstddef>
#include <string>
#include <unordered_map>

#include "Filesystem.hpp"
#include "HarvestError.hpp"
#include "Data/Server.hpp"

// Writes the OpenVPN profile of every server as <Dir>/<HostName>.ovpn
class HOvpnExporter
{
public:
	// Returns the number of profiles written. Servers without a usable profile are skipped,
	// OutError is only set when a file or the directory couldn't be written.
	// Profiles in Dir that belong to none of Servers are removed afterwards.
	static std::size_t Export(
		std::unordered_map<std::string, HServer> const& Servers, stdfs::path const& Dir, HError& OutError);

	// Deletes every .ovpn file in Dir whose name is not a key of Servers, returns how many went
	static std::size_t RemoveStale(
		std::unordered_map<std::string, HServer> const& Servers, stdfs::path const& Dir, HError& OutError);

	// Host names end up as file names, anything that could leave Dir is rejected
	[[nodiscard]] static bool IsSafeFileName(std::string const& Name);
};
