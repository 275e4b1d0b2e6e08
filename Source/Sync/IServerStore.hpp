/*
 * Copyright (c) 2026, Alex <uni@vrsal.cc>
 * SPDX-License-Identifier: BSD-3-Clause
 */

#pragma once
#include <optional>
#include <string>
#include <vector>

#include "HarvestError.hpp"
#include "Data/Server.hpp"

// Durable storage of server aggregates.
// Implementations own name uniqueness and the link between a server and its stats and tests.
class IServerStore
{
public:
	IServerStore() = default;
	virtual ~IServerStore() = default;

	// Every stored server with config, stats and tests, ids populated
	virtual HError ReadAll(std::vector<HServer>& OutServers) = 0;

	// OutServer is left empty when no server has that name
	virtual HError ReadByName(std::string const& Name, std::optional<HServer>& OutServer) = 0;

	// Inserts the config if it has no id yet, updates it by id otherwise.
	// Stats and tests without an id are inserted, the rest is left alone.
	// Assigned ids are written back into Server. All or nothing per server.
	virtual HError Upsert(HServer& Server) = 0;

	// Removes the server together with its stats and tests
	virtual HError DeleteByName(std::string const& Name) = 0;
};
