/*
 * Copyright (c) 2026, Alex <uni@vrsal.cc>
 * SPDX-License-Identifier: BSD-3-Clause
 */

#pragma once
#include <cstdint>
#include <string>
#include <utility>

namespace EHarvestError
{
	enum Type : uint8_t
	{
		None = 0,
		Format,                     // malformed snapshot text
		SchemaMismatch,             // snapshot columns are not the expected set
		NameMismatch,               // merging configs of two different servers
		ConflictingId,              // both configs carry different surrogate ids
		ConflictingStatAtTimestamp, // two different stats claim the same instant
		RedundantStat,              // stat equals its chronological neighbour
		ConflictingTestAtTimestamp, // two different user tests claim the same instant
		Storage,
		Network,
		Config
	};

	inline char const* ToString(Type Code)
	{
		switch (Code)
		{
			case None:
				return "none";
			case Format:
				return "format error";
			case SchemaMismatch:
				return "schema mismatch";
			case NameMismatch:
				return "name mismatch";
			case ConflictingId:
				return "conflicting id";
			case ConflictingStatAtTimestamp:
				return "conflicting stat at timestamp";
			case RedundantStat:
				return "redundant stat";
			case ConflictingTestAtTimestamp:
				return "conflicting test at timestamp";
			case Storage:
				return "storage error";
			case Network:
				return "network error";
			case Config:
				return "config error";
		}
		return "unknown";
	}
} // namespace EHarvestError

struct [[nodiscard]] HError
{
	EHarvestError::Type Code{ EHarvestError::None };
	std::string         Message{};

	HError() = default;
	HError(EHarvestError::Type Code_, std::string Message_) : Code(Code_), Message(std::move(Message_)) {}

	[[nodiscard]] bool IsOk() const { return Code == EHarvestError::None; }

	[[nodiscard]] std::string ToString() const
	{
		if (Message.empty())
		{
			return EHarvestError::ToString(Code);
		}
		return std::string(EHarvestError::ToString(Code)) + ": " + Message;
	}
};
