/*
 * Copyright (c) 2026, Alex <uni@vrsal.cc>
 * SPDX-License-Identifier: BSD-3-Clause
 */

#pragma once
#include <chrono>
#include <ctime>
#include <string>
#include <spdlog/fmt/fmt.h>

#include "Types.hpp"

#pragma GCC diagnostic push
#pragma GCC diagnostic ignored "-Wunused-function"

namespace HTime
{
	static HMsec GetEpochMs()
	{
		return std::chrono::duration_cast<std::chrono::milliseconds>(
			std::chrono::system_clock::now().time_since_epoch())
			.count();
	}

	// UTC, e.g. 2025-11-16T08:30:00.250Z
	static std::string FormatEpochMs(HMsec Time)
	{
		std::time_t const Seconds = static_cast<std::time_t>(Time / 1000);
		std::tm           Tm{};
		gmtime_r(&Seconds, &Tm);
		return fmt::format("{:04}-{:02}-{:02}T{:02}:{:02}:{:02}.{:03}Z", Tm.tm_year + 1900, Tm.tm_mon + 1, Tm.tm_mday,
			Tm.tm_hour, Tm.tm_min, Tm.tm_sec, static_cast<int>(Time % 1000));
	}
} // namespace HTime

#pragma GCC diagnostic pop
