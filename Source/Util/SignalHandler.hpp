//
// Created by usr on 09/10/2025.
//

#pragma once

#include <atomic>

class HSignalHandler
{
public:
	// Routes SIGINT and SIGTERM to bStop
	static void Install();

	static inline std::atomic<bool> bStop{ false };
};
