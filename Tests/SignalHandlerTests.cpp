/*
 * Copyright (c) 2026, Alex <uni@vrsal.cc>
 * SPDX-License-Identifier: BSD-3-Clause
 */

#include <csignal>

#include <gtest/gtest.h>

#include "Util/SignalHandler.hpp"

TEST(SignalHandler, TermRequestsStop)
{
	HSignalHandler::bStop = false;
	HSignalHandler::Install();

	ASSERT_EQ(std::raise(SIGTERM), 0);
	EXPECT_TRUE(HSignalHandler::bStop);

	HSignalHandler::bStop = false;
	std::signal(SIGTERM, SIG_DFL);
	std::signal(SIGINT, SIG_DFL);
}
