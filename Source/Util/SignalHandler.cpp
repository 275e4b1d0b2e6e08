//
// Created by usr on 09/10/2025.
//

#include "SignalHandler.hpp"

#include <csignal>

static void OnStopSignal(int)
{
	HSignalHandler::bStop = true;
}

void HSignalHandler::Install()
{
	signal(SIGINT, OnStopSignal);
	signal(SIGTERM, OnStopSignal);
}
