#pragma once

#include <string>

const char* const kDefaultConfigPath = "/etc/diskchain/diskchain.json";

void printServeUsage();
void printChainUsage();

// Runs the orchestrator daemon until SIGINT/SIGTERM
int serveMain(int argc, char* argv[]);

// Offline chain inspection and maintenance against the catalog
int chainMain(int argc, char* argv[]);
