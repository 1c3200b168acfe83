//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Logger.cpp
// Purpose: Storage for the process-wide Logger state (level, file sink, sink mutex).
//==========================================================================================================

#include "logging/Logger.h"

// INFO until main() applies --log-level
LogLevel Logger::sLogLevel = LogLevel::LOG_INFO_LEVEL;
std::ofstream Logger::sLogFile;
std::mutex Logger::sLogMutex;
