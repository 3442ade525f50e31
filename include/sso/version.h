//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: version.h
// Purpose: Public version API for the SSO server library (semantic version helpers).
//==========================================================================================================
#pragma once

#include <string>

namespace sso {

//==========================================================================================================
// VersionInfo
// Purpose: Semantic version components.
//==========================================================================================================
struct VersionInfo {
    int major;
    int minor;
    int patch;
};

// Returns the library semantic version components.
VersionInfo getVersion();

// Returns the semantic version string formatted as "MAJOR.MINOR.PATCH".
std::string getVersionString();

} // namespace sso
