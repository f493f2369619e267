#pragma once

// Build/version info.
//
// CMake defines SUNNYDAYS_VERSION to the project version string.
// If you build without CMake, it falls back to "dev".

#ifndef SUNNYDAYS_VERSION
#define SUNNYDAYS_VERSION "dev"
#endif

#ifndef SUNNYDAYS_APPNAME
#define SUNNYDAYS_APPNAME "SunnyDays"
#endif
