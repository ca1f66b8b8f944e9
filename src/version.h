// Copyright (C) 2004-2025 Robert Griebl
// SPDX-License-Identifier: GPL-3.0-only

#pragma once

#if !defined(BRICKHARVEST_MAJOR) || !defined(BRICKHARVEST_MINOR) || !defined(BRICKHARVEST_PATCH)
#  error "You forgot to define BRICKHARVEST_(MAJOR,MINOR,PATCH) before including version.h"
#endif

// stringification sucks :)
#define BH_STR(s)   BH_STR2(s)
#define BH_STR2(s)  #s

#define BRICKHARVEST_VERSION   BH_STR(BRICKHARVEST_MAJOR) "." BH_STR(BRICKHARVEST_MINOR) "." BH_STR(BRICKHARVEST_PATCH)
#define BRICKHARVEST_COPYRIGHT "2004-2025 Robert Griebl"
#define BRICKHARVEST_NAME      "BrickHarvest"
