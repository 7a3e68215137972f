#pragma once

static constexpr bool kEnableDebug = false;

static constexpr bool kShowThresholds = false && kEnableDebug;
static constexpr bool kShowMarkers = true && kEnableDebug;
