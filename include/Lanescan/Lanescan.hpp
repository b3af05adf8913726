#pragma once

// Lanescan - immutable SIMD scan maps for small, fixed string key sets
// This header includes all Lanescan headers in the correct dependency order

// Core headers - fundamental types and utilities
#include "Platform/Platform.hpp"
#include "Core/Base.hpp"
#include "Core/Config.hpp"
#include "Core/Error.hpp"
#include "Core/Result.hpp"
#include "Core/Profile.hpp"
#include "Platform/Simd.hpp"

// Build phase
#include "Selector/KeyBytes.hpp"
#include "Selector/PositionSelector.hpp"
#include "Layout/TestPlane.hpp"
#include "Layout/ScanStrategy.hpp"
#include "Layout/LaneLayout.hpp"

// Container
#include "Container/PerfectScanMap.hpp"
