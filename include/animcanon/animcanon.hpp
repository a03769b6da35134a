#pragma once

// Umbrella header for the animcanon public API.

#include <animcanon/animatable.hpp>
#include <animcanon/canonicalization_cache.hpp>
#include <animcanon/canonicalizer.hpp>
#include <animcanon/color.hpp>
#include <animcanon/easing.hpp>
#include <animcanon/error.hpp>
#include <animcanon/fwd.hpp>
#include <animcanon/keyframe.hpp>
#include <animcanon/keyframe_optimizer.hpp>
#include <animcanon/logger.hpp>
#include <animcanon/math.hpp>
#include <animcanon/path_geometry.hpp>
#include <animcanon/sampling.hpp>
#include <animcanon/structural_equality.hpp>
#include <animcanon/trim.hpp>
