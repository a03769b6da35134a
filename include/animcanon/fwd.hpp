#pragma once

namespace animcanon
{

struct Vector2;
struct Vector3;
struct Color;
struct Easing;
struct BezierSegment;
struct PathGeometry;

template <typename T>
struct Keyframe;
template <typename T>
class Animatable;

template <typename T>
class OptimizedKeyframes;
template <typename T>
class TrimmedKeyframes;
template <typename T>
class CanonicalizationCache;

class Canonicalizer;
struct CanonicalizerConfig;
struct CanonicalizerStats;

class Logger;
class InvariantViolation;

}   // namespace animcanon
