/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef CURVE_HPP
#define CURVE_HPP

/**
 * @file Curve.hpp
 * @brief Keyframed functions of normalized particle age
 *
 * A Curve maps normalized progress t in [0,1] to a value by interpolating
 * between keyframes. Scalar curves drive size, opacity and force strength,
 * color gradients drive color over life. Curves are validated once and are
 * immutable afterwards, so they can be shared read-only between systems.
 *
 * Lookup is a linear scan over an inline keyframe buffer. Particle curves
 * hold a handful of keys, for which the scan beats a binary search and keeps
 * the keys in the same cache line as the curve.
 */

#include <SDL3/SDL.h>
#include <boost/container/small_vector.hpp>
#include <cstddef>
#include <cstdint>
#include <initializer_list>

namespace Ember {

enum class CurveInterpolation : uint8_t {
  Linear = 0,    // Straight line between keyframes (default)
  Step = 1,      // Hold the previous keyframe value
  SmoothStep = 2 // Hermite ease between keyframes, no overshoot
};

template <typename T> struct Keyframe {
  float time; // Normalized time in [0,1]
  T value;
};

template <typename T> class Curve {
public:
  static constexpr size_t INLINE_KEYFRAMES = 8;
  using KeyframeList =
      boost::container::small_vector<Keyframe<T>, INLINE_KEYFRAMES>;

  /**
   * @brief Builds a curve from keyframes
   * @throws ConfigError if the list is empty, times are not strictly
   * increasing, or a time is non-finite or outside [0,1]
   */
  Curve(std::initializer_list<Keyframe<T>> keyframes,
        CurveInterpolation interpolation = CurveInterpolation::Linear);
  explicit Curve(KeyframeList keyframes,
                 CurveInterpolation interpolation = CurveInterpolation::Linear);

  /**
   * @brief Single-key curve that evaluates to value everywhere
   */
  static Curve constant(const T &value);

  /**
   * @brief Samples the curve; t is clamped to [0,1] (NaN reads as 0)
   */
  T evaluate(float t) const;

  const KeyframeList &getKeyframes() const { return m_keyframes; }
  CurveInterpolation getInterpolation() const { return m_interpolation; }
  size_t getKeyframeCount() const { return m_keyframes.size(); }

  /**
   * @brief Checks keyframe ordering and range
   * @throws ConfigError describing the first violation found
   */
  static void validate(const KeyframeList &keyframes);

private:
  KeyframeList m_keyframes;
  CurveInterpolation m_interpolation;
};

using ScalarCurve = Curve<float>;
using ColorGradient = Curve<SDL_FColor>;

extern template class Curve<float>;
extern template class Curve<SDL_FColor>;

} // namespace Ember

#endif // CURVE_HPP
