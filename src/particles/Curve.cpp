/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "particles/Curve.hpp"
#include "core/Logger.hpp"
#include "particles/ParticleErrors.hpp"
#include "utils/ColorUtils.hpp"
#include <cmath>
#include <format>
#include <utility>

namespace Ember {

namespace {

inline float mixValue(float a, float b, float u) { return a + (b - a) * u; }

inline SDL_FColor mixValue(const SDL_FColor &a, const SDL_FColor &b,
                           float u) {
  return lerpColor(a, b, u);
}

inline bool isFiniteValue(float value) { return std::isfinite(value); }
inline bool isFiniteValue(const SDL_FColor &value) {
  return isFiniteColor(value);
}

} // namespace

template <typename T>
Curve<T>::Curve(std::initializer_list<Keyframe<T>> keyframes,
                CurveInterpolation interpolation)
    : m_keyframes(keyframes.begin(), keyframes.end()),
      m_interpolation(interpolation) {
  validate(m_keyframes);
}

template <typename T>
Curve<T>::Curve(KeyframeList keyframes, CurveInterpolation interpolation)
    : m_keyframes(std::move(keyframes)), m_interpolation(interpolation) {
  validate(m_keyframes);
}

template <typename T> Curve<T> Curve<T>::constant(const T &value) {
  return Curve<T>({Keyframe<T>{0.0f, value}});
}

template <typename T> void Curve<T>::validate(const KeyframeList &keyframes) {
  if (keyframes.empty()) {
    CURVE_ERROR("Rejected curve with no keyframes");
    throw ConfigError("Curve requires at least one keyframe");
  }

  for (size_t i = 0; i < keyframes.size(); ++i) {
    const float time = keyframes[i].time;
    if (!std::isfinite(time) || time < 0.0f || time > 1.0f) {
      throw ConfigError(std::format(
          "Curve keyframe {} has time {} outside [0, 1]", i, time));
    }
    if (i > 0 && !(time > keyframes[i - 1].time)) {
      throw ConfigError(std::format(
          "Curve keyframe times must be strictly increasing: key {} at {} "
          "follows key {} at {}",
          i, time, i - 1, keyframes[i - 1].time));
    }
    if (!isFiniteValue(keyframes[i].value)) {
      CURVE_ERROR(std::format("Rejected non-finite value at keyframe {}", i));
      throw ConfigError(
          std::format("Curve keyframe {} has a non-finite value", i));
    }
  }
}

template <typename T> T Curve<T>::evaluate(float t) const {
  // NaN fails every comparison and lands on the first key
  if (!(t > 0.0f)) {
    t = 0.0f;
  } else if (t > 1.0f) {
    t = 1.0f;
  }

  const auto &front = m_keyframes.front();
  const auto &back = m_keyframes.back();
  if (t <= front.time) {
    return front.value;
  }
  if (t >= back.time) {
    return back.value;
  }

  // front.time < t < back.time, so a bracketing pair always exists
  size_t i = 1;
  while (m_keyframes[i].time <= t) {
    ++i;
  }
  const auto &k0 = m_keyframes[i - 1];
  const auto &k1 = m_keyframes[i];

  float u = (t - k0.time) / (k1.time - k0.time);
  switch (m_interpolation) {
  case CurveInterpolation::Step:
    return k0.value;
  case CurveInterpolation::SmoothStep:
    u = u * u * (3.0f - 2.0f * u);
    break;
  case CurveInterpolation::Linear:
  default:
    break;
  }
  return mixValue(k0.value, k1.value, u);
}

template class Curve<float>;
template class Curve<SDL_FColor>;

} // namespace Ember
