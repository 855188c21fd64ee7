/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef CURVE_SET_HPP
#define CURVE_SET_HPP

#include "particles/Curve.hpp"
#include <cstdint>
#include <vector>

namespace Ember {

// Handles into a CurveSet. Typed so a gradient id cannot be used as a scalar
// curve id.
struct ScalarCurveId {
  uint32_t index{INVALID};
  static constexpr uint32_t INVALID = 0xFFFFFFFFu;
  bool isValid() const { return index != INVALID; }
  bool operator==(const ScalarCurveId &) const = default;
};

struct GradientId {
  uint32_t index{GradientId::INVALID};
  static constexpr uint32_t INVALID = 0xFFFFFFFFu;
  bool isValid() const { return index != INVALID; }
  bool operator==(const GradientId &) const = default;
};

/**
 * @brief The curves a ParticleSystem's modifiers and emitter sample from
 *
 * Curves are added while the host assembles a configuration; the system takes
 * the set by value and checks every handle its modifiers and emitter use.
 */
class CurveSet {
public:
  CurveSet() = default;

  ScalarCurveId addScalar(ScalarCurve curve);
  GradientId addGradient(ColorGradient gradient);

  bool contains(ScalarCurveId id) const {
    return id.isValid() && id.index < m_scalars.size();
  }
  bool contains(GradientId id) const {
    return id.isValid() && id.index < m_gradients.size();
  }

  /**
   * @brief Resolves a handle; the handle must satisfy contains()
   */
  const ScalarCurve &scalar(ScalarCurveId id) const {
    return m_scalars[id.index];
  }
  const ColorGradient &gradient(GradientId id) const {
    return m_gradients[id.index];
  }

  size_t scalarCount() const { return m_scalars.size(); }
  size_t gradientCount() const { return m_gradients.size(); }

  /**
   * @brief Re-runs keyframe validation on every curve
   * @throws ConfigError on the first invalid curve
   */
  void validate() const;

private:
  std::vector<ScalarCurve> m_scalars;
  std::vector<ColorGradient> m_gradients;
};

} // namespace Ember

#endif // CURVE_SET_HPP
