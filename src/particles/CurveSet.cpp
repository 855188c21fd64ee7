/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "particles/CurveSet.hpp"
#include "core/Logger.hpp"
#include <format>
#include <utility>

namespace Ember {

ScalarCurveId CurveSet::addScalar(ScalarCurve curve) {
  m_scalars.push_back(std::move(curve));
  return ScalarCurveId{static_cast<uint32_t>(m_scalars.size() - 1)};
}

GradientId CurveSet::addGradient(ColorGradient gradient) {
  m_gradients.push_back(std::move(gradient));
  return GradientId{static_cast<uint32_t>(m_gradients.size() - 1)};
}

void CurveSet::validate() const {
  for (const auto &curve : m_scalars) {
    ScalarCurve::validate(curve.getKeyframes());
  }
  for (const auto &gradient : m_gradients) {
    ColorGradient::validate(gradient.getKeyframes());
  }
  CURVE_DEBUG(std::format("Validated curve set: {} scalar curves, {} gradients",
                          m_scalars.size(), m_gradients.size()));
}

} // namespace Ember
