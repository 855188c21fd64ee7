/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef COLOR_UTILS_HPP
#define COLOR_UTILS_HPP

#include <SDL3/SDL.h>
#include <cmath>
#include <cstdint>

namespace Ember {

// Particle colors are SDL float colors in the 0..1 range
inline SDL_FColor lerpColor(const SDL_FColor &a, const SDL_FColor &b,
                            float t) {
  return SDL_FColor{a.r + (b.r - a.r) * t, a.g + (b.g - a.g) * t,
                    a.b + (b.b - a.b) * t, a.a + (b.a - a.a) * t};
}

// Unpacks 0xRRGGBBAA, the packing the engine's effect tables use
inline SDL_FColor colorFromRGBA(uint32_t rgba) {
  return SDL_FColor{((rgba >> 24) & 0xFF) / 255.0f,
                    ((rgba >> 16) & 0xFF) / 255.0f,
                    ((rgba >> 8) & 0xFF) / 255.0f, (rgba & 0xFF) / 255.0f};
}

inline bool colorsEqual(const SDL_FColor &a, const SDL_FColor &b) {
  return a.r == b.r && a.g == b.g && a.b == b.b && a.a == b.a;
}

inline bool isFiniteColor(const SDL_FColor &c) {
  return std::isfinite(c.r) && std::isfinite(c.g) && std::isfinite(c.b) &&
         std::isfinite(c.a);
}

} // namespace Ember

#endif // COLOR_UTILS_HPP
