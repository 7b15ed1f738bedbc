#pragma once
/** @file  ShapeComponent.hpp
 *  @brief Rectangular visual stimulus; the only hit-testable variant.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

namespace trialflow::components {

  class Component;

  /**
 * @class ShapeComponent
 * @brief Drawable rectangle centred on (posX, posY) with size width × height.
 *
 *  Parameters: posX, posY, width, height, fillColor, opacity.
 */
  class ShapeComponent {
  public:
    static constexpr const char* kKindName = "shape";

    /// Hit test against the geometry resolved for the current tick.
    bool contains(const Component& self, double x, double y) const;
  };

} // namespace trialflow::components
