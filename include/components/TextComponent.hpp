#pragma once
/** @file  TextComponent.hpp
 *  @brief Text label stimulus.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

namespace trialflow::components {

  /// Drawable text. Parameters: text, color, height, posX, posY.
  class TextComponent {
  public:
    static constexpr const char* kKindName = "text";
  };

} // namespace trialflow::components
