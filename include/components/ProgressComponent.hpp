#pragma once
/** @file  ProgressComponent.hpp
 *  @brief Progress bar whose fill is usually bound to loop counters.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

namespace trialflow::components {

  class Component;
  struct FrameContext;

  /**
 * @class ProgressComponent
 * @brief Drawable bar. `progress` is clamped into [0, 1] before drawing,
 *        e.g. `trials.thisN / trials.nTotal`.
 */
  class ProgressComponent {
  public:
    static constexpr const char* kKindName = "progress";

    void draw(const Component& self, FrameContext& ctx) const;

    /// Clamped fill ratio for the current tick (0 if unresolved).
    double fraction(const Component& self) const;
  };

} // namespace trialflow::components
