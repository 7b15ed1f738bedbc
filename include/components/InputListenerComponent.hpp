#pragma once
/** @file  InputListenerComponent.hpp
 *  @brief Pointer listener that records clicks and may end the routine.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

#include <cstddef>
#include <string>
#include <vector>

namespace trialflow::components {

  class Component;
  struct FrameContext;

  /**
 * @class InputListenerComponent
 * @brief Polls the pointer device once per tick while live.
 *
 *  * A click is *valid* when it lands on one of the `clickable` shapes (or,
 *    with no clickable list, any click is valid).
 *  * Publishes `<name>.numClicks`, `<name>.clicked_name`, `<name>.x`,
 *    `<name>.y` and `<name>.rt` as run-lifetime variables.
 */
  class InputListenerComponent {
  public:
    static constexpr const char* kKindName = "listener";

    enum class ForceEnd { AnyClick, ValidClick, Never };

    InputListenerComponent(std::vector<std::string> clickable, ForceEnd forceEnd);

    void onBegin(Component& self, FrameContext& ctx);
    void onStart(Component& self, FrameContext& ctx);
    void onFrame(Component& self, FrameContext& ctx);

    int numClicks() const noexcept { return numClicks_; }
    const std::string& clickedName() const noexcept { return clickedName_; }
    ForceEnd forceEnd() const noexcept { return forceEnd_; }
    const std::vector<std::string>& clickable() const noexcept { return clickable_; }

    static ForceEnd parseForceEnd(const std::string& text);

  private:
    std::string hitTarget(const FrameContext& ctx, double x, double y) const;

    std::vector<std::string> clickable_;
    ForceEnd forceEnd_;
    std::size_t cursor_{ 0 }; ///< first unread entry of device responses
    int numClicks_{ 0 };
    std::string clickedName_;
  };

} // namespace trialflow::components
