/* @file InputListenerComponent.cpp
 * @brief pointer polling, click validation and forced routine end
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <algorithm>
#include <cctype>

// TrialFlow headers
#include "components/Component.hpp"
#include "core/Errors.hpp"
#include "core/VariableEnvironment.hpp"
#include "io/ResponseDevice.hpp"

namespace trialflow::components {

  InputListenerComponent::InputListenerComponent(std::vector<std::string> clickable,
                                                 ForceEnd forceEnd)
      : clickable_(std::move(clickable)), forceEnd_(forceEnd) {}

  InputListenerComponent::ForceEnd InputListenerComponent::parseForceEnd(const std::string& text) {
    std::string key;
    for (char c : text) {
      if (!std::isspace(static_cast<unsigned char>(c)))
        key += static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }
    if (key == "anyclick" || key.empty())
      return ForceEnd::AnyClick;
    if (key == "validclick")
      return ForceEnd::ValidClick;
    if (key == "never")
      return ForceEnd::Never;
    throw core::ConfigurationError("unknown forceEndRoutineOnPress '" + text + "'");
  }

  void InputListenerComponent::onBegin(Component& self, FrameContext& ctx) {
    cursor_ = 0;
    numClicks_ = 0;
    clickedName_.clear();

    const std::string& n = self.name();
    ctx.env.set(n + ".numClicks", 0.0);
    ctx.env.set(n + ".clicked_name", std::string{});
  }

  void InputListenerComponent::onStart(Component&, FrameContext& ctx) {
    // presses made before the listener went live do not count
    if (ctx.pointer)
      ctx.pointer->clearResponses(ctx.runT);
    cursor_ = 0;
  }

  void InputListenerComponent::onFrame(Component& self, FrameContext& ctx) {
    if (!ctx.pointer)
      return;

    ctx.pointer->dispatchMessages(ctx.runT);
    const auto& responses = ctx.pointer->responses();
    cursor_ = std::min(cursor_, responses.size());

    const std::string& n = self.name();
    for (; cursor_ < responses.size(); ++cursor_) {
      const io::Response& r = responses[cursor_];
      std::string target = hitTarget(ctx, r.x, r.y);
      const bool valid = clickable_.empty() || !target.empty();

      ++numClicks_;
      ctx.env.set(n + ".numClicks", static_cast<double>(numClicks_));
      ctx.env.set(n + ".x", r.x);
      ctx.env.set(n + ".y", r.y);
      ctx.env.set(n + ".rt", r.t - (ctx.runT - ctx.t));
      if (!target.empty()) {
        clickedName_ = target;
        ctx.env.set(n + ".clicked_name", clickedName_);
      }

      if (forceEnd_ == ForceEnd::AnyClick || (forceEnd_ == ForceEnd::ValidClick && valid)) {
        ctx.routine.forceEnd();
        ++cursor_;
        break;
      }
    }
  }

  std::string InputListenerComponent::hitTarget(const FrameContext& ctx, double x, double y) const {
    for (const auto& name : clickable_) {
      const Component* c = ctx.routine.findComponent(name);
      // a shape later in the routine may go live on this tick but is ticked after us
      if (!c || !(c->live() || c->startsOnTick(ctx)))
        continue;
      if (const auto* shape = c->as<ShapeComponent>(); shape && shape->contains(*c, x, y))
        return name;
    }
    return {};
  }

} // namespace trialflow::components
