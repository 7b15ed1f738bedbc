#pragma once
/** @file  Component.hpp
 *  @brief One live instance of a routine component: timing, parameters and hooks.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

#include <map>
#include <memory>
#include <string>
#include <variant>

#include "components/CodeComponent.hpp"
#include "components/ComponentTypes.hpp"
#include "components/InputListenerComponent.hpp"
#include "components/ProgressComponent.hpp"
#include "components/ShapeComponent.hpp"
#include "components/TextComponent.hpp"

namespace trialflow::components {

  /// Closed set of component variants; index order matches `Kind`.
  using Behavior = std::variant<ShapeComponent, TextComponent, ProgressComponent,
                                InputListenerComponent, CodeComponent>;

  enum class Kind { Shape, Text, Progress, Listener, Code };

  /**
 * @class Component
 * @brief Shared capability interface over the `Behavior` variants.
 *
 *  * Each variant implements only the hooks it needs (`onBegin`, `onStart`,
 *    `onFrame`, `onStop`, `onEnd`, `draw`); absent hooks are no-ops.
 *  * Constant and set-every-repeat parameters resolve once in `begin()`;
 *    set-every-frame parameters resolve once per tick while live.
 *  * Copyable: routine definitions hold prototypes, activations copy them.
 */
  class Component {
  public:
    Component(std::shared_ptr<const ComponentSpec> spec, Behavior behavior);

    const std::string& name() const noexcept { return spec_->name; }
    const ComponentSpec& spec() const noexcept { return *spec_; }
    Kind kind() const noexcept { return static_cast<Kind>(behavior_.index()); }
    unsigned capabilities() const noexcept;
    bool has(Capability c) const noexcept { return (capabilities() & c) != 0; }

    /// Untimed components (code) ignore start/stop and never keep a routine alive.
    bool timed() const noexcept { return kind() != Kind::Code; }

    Status status() const noexcept { return status_; }
    bool live() const noexcept { return status_ == Status::Started; }

    /// Not yet started but due to start on the tick described by \p ctx.
    bool startsOnTick(const FrameContext& ctx) const;

    //---lifecycle, driven by RoutineActivation---------------------------
    void begin(FrameContext& ctx);
    void tick(FrameContext& ctx);
    void end(FrameContext& ctx);

    /// True while this component still needs frames (live, or pending a start).
    bool keepsRoutineAlive() const noexcept;

    //---resolved state---------------------------------------------------
    const core::Value* param(const std::string& name) const;
    double numberParam(const std::string& name, double fallback) const;
    const std::map<std::string, core::Value>& params() const noexcept { return resolved_; }

    /// How many times \p param was evaluated during this activation.
    std::size_t resolutionCount(const std::string& param) const;

    double tStart() const noexcept { return tStart_; }
    double tStop() const noexcept { return tStop_; }
    std::uint64_t frameNStart() const noexcept { return frameNStart_; }

    template <typename T> T* as() noexcept { return std::get_if<T>(&behavior_); }
    template <typename T> const T* as() const noexcept { return std::get_if<T>(&behavior_); }

    /// Kind name sent to the frame sink.
    const char* kindName() const noexcept;

  private:
    void resolve(const ParameterSpec& p, const core::VariableEnvironment& env);
    core::Value evaluate(const core::CompiledExpression& expr,
                         const core::VariableEnvironment& env) const;
    bool startDue(const FrameContext& ctx) const;
    bool stopDue(const FrameContext& ctx) const;
    void draw(FrameContext& ctx);

    std::shared_ptr<const ComponentSpec> spec_;
    Behavior behavior_;

    Status status_{ Status::NotStarted };
    std::map<std::string, core::Value> resolved_;
    std::map<std::string, std::size_t> resolutions_;
    double startValue_{ 0.0 };
    double stopValue_{ 0.0 };
    double tStart_{ -1.0 };
    double tStop_{ -1.0 };
    std::uint64_t frameNStart_{ 0 };
  };

} // namespace trialflow::components
