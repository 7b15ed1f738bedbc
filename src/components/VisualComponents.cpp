/* @file VisualComponents.cpp
 * @brief shape hit-testing and progress-bar drawing
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <algorithm>
#include <cmath>

// TrialFlow headers
#include "components/Component.hpp"
#include "io/FrameSink.hpp"

namespace trialflow::components {

  bool ShapeComponent::contains(const Component& self, double x, double y) const {
    const double cx = self.numberParam("posX", 0.0);
    const double cy = self.numberParam("posY", 0.0);
    const double halfW = std::fabs(self.numberParam("width", 0.5)) / 2.0;
    const double halfH = std::fabs(self.numberParam("height", 0.5)) / 2.0;
    return x >= cx - halfW && x <= cx + halfW && y >= cy - halfH && y <= cy + halfH;
  }

  double ProgressComponent::fraction(const Component& self) const {
    const double p = self.numberParam("progress", 0.0);
    if (std::isnan(p))
      return 0.0;
    return std::clamp(p, 0.0, 1.0);
  }

  void ProgressComponent::draw(const Component& self, FrameContext& ctx) const {
    io::DrawCommand cmd{ self.name(), kKindName, self.params() };
    cmd.params.insert_or_assign("progress", core::Value{ fraction(self) });
    ctx.sink->draw(cmd);
  }

} // namespace trialflow::components
