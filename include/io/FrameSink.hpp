#pragma once
/** @file  FrameSink.hpp
 *  @brief Receiver of per-tick draw commands (renderer lives outside the engine).
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

#include <cstdint>
#include <map>
#include <string>

#include "core/Value.hpp"
#include "io/FrameDriver.hpp"

namespace trialflow {
  namespace io {

    /// Snapshot of one live drawable component for the current tick.
    struct DrawCommand {
      std::string component;
      std::string kind; ///< "shape", "text", "progress"
      std::map<std::string, core::Value> params;
    };

    /**
 * @class FrameSink
 * @brief Abstract renderer hook: `draw()` per live drawable, then one `flip()`.
 */
    class FrameSink {
    public:
      virtual ~FrameSink() = default;

      virtual void draw(const DrawCommand& cmd) = 0;
      virtual void flip(const FrameTick& tick) = 0;
    };

    /// Sink for runs without a display; only counts what it was given.
    class HeadlessFrameSink : public FrameSink {
    public:
      void draw(const DrawCommand&) override { ++draws_; }
      void flip(const FrameTick&) override { ++flips_; }

      std::uint64_t draws() const noexcept { return draws_; }
      std::uint64_t flips() const noexcept { return flips_; }

    private:
      std::uint64_t draws_{ 0 };
      std::uint64_t flips_{ 0 };
    };

  } // namespace io
} // namespace trialflow
