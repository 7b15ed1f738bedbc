#pragma once
/** @file  FrameDriver.hpp
 *  @brief Source of rendering ticks and the escape flag for a run.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

#include <atomic>
#include <cstdint>
#include <optional>

namespace trialflow {
  namespace io {

    /// One rendering tick as seen by the engine.
    struct FrameTick {
      std::uint64_t frameN{ 0 }; ///< frames since the driver started
      double t{ 0.0 };           ///< seconds since the driver started
    };

    /**
 * @class FrameDriver
 * @brief Abstract frame clock. The engine pulls one tick per rendered frame
 *        and checks `escapeRequested()` at every tick boundary.
 *
 *  * Owned by the caller; the sequencer only borrows it for one run.
 */
    class FrameDriver {
    public:
      virtual ~FrameDriver() = default;

      /** Block (or simulate) until the next frame and return its timestamp. */
      virtual FrameTick nextFrame() = 0;

      /** Timestamp of the most recent tick without advancing. */
      virtual FrameTick current() const = 0;

      virtual double framePeriod() const = 0;

      virtual bool escapeRequested() const = 0;
      virtual void requestEscape() = 0;
    };

    /**
 * @class FixedRateFrameDriver
 * @brief Simulated display refreshing at a fixed rate; never sleeps.
 *
 *  * Optional frame budget: escape is requested once `maxFrames` ticks ran.
 *  * `requestEscape()` is safe to call from another thread (signal relay, UI).
 */
    class FixedRateFrameDriver : public FrameDriver {
    public:
      explicit FixedRateFrameDriver(double frameRate = 60.0,
                                    std::optional<std::uint64_t> maxFrames = std::nullopt);

      FrameTick nextFrame() override;
      FrameTick current() const override { return current_; }
      double framePeriod() const override { return period_; }

      bool escapeRequested() const override { return escape_.load(); }
      void requestEscape() override { escape_.store(true); }

      std::uint64_t framesElapsed() const noexcept { return produced_; }

    private:
      double period_;
      std::optional<std::uint64_t> maxFrames_;
      std::uint64_t produced_{ 0 };
      FrameTick current_{};
      std::atomic<bool> escape_{ false };
    };

  } // namespace io
} // namespace trialflow
