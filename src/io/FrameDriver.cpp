/* @file FrameDriver.cpp
 * @brief fixed-rate simulated frame clock
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <stdexcept>

// TrialFlow headers
#include "io/FrameDriver.hpp"

using namespace trialflow::io;

FixedRateFrameDriver::FixedRateFrameDriver(double frameRate, std::optional<std::uint64_t> maxFrames)
    : period_(0.0), maxFrames_(maxFrames) {
  if (!(frameRate > 0.0))
    throw std::invalid_argument("[FixedRateFrameDriver] frame rate must be positive");
  period_ = 1.0 / frameRate;
}

FrameTick FixedRateFrameDriver::nextFrame() {
  current_.frameN = produced_;
  current_.t = static_cast<double>(produced_) * period_;
  ++produced_;
  if (maxFrames_ && produced_ >= *maxFrames_)
    requestEscape();
  return current_;
}
