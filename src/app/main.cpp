/* @file main.cpp
 * @brief trialflow CLI: run one experiment from a run-config file
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <csignal>
#include <iostream>
#include <memory>

// TrialFlow headers
#include "core/ErrorMonitor.hpp"
#include "core/Errors.hpp"
#include "core/RunCoordinator.hpp"

namespace {
  trialflow::core::RunCoordinator* gCoordinator = nullptr;

  extern "C" void onInterrupt(int) {
    if (gCoordinator)
      gCoordinator->handleAbort();
  }

  void printSummary(const trialflow::flow::RunSummary& s) {
    std::cout << "outcome: " << trialflow::flow::toString(s.outcome) << "\n"
              << "frames:  " << s.frames << "\n";
    for (const auto& [name, n] : s.routineActivations)
      std::cout << "routine " << name << ": " << n << "\n";
    for (const auto& [name, n] : s.loopIterations)
      std::cout << "loop    " << name << ": " << n << "\n";
  }
} // namespace

int main(int argc, char** argv) {
  if (argc != 2) {
    std::cerr << "usage: " << argv[0] << " <config.json>\n";
    return 1;
  }

  auto monitor = std::make_shared<trialflow::core::ErrorMonitor>();
  monitor->registerEscalation([](const std::string& msg) { std::cerr << "error: " << msg << "\n"; });

  trialflow::core::RunCoordinator coordinator(monitor);
  gCoordinator = &coordinator;
  std::signal(SIGINT, onInterrupt);

  try {
    coordinator.initialize(argv[1]);
    auto summary = coordinator.run();
    printSummary(summary);
    gCoordinator = nullptr;
    return summary.outcome == trialflow::flow::RunSummary::Outcome::Completed ? 0 : 2;
  } catch (const trialflow::core::FlowError&) {
    // already reported through the monitor
  } catch (const std::exception& e) {
    std::cerr << "error: " << e.what() << "\n";
  }
  gCoordinator = nullptr;
  return 1;
}
