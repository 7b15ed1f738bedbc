/* @file Logger.cpp
 * @brief worker-thread CSV writer for run events
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <cstdio>
#include <iostream>
#include <vector>

// TrialFlow headers
#include "core/Logger.hpp"

namespace trialflow {
  namespace core {

    const char* toString(LogEvent::Kind k) {
      switch (k) {
      case LogEvent::Kind::RunStarted:
        return "run_started";
      case LogEvent::Kind::RunFinished:
        return "run_finished";
      case LogEvent::Kind::LoopEntered:
        return "loop_entered";
      case LogEvent::Kind::LoopIteration:
        return "loop_iteration";
      case LogEvent::Kind::LoopExited:
        return "loop_exited";
      case LogEvent::Kind::RoutineStarted:
        return "routine_started";
      case LogEvent::Kind::RoutineEnded:
        return "routine_ended";
      case LogEvent::Kind::Variable:
        return "variable";
      case LogEvent::Kind::Response:
        return "response";
      case LogEvent::Kind::Error:
        return "error";
      default:
        return "unknown";
      }
    }

    namespace {
      std::string quoted(const std::string& field) {
        if (field.find_first_of(",\"\n") == std::string::npos)
          return field;
        std::string out = "\"";
        for (char c : field) {
          if (c == '"')
            out += '"';
          out += c;
        }
        out += '"';
        return out;
      }
    } // namespace

    Logger::Logger(std::string path) : path_(std::move(path)) {}

    Logger::~Logger() { finishRun(); }

    void Logger::startNewRun() {
      if (!enabled() || running_)
        return;

      if (!csvFile_.open(path_))
        throw std::runtime_error("[Logger] cannot open run log '" + path_ + "'");
      csvFile_.write("seq,t,event,subject,detail\n");

      seq_ = 0;
      running_ = true;
      worker_ = std::thread(&Logger::workerLoop, this);
    }

    void Logger::log(const LogEvent& event) {
      if (!running_)
        return;
      {
        std::lock_guard<std::mutex> lock(mtx_);
        queue_.push_back(event);
      }
      cv_.notify_one();
    }

    void Logger::finishRun() {
      {
        std::lock_guard<std::mutex> lock(mtx_);
        if (!running_.exchange(false))
          return;
      }
      cv_.notify_one();
      if (worker_.joinable())
        worker_.join();
      csvFile_.close();
    }

    void Logger::workerLoop() {
      std::vector<LogEvent> batch;
      for (;;) {
        {
          std::unique_lock<std::mutex> lock(mtx_);
          cv_.wait(lock, [this] { return !queue_.empty() || !running_; });
          batch.assign(queue_.begin(), queue_.end());
          queue_.clear();
        }

        for (const auto& e : batch)
          csvFile_.write(toCsv(seq_++, e));
        batch.clear();

        std::lock_guard<std::mutex> lock(mtx_);
        if (!running_ && queue_.empty())
          break;
      }
      if (!csvFile_.flush())
        std::cerr << "[Logger] final flush of '" << path_ << "' failed\n";
    }

    std::string Logger::toCsv(std::uint64_t seq, const LogEvent& e) {
      char t[32];
      std::snprintf(t, sizeof(t), "%.4f", e.t);
      return std::to_string(seq) + "," + t + "," + toString(e.kind) + "," + quoted(e.subject) +
             "," + quoted(e.detail) + "\n";
    }

  } // namespace core
} // namespace trialflow
