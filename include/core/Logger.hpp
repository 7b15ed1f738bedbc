#pragma once
/** @file  Logger.hpp
 *  @brief Asynchronous CSV run logger (runs its own worker thread).
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <mutex>
#include <string>
#include <thread>

#include "io/FileLogger.hpp"

namespace trialflow {
  namespace core {

    /// One row of the run log.
    struct LogEvent {
      enum class Kind {
        RunStarted,
        RunFinished,
        LoopEntered,
        LoopIteration,
        LoopExited,
        RoutineStarted,
        RoutineEnded,
        Variable,
        Response,
        Error
      };

      Kind kind{ Kind::RunStarted };
      double t{ 0.0 };     ///< seconds since run start
      std::string subject; ///< loop/routine/variable name
      std::string detail;
    };

    const char* toString(LogEvent::Kind k);

    /**
 * @class Logger
 * @brief Queues events on the engine thread and writes them as CSV on a worker.
 *
 *  * An empty path disables the logger; `log()` becomes a no-op.
 *  * Columns: seq,t,event,subject,detail.
 */
    class Logger {

    public:
      explicit Logger(std::string path = {});
      ~Logger(); ///< finishes an open run

      // --- public API ---
      void startNewRun();              ///< open file + launch worker thread
      void log(const LogEvent& event); ///< enqueue event (non-blocking)
      void finishRun();                ///< flush + join worker thread

      bool enabled() const noexcept { return !path_.empty(); }
      bool running() const noexcept { return running_.load(); }
      const std::string& path() const noexcept { return path_; }

      Logger(const Logger&) = delete;
      Logger& operator=(const Logger&) = delete;

    private:
      void workerLoop();
      static std::string toCsv(std::uint64_t seq, const LogEvent& e);

      std::string path_;
      io::FileLogger csvFile_;
      std::deque<LogEvent> queue_;
      std::mutex mtx_;
      std::condition_variable cv_;
      std::thread worker_;
      std::atomic<bool> running_{ false };
      std::uint64_t seq_{ 0 }; ///< worker-thread only
    };

  } // namespace core
} // namespace trialflow
