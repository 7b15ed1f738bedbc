#pragma once
/** @file  ResponseDevice.hpp
 *  @brief Input devices that store responses and relay them to listeners.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

#include <deque>
#include <functional>
#include <string>
#include <utility>
#include <vector>

#include "core/Value.hpp"

namespace trialflow {
  namespace io {

    /// One pointer/button response. `value` is the button index for pointers.
    struct Response {
      double t{ 0.0 }; ///< run time of the response (s)
      core::Value value{ 0.0 };
      double x{ 0.0 };
      double y{ 0.0 };

      /// `{"type":"hardware_response","class":...,"data":{t,value,x,y}}`
      std::string toJson(const std::string& className = "PointerResponse") const;
    };

    /**
 * @class ResponseDevice
 * @brief Base-class for listenable hardware: keeps received responses and
 *        forwards each one to every attached listener.
 *
 *  * Polled once per tick via `dispatchMessages()`; never blocks.
 *  * `makeResponse()` injects a response programmatically (scripted runs, tests).
 */
    class ResponseDevice {
    public:
      using Listener = std::function<void(const Response&)>;

      explicit ResponseDevice(std::string name) : name_(std::move(name)) {}
      virtual ~ResponseDevice() = default;

      /** Pull pending hardware messages up to run time \p now. */
      virtual void dispatchMessages(double now) { (void)now; }

      /** Store \p response and relay it to listeners. */
      bool receiveMessage(const Response& response);

      const Response& makeResponse(double t, core::Value value, double x = 0.0, double y = 0.0);

      /** Dispatch anything due by \p now, then forget all stored responses. */
      void clearResponses(double now);

      const std::vector<Response>& responses() const noexcept { return responses_; }

      /** Attach \p listener under \p name. False if the name is already taken. */
      bool addListener(const std::string& name, Listener listener);
      bool removeListener(const std::string& name);
      void clearListeners() { listeners_.clear(); }
      std::vector<std::string> listenerNames() const;
      std::size_t listenerCount() const noexcept { return listeners_.size(); }

      const std::string& name() const noexcept { return name_; }

      ResponseDevice(const ResponseDevice&) = delete;
      ResponseDevice& operator=(const ResponseDevice&) = delete;

    private:
      std::string name_;
      std::vector<Response> responses_;
      std::vector<std::pair<std::string, Listener>> listeners_; ///< relay order = attach order
    };

    /**
 * @class ScriptedPointer
 * @brief Pointer device fed from a pre-recorded schedule; a response is
 *        released once the run clock reaches its timestamp.
 */
    class ScriptedPointer : public ResponseDevice {
    public:
      ScriptedPointer() : ResponseDevice("pointer") {}

      /** Queue \p response; schedules must be added in time order. */
      void schedule(const Response& response);

      void dispatchMessages(double now) override;

      std::size_t pending() const noexcept { return scheduled_.size(); }

    private:
      std::deque<Response> scheduled_;
    };

  } // namespace io
} // namespace trialflow
