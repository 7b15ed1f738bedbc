/* @file ResponseDevice.cpp
 * @brief response storage, listener relay and scripted pointer input
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <algorithm>
#include <stdexcept>

// 3rd-party headers
#include <nlohmann/json.hpp>

// TrialFlow headers
#include "io/ResponseDevice.hpp"

using namespace trialflow::io;

std::string Response::toJson(const std::string& className) const {
  nlohmann::json data;
  data["t"] = t;
  std::visit([&](const auto& v) { data["value"] = v; }, value);
  data["x"] = x;
  data["y"] = y;

  nlohmann::json message;
  message["type"] = "hardware_response";
  message["class"] = className;
  message["data"] = std::move(data);
  return message.dump();
}

bool ResponseDevice::receiveMessage(const Response& response) {
  responses_.push_back(response);
  for (auto& [name, listener] : listeners_)
    listener(response);
  return true;
}

bool ResponseDevice::addListener(const std::string& name, Listener listener) {
  if (!listener)
    throw std::invalid_argument("[ResponseDevice] listener '" + name + "' is empty");
  auto taken = std::any_of(listeners_.begin(), listeners_.end(),
                           [&](const auto& entry) { return entry.first == name; });
  if (taken)
    return false;
  listeners_.emplace_back(name, std::move(listener));
  return true;
}

bool ResponseDevice::removeListener(const std::string& name) {
  auto it = std::find_if(listeners_.begin(), listeners_.end(),
                         [&](const auto& entry) { return entry.first == name; });
  if (it == listeners_.end())
    return false;
  listeners_.erase(it);
  return true;
}

std::vector<std::string> ResponseDevice::listenerNames() const {
  std::vector<std::string> names;
  names.reserve(listeners_.size());
  for (const auto& entry : listeners_)
    names.push_back(entry.first);
  return names;
}

const Response& ResponseDevice::makeResponse(double t, trialflow::core::Value value, double x,
                                             double y) {
  Response r;
  r.t = t;
  r.value = std::move(value);
  r.x = x;
  r.y = y;
  receiveMessage(r);
  return responses_.back();
}

void ResponseDevice::clearResponses(double now) {
  dispatchMessages(now);
  responses_.clear();
}

void ScriptedPointer::schedule(const Response& response) {
  if (!scheduled_.empty() && response.t < scheduled_.back().t)
    throw std::invalid_argument("[ScriptedPointer] responses must be scheduled in time order");
  scheduled_.push_back(response);
}

void ScriptedPointer::dispatchMessages(double now) {
  while (!scheduled_.empty() && scheduled_.front().t <= now) {
    receiveMessage(scheduled_.front());
    scheduled_.pop_front();
  }
}
