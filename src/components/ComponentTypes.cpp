/* @file ComponentTypes.cpp
 * @brief name ↔ enum mapping for component policies
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <algorithm>
#include <cctype>
#include <utility>

// TrialFlow headers
#include "components/ComponentTypes.hpp"
#include "core/Errors.hpp"

namespace trialflow::components {

  namespace {

    std::string normalized(const std::string& text) {
      std::string out;
      for (char c : text) {
        if (!std::isspace(static_cast<unsigned char>(c)))
          out += static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
      }
      return out;
    }

    template <typename E, std::size_t N>
    E lookup(const std::pair<const char*, E> (&table)[N], const std::string& text,
             const char* what) {
      const std::string key = normalized(text);
      for (const auto& [name, value] : table) {
        if (key == name)
          return value;
      }
      throw core::ConfigurationError(std::string("unknown ") + what + " '" + text + "'");
    }

  } // namespace

  UpdatePolicy parseUpdatePolicy(const std::string& text) {
    static const std::pair<const char*, UpdatePolicy> table[] = {
      { "never", UpdatePolicy::Never },
      { "", UpdatePolicy::Never },
      { "constant", UpdatePolicy::Constant },
      { "seteveryrepeat", UpdatePolicy::EveryRepeat },
      { "everyrepeat", UpdatePolicy::EveryRepeat },
      { "seteveryframe", UpdatePolicy::EveryFrame },
      { "everyframe", UpdatePolicy::EveryFrame },
    };
    return lookup(table, text, "update policy");
  }

  StartType parseStartType(const std::string& text) {
    static const std::pair<const char*, StartType> table[] = {
      { "", StartType::None },
      { "none", StartType::None },
      { "time(s)", StartType::TimeSec },
      { "time", StartType::TimeSec },
      { "framen", StartType::FrameN },
      { "condition", StartType::Condition },
    };
    return lookup(table, text, "start type");
  }

  StopType parseStopType(const std::string& text) {
    static const std::pair<const char*, StopType> table[] = {
      { "", StopType::None },
      { "none", StopType::None },
      { "duration(s)", StopType::DurationSec },
      { "duration", StopType::DurationSec },
      { "time(s)", StopType::TimeSec },
      { "time", StopType::TimeSec },
      { "duration(frames)", StopType::DurationFrames },
      { "framen", StopType::FrameN },
      { "condition", StopType::Condition },
    };
    return lookup(table, text, "stop type");
  }

  const char* toString(UpdatePolicy p) {
    switch (p) {
    case UpdatePolicy::Never:
      return "never";
    case UpdatePolicy::Constant:
      return "constant";
    case UpdatePolicy::EveryRepeat:
      return "set every repeat";
    case UpdatePolicy::EveryFrame:
      return "set every frame";
    default:
      return "unknown";
    }
  }

  const char* toString(Status s) {
    switch (s) {
    case Status::NotStarted:
      return "not started";
    case Status::Started:
      return "started";
    case Status::Finished:
      return "finished";
    default:
      return "unknown";
    }
  }

  const ParameterSpec* ComponentSpec::findParameter(const std::string& param) const {
    auto it = std::find_if(parameters.begin(), parameters.end(),
                           [&](const ParameterSpec& p) { return p.name == param; });
    return it == parameters.end() ? nullptr : &*it;
  }

} // namespace trialflow::components
