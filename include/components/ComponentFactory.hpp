#pragma once
/** @file  ComponentFactory.hpp
 *  @brief Runtime registry that maps component kind names to creators.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

#include <functional>
#include <string>
#include <unordered_map>

#include <nlohmann/json_fwd.hpp>

#include "components/Component.hpp"

namespace trialflow::components {

  /**
 * @class ComponentFactory
 * @brief Register & instantiate component prototypes by kind name.
 *
 *  * Keeps the experiment loader decoupled from concrete variants.
 *  * Creators turn the parsed common record into the variant's behaviour.
 *  * Aliases map authoring names (`polygon`, `mouse`) onto registered kinds.
 */
  class ComponentFactory {
  public:
    using Creator = std::function<Behavior(const ComponentSpec&)>;

    /// Factory with the built-in kinds (shape, text, progress, listener, code) and aliases.
    static ComponentFactory withBuiltins();

    /// Register a kind under \p name.  Returns false on duplicate.
    bool registerKind(const std::string& name, Creator maker);

    /// Make \p alias resolve to \p target. Returns false on duplicate or unknown target.
    bool registerAlias(const std::string& alias, const std::string& target);

    bool knows(const std::string& kind) const;

    /// Parse one component record; throws `ConfigurationError` on bad records or unknown kinds.
    Component create(const nlohmann::json& record) const;

  private:
    const Creator& creatorFor(const std::string& kind) const;

    std::unordered_map<std::string, Creator> creators_;
    std::unordered_map<std::string, std::string> aliases_;
  };

} // namespace trialflow::components
