/* @file ComponentFactory.cpp
 * @brief component record parsing and the built-in variant creators
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <memory>
#include <sstream>

// 3rd-party headers
#include <nlohmann/json.hpp>

// TrialFlow headers
#include "components/ComponentFactory.hpp"
#include "core/Errors.hpp"

using nlohmann::json;

namespace trialflow::components {

  namespace {

    core::Value literalFrom(const json& j, const std::string& where) {
      if (j.is_boolean())
        return j.get<bool>();
      if (j.is_number())
        return j.get<double>();
      if (j.is_string())
        return j.get<std::string>();
      throw core::ConfigurationError(where + ": literal must be a number, boolean or string");
    }

    core::CompiledExpression compileField(const json& j, const std::string& where) {
      if (j.is_null())
        return {};
      std::string text;
      if (j.is_string())
        text = j.get<std::string>();
      else if (j.is_number() || j.is_boolean())
        text = j.dump();
      else
        throw core::ConfigurationError(where + " must be a number or expression string");
      if (text.empty())
        return {};
      return core::ExpressionEvaluator::compile(text);
    }

    // "updatesPolicy" is the record key; "updates" is accepted as shorthand
    UpdatePolicy policyField(const json& j, UpdatePolicy fallback) {
      if (j.contains("updatesPolicy"))
        return parseUpdatePolicy(j.at("updatesPolicy").get<std::string>());
      if (j.contains("updates"))
        return parseUpdatePolicy(j.at("updates").get<std::string>());
      return fallback;
    }

    ParameterSpec parseParameter(const std::string& name, const json& j, UpdatePolicy fallback,
                                 const std::string& where) {
      ParameterSpec p;
      p.name = name;

      // "$expr" marks code in an otherwise literal field
      if (j.is_string() && !j.get<std::string>().empty() && j.get<std::string>().front() == '$') {
        p.updates = fallback;
        p.expr = core::ExpressionEvaluator::compile(j.get<std::string>().substr(1));
        return p;
      }
      if (!j.is_object()) {
        p.updates = UpdatePolicy::Never;
        p.literal = literalFrom(j, where);
        return p;
      }

      if (j.contains("literal")) {
        p.updates = UpdatePolicy::Never;
        p.literal = literalFrom(j.at("literal"), where);
        return p;
      }
      if (!j.contains("expr") || !j.at("expr").is_string())
        throw core::ConfigurationError(where + ": parameter needs 'literal' or 'expr'");

      p.updates = policyField(j, fallback);
      if (p.updates == UpdatePolicy::Never)
        throw core::ConfigurationError(where + ": expression parameters cannot use 'never'");
      p.expr = core::ExpressionEvaluator::compile(j.at("expr").get<std::string>());
      return p;
    }

    std::string literalString(const ComponentSpec& spec, const char* param) {
      const ParameterSpec* p = spec.findParameter(param);
      if (!p)
        return {};
      if (p->updates != UpdatePolicy::Never)
        throw core::ConfigurationError("component '" + spec.name + "': '" + param +
                                       "' must be a literal");
      return core::toDisplayString(p->literal);
    }

    std::vector<std::string> splitList(const std::string& text) {
      std::vector<std::string> out;
      std::stringstream ss(text);
      std::string item;
      while (std::getline(ss, item, ',')) {
        auto b = item.find_first_not_of(" \t");
        auto e = item.find_last_not_of(" \t");
        if (b != std::string::npos)
          out.push_back(item.substr(b, e - b + 1));
      }
      return out;
    }

    core::CompiledScript script(const ComponentSpec& spec, const char* param) {
      try {
        return core::ScriptExecutor::compile(literalString(spec, param));
      } catch (const core::EvaluationError& e) {
        throw e.withComponent(spec.name);
      }
    }

  } // namespace

  ComponentFactory ComponentFactory::withBuiltins() {
    ComponentFactory f;
    f.registerKind(ShapeComponent::kKindName, [](const ComponentSpec&) { return ShapeComponent{}; });
    f.registerKind(TextComponent::kKindName, [](const ComponentSpec&) { return TextComponent{}; });
    f.registerKind(ProgressComponent::kKindName,
                   [](const ComponentSpec&) { return ProgressComponent{}; });
    f.registerKind(InputListenerComponent::kKindName, [](const ComponentSpec& spec) {
      return InputListenerComponent(
          splitList(literalString(spec, "clickable")),
          InputListenerComponent::parseForceEnd(literalString(spec, "forceEndRoutineOnPress")));
    });
    f.registerKind(CodeComponent::kKindName, [](const ComponentSpec& spec) {
      CodeComponent::Scripts s;
      s.beginExperiment = script(spec, "beginExperiment");
      s.beginRoutine = script(spec, "beginRoutine");
      s.eachFrame = script(spec, "eachFrame");
      s.endRoutine = script(spec, "endRoutine");
      s.endExperiment = script(spec, "endExperiment");
      return CodeComponent(std::move(s));
    });

    f.registerAlias("polygon", "shape");
    f.registerAlias("rect", "shape");
    f.registerAlias("mouse", "listener");
    f.registerAlias("slider", "progress");
    return f;
  }

  bool ComponentFactory::registerKind(const std::string& name, Creator maker) {
    if (aliases_.count(name))
      return false;
    return creators_.emplace(name, std::move(maker)).second;
  }

  bool ComponentFactory::registerAlias(const std::string& alias, const std::string& target) {
    if (!creators_.count(target) || creators_.count(alias))
      return false;
    return aliases_.emplace(alias, target).second;
  }

  bool ComponentFactory::knows(const std::string& kind) const {
    return creators_.count(kind) || aliases_.count(kind);
  }

  const ComponentFactory::Creator& ComponentFactory::creatorFor(const std::string& kind) const {
    auto alias = aliases_.find(kind);
    const std::string& key = alias == aliases_.end() ? kind : alias->second;
    auto it = creators_.find(key);
    if (it == creators_.end())
      throw core::ConfigurationError("unknown component kind '" + kind + "'");
    return it->second;
  }

  Component ComponentFactory::create(const json& record) const {
    if (!record.is_object())
      throw core::ConfigurationError("component record must be an object");

    auto spec = std::make_shared<ComponentSpec>();
    spec->kind = record.value("kind", std::string{});
    spec->name = record.value("name", std::string{});
    if (spec->name.empty())
      throw core::ConfigurationError("component record without a name");
    const std::string where = "component '" + spec->name + "'";
    const Creator& maker = creatorFor(spec->kind);

    try {
      spec->updates = policyField(record, UpdatePolicy::Constant);
      if (spec->updates == UpdatePolicy::Never)
        spec->updates = UpdatePolicy::Constant;

      auto& timing = spec->timing;
      timing.startType = parseStartType(record.value("startType", std::string("time (s)")));
      timing.startVal = compileField(record.value("startVal", json()), where + " startVal");
      timing.stopType = parseStopType(record.value("stopType", std::string()));
      timing.stopVal = compileField(record.value("stopVal", json()), where + " stopVal");

      if (timing.startType == StartType::Condition && timing.startVal.empty())
        throw core::ConfigurationError(where + ": condition start needs a startVal");
      if (timing.stopType != StopType::None && timing.stopVal.empty())
        throw core::ConfigurationError(where + ": stopType needs a stopVal");

      if (record.contains("parameters")) {
        const json& params = record.at("parameters");
        if (!params.is_object())
          throw core::ConfigurationError(where + ": 'parameters' must be an object");
        for (const auto& [key, value] : params.items())
          spec->parameters.push_back(parseParameter(key, value, spec->updates, where));
      }
    } catch (const core::EvaluationError& e) {
      throw e.withComponent(spec->name);
    } catch (const json::exception& e) {
      throw core::ConfigurationError(where + ": " + e.what());
    }

    Behavior behavior = maker(*spec);
    return Component(std::move(spec), std::move(behavior));
  }

} // namespace trialflow::components
