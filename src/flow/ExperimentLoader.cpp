/* @file ExperimentLoader.cpp
 * @brief experiment file schema: variables, routines, loops and flow records
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <cctype>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <set>
#include <sstream>

// 3rd-party headers
#include <nlohmann/json.hpp>

// TrialFlow headers
#include "core/ConfigLoader.hpp"
#include "core/Errors.hpp"
#include "flow/ExperimentLoader.hpp"

using nlohmann::json;

namespace trialflow::flow {

  namespace {

    core::Value valueFrom(const json& j, const std::string& where) {
      if (j.is_boolean())
        return j.get<bool>();
      if (j.is_number())
        return j.get<double>();
      if (j.is_string())
        return j.get<std::string>();
      throw core::ConfigurationError(where + " must be a number, boolean or string");
    }

    std::string lower(std::string s) {
      for (auto& c : s)
        c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
      return s;
    }

    std::string trim(const std::string& s) {
      auto b = s.find_first_not_of(" \t\r");
      if (b == std::string::npos)
        return {};
      auto e = s.find_last_not_of(" \t\r");
      return s.substr(b, e - b + 1);
    }

    std::vector<std::string> splitCsvLine(const std::string& line) {
      std::vector<std::string> cells;
      std::string cur;
      bool quoted = false;
      for (std::size_t i = 0; i < line.size(); ++i) {
        char c = line[i];
        if (quoted) {
          if (c == '"' && i + 1 < line.size() && line[i + 1] == '"') {
            cur += '"';
            ++i;
          } else if (c == '"') {
            quoted = false;
          } else {
            cur += c;
          }
        } else if (c == '"') {
          quoted = true;
        } else if (c == ',') {
          cells.push_back(cur);
          cur.clear();
        } else {
          cur += c;
        }
      }
      cells.push_back(cur);
      return cells;
    }

    core::Value csvValue(const std::string& raw) {
      std::string cell = trim(raw);
      if (cell == "True" || cell == "true")
        return true;
      if (cell == "False" || cell == "false")
        return false;
      if (!cell.empty()) {
        char* end = nullptr;
        double d = std::strtod(cell.c_str(), &end);
        if (*end == '\0')
          return d;
      }
      return cell;
    }

    ConditionTable tableFromJson(const json& j, const std::string& where) {
      if (!j.is_array())
        throw core::ConfigurationError(where + ": conditions must be an array of objects");
      ConditionTable table;
      for (const auto& row : j) {
        if (!row.is_object())
          throw core::ConfigurationError(where + ": each condition row must be an object");
        ConditionRow parsed;
        for (const auto& [key, value] : row.items()) {
          if (!core::ExpressionEvaluator::isValidName(key))
            throw core::ConfigurationError(where + ": invalid condition variable '" + key + "'");
          parsed.emplace(key, valueFrom(value, where + " condition '" + key + "'"));
        }
        table.push_back(std::move(parsed));
      }
      return table;
    }

  } // namespace

  ExperimentLoader::ExperimentLoader(components::ComponentFactory factory)
      : factory_(std::move(factory)) {}

  Experiment ExperimentLoader::load(const std::string& path) const {
    core::ConfigLoader loader(path);
    Experiment exp = fromJson(loader.load(), std::filesystem::path(path).parent_path().string());
    exp.source = path;
    return exp;
  }

  ConditionTable ExperimentLoader::parseConditionsCsv(const std::string& text) {
    std::istringstream in(text);
    std::string line;
    std::vector<std::string> header;
    ConditionTable table;

    while (std::getline(in, line)) {
      if (trim(line).empty())
        continue;
      auto cells = splitCsvLine(line);
      if (header.empty()) {
        for (auto& c : cells) {
          std::string name = trim(c);
          if (!core::ExpressionEvaluator::isValidName(name))
            throw core::ConfigurationError("conditions header has invalid name '" + name + "'");
          header.push_back(std::move(name));
        }
        continue;
      }
      if (cells.size() != header.size())
        throw core::ConfigurationError("conditions row " + std::to_string(table.size() + 1) +
                                       " has " + std::to_string(cells.size()) + " cells, expected " +
                                       std::to_string(header.size()));
      ConditionRow row;
      for (std::size_t i = 0; i < cells.size(); ++i)
        row.emplace(header[i], csvValue(cells[i]));
      table.push_back(std::move(row));
    }
    return table;
  }

  Experiment ExperimentLoader::fromJson(const json& doc, const std::string& baseDir) const {
    if (!doc.is_object())
      throw core::ConfigurationError("experiment file must hold a JSON object");

    Experiment exp;
    try {
      if (doc.contains("variables")) {
        const json& vars = doc.at("variables");
        if (!vars.is_object())
          throw core::ConfigurationError("'variables' must be an object");
        for (const auto& [key, value] : vars.items()) {
          if (!core::ExpressionEvaluator::isValidName(key))
            throw core::ConfigurationError("invalid variable name '" + key + "'");
          exp.variables.emplace(key, valueFrom(value, "variable '" + key + "'"));
        }
      }

      if (doc.contains("routines")) {
        const json& routines = doc.at("routines");
        if (!routines.is_object())
          throw core::ConfigurationError("'routines' must be an object keyed by routine name");
        for (const auto& [key, value] : routines.items())
          exp.routines.emplace(key, parseRoutine(key, value));
      }

      if (!doc.contains("flow") || !doc.at("flow").is_array())
        throw core::ConfigurationError("experiment file needs a 'flow' array");

      for (const auto& record : doc.at("flow")) {
        const std::string type = lower(record.value("type", std::string{}));
        const std::string name = record.value("name", std::string{});
        if (name.empty())
          throw core::ConfigurationError("flow record without a name");

        if (type == "routine") {
          if (!exp.routines.count(name))
            throw core::ConfigurationError("flow references unknown routine '" + name + "'");
          exp.flow.push_back(RoutineRef{ name });
        } else if (type == "loopstart") {
          LoopNode loop = parseLoop(record, baseDir);
          if (!exp.loops.emplace(name, std::move(loop)).second)
            throw core::ConfigurationError("loop '" + name + "' is started more than once");
          exp.flow.push_back(LoopStart{ name });
        } else if (type == "loopend") {
          exp.flow.push_back(LoopEnd{ name });
        } else {
          throw core::ConfigurationError("unknown flow record type '" +
                                         record.value("type", std::string{}) + "'");
        }
      }
    } catch (const json::exception& e) {
      throw core::ConfigurationError(std::string("malformed experiment file: ") + e.what());
    }
    return exp;
  }

  RoutineDefinition ExperimentLoader::parseRoutine(const std::string& name, const json& j) const {
    RoutineDefinition def;
    def.name = name;

    const json* list = &j;
    if (j.is_object()) {
      if (j.contains("maxDuration") && !j.at("maxDuration").is_null()) {
        const json& md = j.at("maxDuration");
        try {
          def.maxDuration =
              core::ExpressionEvaluator::compile(md.is_string() ? md.get<std::string>() : md.dump());
        } catch (const core::EvaluationError& e) {
          throw e.withComponent(name);
        }
      }
      list = &j.at("components");
    }
    if (!list->is_array())
      throw core::ConfigurationError("routine '" + name + "' needs a 'components' array");

    std::set<std::string> seen;
    for (const auto& record : *list) {
      components::Component c = factory_.create(record);
      if (!seen.insert(c.name()).second)
        throw core::ConfigurationError("routine '" + name + "' has two components named '" +
                                       c.name() + "'");
      def.components.push_back(std::move(c));
    }
    return def;
  }

  LoopNode ExperimentLoader::parseLoop(const json& j, const std::string& baseDir) const {
    LoopNode loop;
    loop.name = j.at("name").get<std::string>();
    if (!core::ExpressionEvaluator::isValidName(loop.name))
      throw core::ConfigurationError("invalid loop name '" + loop.name + "'");
    const std::string where = "loop '" + loop.name + "'";

    const std::string order = lower(j.value("loopType", std::string("sequential")));
    if (order == "sequential")
      loop.order = LoopOrder::Sequential;
    else if (order == "random" || order == "fullrandom")
      loop.order = LoopOrder::Random;
    else
      throw core::ConfigurationError(where + ": unknown loopType '" + order + "'");

    loop.kind = j.value("guard", false) ? LoopKind::BranchGuard : LoopKind::Repeat;
    loop.isTrials = j.value("isTrials", true);

    if (!j.contains("nReps") || j.at("nReps").is_null())
      throw core::ConfigurationError(where + " has no 'nReps'");
    const json& reps = j.at("nReps");
    if (!reps.is_string() && !reps.is_number() && !reps.is_boolean())
      throw core::ConfigurationError(where + ": 'nReps' must be a number or expression");
    try {
      loop.nReps = core::ExpressionEvaluator::compile(reps.is_string() ? reps.get<std::string>()
                                                                       : reps.dump());
    } catch (const core::EvaluationError& e) {
      throw e.withComponent(loop.name);
    }

    if (j.contains("seed") && !j.at("seed").is_null()) {
      const json& seed = j.at("seed");
      if (!seed.is_number_integer() || seed.get<long long>() < 0)
        throw core::ConfigurationError(where + ": 'seed' must be a non-negative integer");
      loop.seed = seed.get<std::uint64_t>();
    }

    if (j.contains("conditions") && j.contains("conditionsFile"))
      throw core::ConfigurationError(where + ": give either 'conditions' or 'conditionsFile'");
    if (j.contains("conditions")) {
      loop.conditions = tableFromJson(j.at("conditions"), where);
    } else if (j.contains("conditionsFile")) {
      std::filesystem::path file(j.at("conditionsFile").get<std::string>());
      if (file.is_relative() && !baseDir.empty())
        file = std::filesystem::path(baseDir) / file;

      if (lower(file.extension().string()) == ".csv") {
        std::ifstream in(file);
        if (!in)
          throw core::ConfigurationError(where + ": cannot open '" + file.string() + "'");
        std::stringstream buf;
        buf << in.rdbuf();
        loop.conditions = parseConditionsCsv(buf.str());
      } else {
        loop.conditions = tableFromJson(core::ConfigLoader(file.string()).load(), where);
      }
    }

    if (j.contains("endPoints"))
      loop.endPoints = j.at("endPoints").get<std::vector<int>>();
    return loop;
  }

} // namespace trialflow::flow
