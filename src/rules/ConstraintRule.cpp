#include "pagecraft/rules/ConstraintRule.h"
#include "pagecraft/common/Errors.h"
#include "pagecraft/common/Logger.h"

#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace pagecraft {

bool ConstraintRule::allowsChild(ComponentType childType) const {
    if (!allowedChildren.empty() && allowedChildren.count(childType) == 0) {
        return false;
    }
    if (isLayoutComponentType(childType)) {
        return canContainLayoutTypes;
    }
    return canContainLeafTypes;
}

RuleTable RuleTable::createDefault() {
    const std::set<ComponentType> generalChildren = {
        ComponentType::Container, ComponentType::Row, ComponentType::Col,
        ComponentType::Button, ComponentType::Input, ComponentType::Text,
        ComponentType::Image
    };

    RuleTable table;

    ConstraintRule container;
    container.allowedChildren = generalChildren;
    container.canContainLayoutTypes = true;
    container.canContainLeafTypes = true;
    container.maxNestingLevel = 5;
    container.maxDirectChildren = 50;
    container.maxWidth = 1200.0f;
    container.minWidth = 100.0f;
    table.registerRule(ComponentType::Container, container);

    ConstraintRule row;
    row.allowedChildren = {ComponentType::Col};
    row.canContainLayoutTypes = true;
    row.canContainLeafTypes = false;
    row.maxNestingLevel = 3;
    row.maxDirectChildren = 12;
    row.maxWidth = 1200.0f;
    row.minWidth = 100.0f;
    table.registerRule(ComponentType::Row, row);

    ConstraintRule col;
    col.allowedChildren = generalChildren;
    col.canContainLayoutTypes = true;
    col.canContainLeafTypes = true;
    col.maxNestingLevel = 5;
    col.maxDirectChildren = 20;
    col.maxWidth = 1200.0f;
    col.minWidth = 50.0f;
    table.registerRule(ComponentType::Col, col);

    return table;
}

void RuleTable::registerRule(ComponentType type, ConstraintRule rule) {
    rules_[type] = std::move(rule);
}

bool RuleTable::removeRule(ComponentType type) {
    return rules_.erase(type) > 0;
}

const ConstraintRule* RuleTable::find(ComponentType type) const {
    auto it = rules_.find(type);
    return it != rules_.end() ? &it->second : nullptr;
}

bool RuleTable::has(ComponentType type) const {
    return rules_.find(type) != rules_.end();
}

std::vector<ComponentType> RuleTable::types() const {
    std::vector<ComponentType> result;
    result.reserve(rules_.size());
    for (const auto& [type, _] : rules_) {
        result.push_back(type);
    }
    return result;
}

RuleConfig RuleConfig::createDefault() {
    RuleConfig config;
    config.rules = RuleTable::createDefault();
    return config;
}

// JSON Serialization

namespace {
    ComponentType parseType(const json& value, const char* context) {
        if (!value.is_string()) {
            throw ConfigError(std::string(context) + ": component type must be a string");
        }
        auto name = value.get<std::string>();
        auto type = componentTypeFromString(name);
        if (!type) {
            throw ConfigError(std::string(context) + ": unknown component type '" + name + "'");
        }
        return *type;
    }

    void readOptionalFloat(const json& j, const char* key, std::optional<float>& out) {
        if (j.contains(key) && j[key].is_number()) {
            out = j[key].get<float>();
        }
    }

    void readInt(const json& j, const char* key, int& out) {
        if (j.contains(key) && j[key].is_number_integer()) {
            out = j[key].get<int>();
        }
    }

    void readBool(const json& j, const char* key, bool& out) {
        if (j.contains(key) && j[key].is_boolean()) {
            out = j[key].get<bool>();
        }
    }
}

std::string RuleConfigSerializer::toJson(const RuleConfig& config) {
    json j;

    json rules = json::object();
    for (const auto& [type, rule] : config.rules.rules()) {
        json rj;
        rj["allowedChildren"] = json::array();
        for (ComponentType child : rule.allowedChildren) {
            rj["allowedChildren"].push_back(componentTypeToString(child));
        }
        rj["canContainLayoutTypes"] = rule.canContainLayoutTypes;
        rj["canContainLeafTypes"] = rule.canContainLeafTypes;
        rj["maxNestingLevel"] = rule.maxNestingLevel;
        rj["maxDirectChildren"] = rule.maxDirectChildren;

        if (rule.minWidth.has_value()) {
            rj["minWidth"] = rule.minWidth.value();
        }
        if (rule.maxWidth.has_value()) {
            rj["maxWidth"] = rule.maxWidth.value();
        }
        if (rule.minHeight.has_value()) {
            rj["minHeight"] = rule.minHeight.value();
        }
        if (rule.maxHeight.has_value()) {
            rj["maxHeight"] = rule.maxHeight.value();
        }

        rules[componentTypeToString(type)] = rj;
    }
    j["rules"] = rules;

    j["limits"] = {
        {"maxTotalComponents", config.limits.maxTotalComponents},
        {"maxNestingDepth", config.limits.maxNestingDepth},
        {"maxRowColumns", config.limits.maxRowColumns},
        {"complexityThreshold", config.limits.complexityThreshold}
    };

    j["rootTypes"] = json::array();
    for (ComponentType type : config.rootTypes) {
        j["rootTypes"].push_back(componentTypeToString(type));
    }

    return j.dump(2);
}

RuleConfig RuleConfigSerializer::fromJson(const std::string& jsonStr) {
    RuleConfig config = RuleConfig::createDefault();

    json j;
    try {
        j = json::parse(jsonStr);
    } catch (const json::parse_error& e) {
        throw ConfigError(std::string("Invalid rule config JSON: ") + e.what());
    }

    if (!j.is_object()) {
        throw ConfigError("Rule config must be a JSON object");
    }

    if (j.contains("rules")) {
        if (!j["rules"].is_object()) {
            throw ConfigError("\"rules\" must be an object keyed by component type");
        }
        RuleTable table;
        for (const auto& [name, rj] : j["rules"].items()) {
            auto type = parseType(json(name), "rules");
            if (!rj.is_object()) {
                throw ConfigError("rule for '" + name + "' must be an object");
            }

            ConstraintRule rule;
            if (rj.contains("allowedChildren")) {
                if (!rj["allowedChildren"].is_array()) {
                    throw ConfigError("allowedChildren of '" + name + "' must be an array");
                }
                for (const auto& child : rj["allowedChildren"]) {
                    rule.allowedChildren.insert(parseType(child, "allowedChildren"));
                }
            }
            readBool(rj, "canContainLayoutTypes", rule.canContainLayoutTypes);
            readBool(rj, "canContainLeafTypes", rule.canContainLeafTypes);
            readInt(rj, "maxNestingLevel", rule.maxNestingLevel);
            readInt(rj, "maxDirectChildren", rule.maxDirectChildren);
            readOptionalFloat(rj, "minWidth", rule.minWidth);
            readOptionalFloat(rj, "maxWidth", rule.maxWidth);
            readOptionalFloat(rj, "minHeight", rule.minHeight);
            readOptionalFloat(rj, "maxHeight", rule.maxHeight);

            table.registerRule(type, std::move(rule));
        }
        config.rules = std::move(table);
    }

    if (j.contains("limits") && j["limits"].is_object()) {
        const auto& lj = j["limits"];
        readInt(lj, "maxTotalComponents", config.limits.maxTotalComponents);
        readInt(lj, "maxNestingDepth", config.limits.maxNestingDepth);
        readInt(lj, "maxRowColumns", config.limits.maxRowColumns);
        readInt(lj, "complexityThreshold", config.limits.complexityThreshold);
    }

    if (j.contains("rootTypes")) {
        if (!j["rootTypes"].is_array()) {
            throw ConfigError("\"rootTypes\" must be an array");
        }
        config.rootTypes.clear();
        for (const auto& value : j["rootTypes"]) {
            config.rootTypes.insert(parseType(value, "rootTypes"));
        }
    }

    LOG_DEBUG("Loaded rule config: {} rules, {} root types",
              config.rules.size(), config.rootTypes.size());
    return config;
}

}  // namespace pagecraft
