#include "mcplink/protocol/mcp_types.hpp"

#include <algorithm>

namespace mcplink {
namespace {

// "type" may be a single name or a list such as ["string", "null"]; the first
// non-null entry wins.
std::string parse_type_field(const Json& node) {
    if (node.is_string()) {
        return node.get<std::string>();
    }
    if (node.is_array()) {
        for (const auto& entry : node) {
            if (entry.is_string() && entry.get<std::string>() != "null") {
                return entry.get<std::string>();
            }
        }
    }
    return {};
}

SchemaProperty parse_property(const std::string& name, const Json& node) {
    SchemaProperty property;
    property.name = name;
    if (node.is_object() == false) {
        return property;
    }

    if (node.contains("type")) {
        property.type = parse_type_field(node["type"]);
    }
    if (node.contains("description") && node["description"].is_string()) {
        property.description = node["description"].get<std::string>();
    }
    if (node.contains("default")) {
        property.default_value = node["default"];
    }
    if (node.contains("enum") && node["enum"].is_array()) {
        property.enum_values = std::vector<Json>(node["enum"].begin(), node["enum"].end());
    }
    if (node.contains("items") && node["items"].is_object()) {
        property.items = std::make_shared<const InputSchema>(InputSchema::from_json(node["items"]));
    }
    return property;
}

}  // namespace

// ─────────────────────────────────────────────────────────────────────────────
// SchemaProperty
// ─────────────────────────────────────────────────────────────────────────────

Json SchemaProperty::to_json() const {
    Json j = Json::object();
    if (!type.empty()) {
        j["type"] = type;
    }
    if (description) {
        j["description"] = *description;
    }
    if (default_value) {
        j["default"] = *default_value;
    }
    if (enum_values) {
        j["enum"] = Json::array();
        for (const auto& value : *enum_values) {
            j["enum"].push_back(value);
        }
    }
    if (items) {
        j["items"] = items->to_json();
    }
    return j;
}

// ─────────────────────────────────────────────────────────────────────────────
// InputSchema
// ─────────────────────────────────────────────────────────────────────────────

bool InputSchema::is_required(std::string_view property_name) const {
    return std::find(required.begin(), required.end(), property_name) != required.end();
}

const SchemaProperty* InputSchema::find(std::string_view property_name) const {
    const auto it = std::find_if(properties.begin(), properties.end(),
        [property_name](const SchemaProperty& p) { return p.name == property_name; });
    return it == properties.end() ? nullptr : &*it;
}

std::size_t InputSchema::required_count() const {
    return static_cast<std::size_t>(std::count_if(properties.begin(), properties.end(),
        [this](const SchemaProperty& p) { return is_required(p.name); }));
}

Json InputSchema::to_json() const {
    Json j = Json::object();
    j["type"] = type;
    if (!properties.empty() || type == "object") {
        j["properties"] = Json::object();
        for (const auto& property : properties) {
            j["properties"][property.name] = property.to_json();
        }
    }
    if (!required.empty()) {
        j["required"] = required;
    }
    return j;
}

InputSchema InputSchema::from_json(const Json& j) {
    InputSchema schema;
    if (j.is_object() == false) {
        return schema;
    }

    if (j.contains("type")) {
        schema.type = parse_type_field(j["type"]);
    }
    if (j.contains("properties") && j["properties"].is_object()) {
        for (const auto& [name, node] : j["properties"].items()) {
            schema.properties.push_back(parse_property(name, node));
        }
    }
    if (j.contains("required") && j["required"].is_array()) {
        for (const auto& entry : j["required"]) {
            if (entry.is_string()) {
                schema.required.push_back(entry.get<std::string>());
            }
        }
    }
    return schema;
}

}  // namespace mcplink
