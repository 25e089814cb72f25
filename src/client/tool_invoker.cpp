#include "mcplink/client/tool_invoker.hpp"
#include "mcplink/log/logger.hpp"

namespace mcplink {

namespace {

std::string join_names(const std::vector<std::string>& names) {
    std::string out = "[";
    for (std::size_t i = 0; i < names.size(); ++i) {
        if (i > 0) {
            out += ", ";
        }
        out += names[i];
    }
    return out + "]";
}

std::vector<std::string> required_names(const InputSchema& schema) {
    std::vector<std::string> names;
    for (const auto& property : schema.properties) {
        if (schema.is_required(property.name)) {
            names.push_back(property.name);
        }
    }
    return names;
}

std::string dump_values(const std::vector<Json>& values) {
    Json array = Json::array();
    for (const auto& value : values) {
        array.push_back(value);
    }
    return array.dump(-1, ' ', false, Json::error_handler_t::replace);
}

ClientError argument_mismatch(const Tool& tool, const std::vector<Json>& positional, const std::string& detail) {
    return ClientError::argument_mismatch(
        "Tool '" + tool.name + "' " + detail + "; required " +
        join_names(required_names(tool.input_schema)) + ", got " + dump_values(positional));
}

ClientError tool_failure(const std::string& tool_name, const ClientError& error) {
    ClientError wrapped = error;
    if (error.rpc_error) {
        wrapped.message = "Tool '" + tool_name + "' failed with error " +
                          std::to_string(error.rpc_error->code) + ": " + error.rpc_error->message;
    } else {
        wrapped.message = "Tool '" + tool_name + "' failed: " + error.message;
    }
    return wrapped;
}

ClientResult<Json> prepare_call(Connection& connection,
                                const std::string& tool_name,
                                const std::vector<Json>& positional) {
    const Tool* tool = connection.catalog().find_tool(tool_name);
    if (!tool) {
        return tl::unexpected(ClientError::not_found(
            "Tool '" + tool_name + "' is not in the catalog of '" + connection.name() + "'"));
    }

    auto arguments = build_call(*tool, positional);
    if (!arguments) {
        return tl::unexpected(arguments.error());
    }
    return CallToolParams{tool_name, std::move(*arguments)}.to_json();
}

}  // namespace

// ═══════════════════════════════════════════════════════════════════════════
// Marshaling
// ═══════════════════════════════════════════════════════════════════════════

ClientResult<Json> build_call(const Tool& tool, const std::vector<Json>& positional) {
    const InputSchema& schema = tool.input_schema;

    if (positional.size() < schema.required_count()) {
        return tl::unexpected(argument_mismatch(tool, positional,
            "expects at least " + std::to_string(schema.required_count()) + " argument(s)"));
    }
    if (positional.size() > schema.properties.size()) {
        return tl::unexpected(argument_mismatch(tool, positional,
            "takes at most " + std::to_string(schema.properties.size()) + " argument(s)"));
    }

    Json named = Json::object();
    for (std::size_t i = 0; i < schema.properties.size(); ++i) {
        const SchemaProperty& property = schema.properties[i];
        if (i < positional.size()) {
            named[property.name] = positional[i];
        } else if (property.has_default()) {
            named[property.name] = *property.default_value;
        } else if (schema.is_required(property.name)) {
            return tl::unexpected(argument_mismatch(tool, positional,
                "is missing required argument '" + property.name + "'"));
        }
    }
    return named;
}

std::string extract_text(const Json& call_result) {
    std::string text;
    if (!call_result.is_object() || !call_result.contains("content") ||
        !call_result["content"].is_array()) {
        return text;
    }

    bool first = true;
    for (const auto& entry : call_result["content"]) {
        if (!entry.is_object() || entry.value("type", "") != "text") {
            continue;
        }
        if (!entry.contains("text") || !entry["text"].is_string()) {
            continue;
        }
        if (!first) {
            text += '\n';
        }
        text += entry["text"].get<std::string>();
        first = false;
    }
    return text;
}

// ═══════════════════════════════════════════════════════════════════════════
// Normalized descriptor
// ═══════════════════════════════════════════════════════════════════════════

Json ToolItemShape::to_json() const {
    Json j = Json::object();
    j["type"] = type;
    j["properties"] = Json::object();
    for (const auto& field : properties) {
        j["properties"][field.name] = {{"type", field.type}, {"description", field.description}};
    }
    j["required"] = Json::array();
    for (const auto& name : required) {
        j["required"].push_back(name);
    }
    return j;
}

Json ToolParameter::to_json() const {
    Json j = {
        {"name", name},
        {"type", type},
        {"description", description},
        {"required", required}
    };
    if (default_value) {
        j["default"] = *default_value;
    }
    if (items) {
        j["items"] = items->to_json();
    }
    return j;
}

Json ToolSpec::to_json() const {
    Json j = {{"name", name}, {"description", description}};
    j["parameters"] = Json::array();
    for (const auto& parameter : parameters) {
        j["parameters"].push_back(parameter.to_json());
    }
    return j;
}

ToolSpec tool_spec(const Tool& tool) {
    ToolSpec spec;
    spec.name = tool.name;
    spec.description = tool.description.value_or("");

    const InputSchema& schema = tool.input_schema;
    for (const auto& property : schema.properties) {
        ToolParameter parameter;
        parameter.name = property.name;
        parameter.type = property.type;
        parameter.description = property.description.value_or("");
        parameter.required = schema.is_required(property.name);
        parameter.default_value = property.default_value;

        if (property.is_array() && property.items) {
            ToolItemShape shape;
            shape.type = property.items->type;
            for (const auto& field : property.items->properties) {
                shape.properties.push_back(ToolItemField{
                    field.name, field.type, field.description.value_or("")});
            }
            for (const auto& field : property.items->properties) {
                if (property.items->is_required(field.name)) {
                    shape.required.push_back(field.name);
                }
            }
            parameter.items = std::move(shape);
        }

        spec.parameters.push_back(std::move(parameter));
    }
    return spec;
}

// ═══════════════════════════════════════════════════════════════════════════
// Invocation
// ═══════════════════════════════════════════════════════════════════════════

ClientResult<std::string> invoke(Connection& connection,
                                 const std::string& tool_name,
                                 const std::vector<Json>& positional) {
    auto params = prepare_call(connection, tool_name, positional);
    if (!params) {
        return tl::unexpected(params.error());
    }

    MCPLINK_LOG_DEBUG("Calling tool '" + tool_name + "' on '" + connection.name() + "'");
    auto result = connection.request(method::ToolsCall, std::move(*params));
    if (!result) {
        return tl::unexpected(tool_failure(tool_name, result.error()));
    }
    return extract_text(*result);
}

ClientResult<std::int64_t> invoke_async(Connection& connection,
                                        const std::string& tool_name,
                                        const std::vector<Json>& positional,
                                        Connection::Callback<std::string> on_done) {
    auto params = prepare_call(connection, tool_name, positional);
    if (!params) {
        return tl::unexpected(params.error());
    }

    return connection.request_async(method::ToolsCall, std::move(*params),
        [tool_name, on_done = std::move(on_done)](ClientResult<Json> result) {
            if (!on_done) {
                return;
            }
            if (!result) {
                on_done(tl::unexpected(tool_failure(tool_name, result.error())));
                return;
            }
            on_done(extract_text(*result));
        });
}

}  // namespace mcplink
