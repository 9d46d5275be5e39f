#include "tools/schema_validator.hpp"

#include <cmath>
#include "protocol/json_codec.hpp"

namespace strand::tools {

using core::errors::AgentError;
using core::errors::ErrorCategory;
using nlohmann::json;

namespace {

bool is_known_type(const std::string& type) {
    return type == "object" || type == "string" || type == "number" ||
           type == "integer" || type == "boolean" || type == "array" ||
           type == "null";
}

}  // namespace

bool SchemaValidator::matches_type(const std::string& type, const json& value) {
    if (type == "object") return value.is_object();
    if (type == "string") return value.is_string();
    if (type == "number") return value.is_number();
    if (type == "boolean") return value.is_boolean();
    if (type == "array") return value.is_array();
    if (type == "null") return value.is_null();
    if (type == "integer") {
        if (value.is_number_integer()) {
            return true;
        }
        if (value.is_number_float()) {
            const double d = value.get<double>();
            return std::isfinite(d) && std::floor(d) == d;
        }
        return false;
    }
    return false;
}

bool SchemaValidator::validate_node(const json& schema, const json& value,
                                    const std::string& path,
                                    std::string& failure) const {
    if (!schema.is_object()) {
        return true;
    }

    auto type_it = schema.find("type");
    if (type_it != schema.end()) {
        bool type_ok = false;
        std::string expected;
        if (type_it->is_string()) {
            expected = type_it->get<std::string>();
            type_ok = matches_type(expected, value);
        } else if (type_it->is_array()) {
            for (const auto& candidate : *type_it) {
                if (!candidate.is_string()) {
                    continue;
                }
                if (!expected.empty()) {
                    expected += "|";
                }
                expected += candidate.get<std::string>();
                type_ok = type_ok || matches_type(candidate.get<std::string>(), value);
            }
        }
        if (!type_ok) {
            failure = path + ": expected " + expected + ", got " + value.type_name();
            return false;
        }
    }

    auto enum_it = schema.find("enum");
    if (enum_it != schema.end() && enum_it->is_array()) {
        bool found = false;
        for (const auto& allowed : *enum_it) {
            if (allowed == value) {
                found = true;
                break;
            }
        }
        if (!found) {
            failure = path + ": value " + protocol::to_line(value) + " is not one of " +
                      protocol::to_line(*enum_it);
            return false;
        }
    }

    if (value.is_object()) {
        auto required_it = schema.find("required");
        if (required_it != schema.end() && required_it->is_array()) {
            for (const auto& field : *required_it) {
                if (field.is_string() && !value.contains(field.get<std::string>())) {
                    failure = path + ": missing required field '" +
                              field.get<std::string>() + "'";
                    return false;
                }
            }
        }

        auto props_it = schema.find("properties");
        const bool closed = schema.contains("additionalProperties") &&
                            schema["additionalProperties"].is_boolean() &&
                            !schema["additionalProperties"].get<bool>();
        for (auto it = value.begin(); it != value.end(); ++it) {
            const std::string child_path = path + "." + it.key();
            if (props_it != schema.end() && props_it->is_object() &&
                props_it->contains(it.key())) {
                if (!validate_node((*props_it)[it.key()], it.value(), child_path,
                                   failure)) {
                    return false;
                }
            } else if (closed) {
                failure = child_path + ": unexpected field";
                return false;
            }
        }
    }

    if (value.is_array()) {
        auto items_it = schema.find("items");
        if (items_it != schema.end()) {
            for (std::size_t i = 0; i < value.size(); ++i) {
                if (!validate_node(*items_it, value[i],
                                   path + "[" + std::to_string(i) + "]", failure)) {
                    return false;
                }
            }
        }
    }

    return true;
}

core::errors::Result<json> SchemaValidator::validate(const json& schema,
                                                     const json& value) const {
    std::string failure;
    if (!validate_node(schema, value, "$", failure)) {
        return AgentError{ErrorCategory::Validation, failure, "invalid_arguments"};
    }
    return value;
}

core::errors::Result<json> SchemaValidator::check_schema(const json& schema) const {
    if (!schema.is_object()) {
        return AgentError{ErrorCategory::Validation,
                          "Parameter schema must be a JSON object.",
                          "invalid_schema"};
    }
    auto type_it = schema.find("type");
    if (type_it != schema.end()) {
        bool known = type_it->is_string() && is_known_type(type_it->get<std::string>());
        if (type_it->is_array() && !type_it->empty()) {
            known = true;
            for (const auto& candidate : *type_it) {
                known = known && candidate.is_string() &&
                        is_known_type(candidate.get<std::string>());
            }
        }
        if (!known) {
            return AgentError{ErrorCategory::Validation,
                              "Unsupported schema type: " + type_it->dump(),
                              "invalid_schema"};
        }
    }
    auto props_it = schema.find("properties");
    if (props_it != schema.end()) {
        if (!props_it->is_object()) {
            return AgentError{ErrorCategory::Validation,
                              "Schema 'properties' must be an object.",
                              "invalid_schema"};
        }
        for (auto it = props_it->begin(); it != props_it->end(); ++it) {
            auto nested = check_schema(it.value());
            if (core::errors::is_error(nested)) {
                return nested;
            }
        }
    }
    auto required_it = schema.find("required");
    if (required_it != schema.end() && !required_it->is_array()) {
        return AgentError{ErrorCategory::Validation,
                          "Schema 'required' must be an array.", "invalid_schema"};
    }
    return schema;
}

}  // namespace strand::tools
