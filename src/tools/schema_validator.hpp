#pragma once

#include <string>
#include <nlohmann/json.hpp>
#include "core/errors/agent_errors.hpp"

namespace strand::tools {

// Checks tool arguments against the JSON-schema subset tools declare:
// type, properties, required, enum, items, additionalProperties=false.
// Errors name the offending path, e.g. "$.a: expected number".
class SchemaValidator {
public:
    core::errors::Result<nlohmann::json> validate(const nlohmann::json& schema,
                                                  const nlohmann::json& value) const;

    // Rejects schemas the validator cannot interpret.
    core::errors::Result<nlohmann::json> check_schema(const nlohmann::json& schema) const;

private:
    static bool matches_type(const std::string& type, const nlohmann::json& value);
    bool validate_node(const nlohmann::json& schema, const nlohmann::json& value,
                       const std::string& path, std::string& failure) const;
};

}  // namespace strand::tools
