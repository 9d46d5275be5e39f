#include <gtest/gtest.h>
#include <nlohmann/json.hpp>
#include "core/errors/agent_errors.hpp"
#include "tools/schema_validator.hpp"

namespace {

using strand::core::errors::ErrorCategory;
using strand::core::errors::get_error;
using strand::core::errors::is_error;
using strand::tools::SchemaValidator;
using nlohmann::json;

const json kPointSchema = json::parse(R"({
    "type": "object",
    "properties": {
        "x": {"type": "integer"},
        "y": {"type": "number"},
        "label": {"type": ["string", "null"]},
        "unit": {"type": "string", "enum": ["cm", "mm"]},
        "tags": {"type": "array", "items": {"type": "string"}},
        "origin": {
            "type": "object",
            "properties": {"z": {"type": "boolean"}},
            "required": ["z"]
        }
    },
    "required": ["x", "y"],
    "additionalProperties": false
})");

TEST(SchemaValidatorTest, AcceptsValidDocument) {
    SchemaValidator validator;
    auto result = validator.validate(
        kPointSchema,
        json{{"x", 1}, {"y", 2.5}, {"label", nullptr}, {"unit", "cm"},
             {"tags", {"a", "b"}}, {"origin", {{"z", true}}}});
    EXPECT_FALSE(is_error(result));
}

TEST(SchemaValidatorTest, IntegerAcceptsWholeFloat) {
    SchemaValidator validator;
    EXPECT_FALSE(is_error(validator.validate(kPointSchema, json{{"x", 3.0}, {"y", 1}})));
    EXPECT_TRUE(is_error(validator.validate(kPointSchema, json{{"x", 3.5}, {"y", 1}})));
}

TEST(SchemaValidatorTest, ReportsMissingRequiredField) {
    SchemaValidator validator;
    auto result = validator.validate(kPointSchema, json{{"x", 1}});
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).category, ErrorCategory::Validation);
    EXPECT_EQ(get_error(result).code, "invalid_arguments");
    EXPECT_NE(get_error(result).message.find("'y'"), std::string::npos);
}

TEST(SchemaValidatorTest, ReportsWrongTypeWithPath) {
    SchemaValidator validator;
    auto result = validator.validate(kPointSchema, json{{"x", 1}, {"y", "two"}});
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).message, "$.y: expected number, got string");
}

TEST(SchemaValidatorTest, RejectsUnexpectedField) {
    SchemaValidator validator;
    auto result = validator.validate(kPointSchema, json{{"x", 1}, {"y", 2}, {"z", 3}});
    ASSERT_TRUE(is_error(result));
    EXPECT_NE(get_error(result).message.find("$.z"), std::string::npos);
}

TEST(SchemaValidatorTest, RejectsValueOutsideEnum) {
    SchemaValidator validator;
    auto result = validator.validate(kPointSchema, json{{"x", 1}, {"y", 2}, {"unit", "km"}});
    ASSERT_TRUE(is_error(result));
    EXPECT_NE(get_error(result).message.find("$.unit"), std::string::npos);
}

TEST(SchemaValidatorTest, ChecksArrayItemsAndNestedObjects) {
    SchemaValidator validator;
    auto bad_item =
        validator.validate(kPointSchema, json{{"x", 1}, {"y", 2}, {"tags", {"a", 7}}});
    ASSERT_TRUE(is_error(bad_item));
    EXPECT_NE(get_error(bad_item).message.find("$.tags[1]"), std::string::npos);

    auto bad_nested = validator.validate(
        kPointSchema, json{{"x", 1}, {"y", 2}, {"origin", json::object()}});
    ASSERT_TRUE(is_error(bad_nested));
    EXPECT_NE(get_error(bad_nested).message.find("$.origin"), std::string::npos);
}

TEST(SchemaValidatorTest, RejectsNonObjectArguments) {
    SchemaValidator validator;
    auto result = validator.validate(kPointSchema, json::array({1, 2}));
    ASSERT_TRUE(is_error(result));
    EXPECT_NE(get_error(result).message.find("expected object"), std::string::npos);
}

TEST(SchemaValidatorTest, CheckSchemaRejectsUnknownType) {
    SchemaValidator validator;
    EXPECT_FALSE(is_error(validator.check_schema(kPointSchema)));

    auto bad_type = validator.check_schema(json{{"type", "tuple"}});
    ASSERT_TRUE(is_error(bad_type));
    EXPECT_EQ(get_error(bad_type).code, "invalid_schema");

    auto not_object = validator.check_schema(json("object"));
    ASSERT_TRUE(is_error(not_object));
    EXPECT_EQ(get_error(not_object).code, "invalid_schema");
}

}  // namespace
