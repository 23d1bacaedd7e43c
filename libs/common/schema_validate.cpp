/**
 * @file schema_validate.cpp
 * @brief JSON Schema validation using valijson
 */

#include "pkgsentry/schema_validate.hpp"

#include <exception>
#include <format>
#include <string>
#include <string_view>
#include <vector>

#include <valijson/adapters/nlohmann_json_adapter.hpp>
#include <valijson/schema.hpp>
#include <valijson/schema_parser.hpp>
#include <valijson/validator.hpp>

namespace pkgsentry::common {

namespace {

// valijson resolves local references through "definitions" only.
void rewrite_defs(nlohmann::json& schema)
{
    if (schema.is_array()) {
        for (auto& value : schema) {
            rewrite_defs(value);
        }
        return;
    }
    if (!schema.is_object()) {
        return;
    }
    if (auto defs = schema.find("$defs"); defs != schema.end() && !schema.contains("definitions")) {
        schema["definitions"] = *defs;
    }
    for (auto& [key, value] : schema.items()) {
        if (key == "$ref" && value.is_string()) {
            constexpr std::string_view kPrefix = "#/$defs/";
            const auto& ref = value.get_ref<const std::string&>();
            if (ref.starts_with(kPrefix)) {
                value = "#/definitions/" + ref.substr(kPrefix.size());
            }
            continue;
        }
        rewrite_defs(value);
    }
}

[[nodiscard]] std::string describe_errors(valijson::ValidationResults& results)
{
    std::string text;
    valijson::ValidationResults::Error error;
    while (results.popError(error)) {
        std::string context;
        for (const auto& part : error.context) {
            context += "/" + part;
        }
        if (!text.empty()) {
            text += '\n';
        }
        text += std::format("{}: {}", context.empty() ? "/" : context, error.description);
    }
    return text.empty() ? std::string("Schema validation failed.") : text;
}

}  // namespace

VoidResult validate_json(const nlohmann::json& j, const std::filesystem::path& schema_path)
{
    auto schema_text = read_text_file(schema_path);
    if (!schema_text) {
        return std::unexpected(Error::make("SchemaFileOpenFailed",
                                           "Failed to open schema file: " + schema_path.string()));
    }

    nlohmann::json schema_json;
    try {
        schema_json = nlohmann::json::parse(*schema_text);
    } catch (const std::exception& ex) {
        return std::unexpected(Error::make(
            "SchemaParseFailed",
            std::format("Failed to parse schema {}: {}", schema_path.string(), ex.what())));
    }
    rewrite_defs(schema_json);

    valijson::Schema schema;
    try {
        valijson::SchemaParser parser;
        valijson::adapters::NlohmannJsonAdapter schema_adapter(schema_json);
        parser.populateSchema(schema_adapter, schema);
    } catch (const std::exception& ex) {
        return std::unexpected(
            Error::make("SchemaBuildFailed", std::string("Failed to build schema: ") + ex.what()));
    }

    valijson::Validator validator;
    valijson::ValidationResults results;
    valijson::adapters::NlohmannJsonAdapter target_adapter(j);
    if (!validator.validate(schema, target_adapter, &results)) {
        return std::unexpected(Error::make(error_code::kSchemaInvalid, describe_errors(results)));
    }
    return {};
}

}  // namespace pkgsentry::common
