#pragma once

/**
 * @file schema_validate.hpp
 * @brief JSON Schema validation utilities
 */

#include "pkgsentry/common.hpp"

#include <filesystem>

#include <nlohmann/json.hpp>

namespace pkgsentry::common {

/**
 * Validate JSON against a JSON Schema file.
 *
 * @param j JSON document to validate
 * @param schema_path Path to JSON Schema file
 * @return Empty on success, error on failure
 */
[[nodiscard]] VoidResult validate_json(const nlohmann::json& j,
                                       const std::filesystem::path& schema_path);

}  // namespace pkgsentry::common
