#pragma once

#include "utils.hpp"

#include <filesystem>
#include <functional>
#include <set>
#include <string>
#include <vector>

struct SchemaOptions {
    // Fields whose value is intentionally polymorphic
    std::set<std::string> skip_type_check_fields;
    // Runs after the built-in checks of each object element
    std::function<void(size_t index, const json& item, const json& item_schema, std::vector<std::string>& errors)> item_validator;
    // Runs once over the whole array after the per-item checks
    std::function<void(const json& items, std::vector<std::string>& errors)> extra_validator;
};

// Validates `data` against a JSON-Schema subset describing one top-level
// object whose `array_key` property holds an array of objects. Every violation
// is collected; the order follows the declared order of the documents.
std::vector<std::string> validate_schema(const json& data, const json& schema,
                                         const std::string& array_key,
                                         const SchemaOptions& options = {});

std::vector<std::string> validate_schema_file(const std::filesystem::path& data_path,
                                              const std::filesystem::path& schema_path,
                                              const std::string& array_key,
                                              const SchemaOptions& options = {});

// True when `value` satisfies a JSON-Schema primitive type name
bool json_type_matches(const json& value, const std::string& type);
