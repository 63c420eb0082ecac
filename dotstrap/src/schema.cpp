#include "schema.hpp"

#include "exception.hpp"

#include <format>

namespace fs = std::filesystem;

namespace {

const json& property_or_empty(const json& object, const char* key) {
    static const json empty = json::object();
    if (!object.is_object()) return empty;
    auto it = object.find(key);
    return it == object.end() ? empty : *it;
}

bool forbids_additional(const json& schema) {
    auto it = schema.find("additionalProperties");
    return it != schema.end() && it->is_boolean() && !it->get<bool>();
}

// Python-like rendering used in enum messages: strings quoted, others as JSON
std::string render_enum_value(const json& value) {
    if (value.is_string()) {
        return "'" + value.get<std::string>() + "'";
    }
    return value.dump();
}

std::string render_value(const json& value) {
    if (value.is_string()) {
        return value.get<std::string>();
    }
    return value.dump();
}

void validate_item(size_t index, const json& item, const json& item_schema, const std::string& array_key,
                   const SchemaOptions& options, std::vector<std::string>& errors) {
    const std::string where = std::format("{}[{}]", array_key, index);
    const json& properties = property_or_empty(item_schema, "properties");

    for (const auto& field : property_or_empty(item_schema, "required")) {
        if (field.is_string() && !item.contains(field.get<std::string>())) {
            errors.push_back(std::format("{}: missing required field: {}", where, field.get<std::string>()));
        }
    }

    if (forbids_additional(item_schema)) {
        for (const auto& [key, value] : item.items()) {
            if (!properties.contains(key)) {
                errors.push_back(std::format("{}: unexpected field: {}", where, key));
            }
        }
    }

    for (const auto& [field, prop_schema] : properties.items()) {
        auto it = item.find(field);
        if (it == item.end()) {
            continue;
        }
        const json& value = *it;

        if (!options.skip_type_check_fields.contains(field)) {
            auto type_it = prop_schema.find("type");
            if (type_it != prop_schema.end() && type_it->is_string()) {
                const std::string type = type_it->get<std::string>();
                if (!json_type_matches(value, type)) {
                    errors.push_back(std::format("{}.{}: must be a {}", where, field, type));
                } else if (type == "array") {
                    const json& items_schema = property_or_empty(prop_schema, "items");
                    auto item_type = items_schema.find("type");
                    if (item_type != items_schema.end() && item_type->is_string()) {
                        const std::string element_type = item_type->get<std::string>();
                        for (const auto& element : value) {
                            if (!json_type_matches(element, element_type)) {
                                errors.push_back(std::format("{}.{}: items must be {}s", where, field, element_type));
                            }
                        }
                    }
                }
            }
        }

        auto enum_it = prop_schema.find("enum");
        if (enum_it != prop_schema.end() && enum_it->is_array() && !enum_it->empty()) {
            bool found = false;
            std::string choices;
            for (const auto& choice : *enum_it) {
                if (choice == value) found = true;
                if (!choices.empty()) choices += ", ";
                choices += render_enum_value(choice);
            }
            if (!found) {
                errors.push_back(std::format("{}.{}: must be one of [{}], got '{}'", where, field, choices, render_value(value)));
            }
        }
    }

    if (options.item_validator) {
        options.item_validator(index, item, item_schema, errors);
    }
}

} // anonymous namespace

bool json_type_matches(const json& value, const std::string& type) {
    if (type == "string") return value.is_string();
    if (type == "array") return value.is_array();
    if (type == "object") return value.is_object();
    if (type == "boolean") return value.is_boolean();
    if (type == "integer") return value.is_number_integer();
    if (type == "number") return value.is_number();
    if (type == "null") return value.is_null();
    // Unknown type names are not enforced
    return true;
}

std::vector<std::string> validate_schema(const json& data, const json& schema, const std::string& array_key,
                                         const SchemaOptions& options) {
    std::vector<std::string> errors;

    if (!data.is_object()) {
        return {"root must be an object"};
    }

    for (const auto& key : property_or_empty(schema, "required")) {
        if (key.is_string() && !data.contains(key.get<std::string>())) {
            errors.push_back("missing required key: " + key.get<std::string>());
        }
    }

    const json& properties = property_or_empty(schema, "properties");
    if (forbids_additional(schema)) {
        for (const auto& [key, value] : data.items()) {
            if (!properties.contains(key)) {
                errors.push_back("unexpected key: " + key);
            }
        }
    }

    auto items_it = data.find(array_key);
    if (items_it == data.end() || items_it->is_null()) {
        return errors;
    }
    const json& items = *items_it;
    if (!items.is_array()) {
        errors.push_back("'" + array_key + "' must be an array");
        return errors;
    }

    const json& item_schema = property_or_empty(property_or_empty(properties, array_key.c_str()), "items");
    size_t index = 0;
    for (const auto& item : items) {
        if (!item.is_object()) {
            errors.push_back(std::format("{}[{}]: must be an object", array_key, index));
        } else {
            validate_item(index, item, item_schema, array_key, options, errors);
        }
        ++index;
    }

    if (options.extra_validator) {
        options.extra_validator(items, errors);
    }
    return errors;
}

std::vector<std::string> validate_schema_file(const fs::path& data_path, const fs::path& schema_path,
                                              const std::string& array_key, const SchemaOptions& options) {
    json data;
    try {
        data = read_json_file(data_path);
    } catch (const DotstrapException& e) {
        return {"cannot load " + data_path.filename().string() + ": " + e.what()};
    }

    json schema;
    try {
        schema = read_json_file(schema_path);
    } catch (const DotstrapException& e) {
        return {std::string("cannot load schema: ") + e.what()};
    }

    return validate_schema(data, schema, array_key, options);
}
