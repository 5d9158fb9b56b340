/**
 * @file OutputShape.cpp
 * @brief Implementation of OutputShape.
 */

#include "domain/OutputShape.hpp"

namespace deepresearch::domain {

using json = nlohmann::json;

namespace {

json FieldSchema(const ShapeField& field) {
    json schema;
    switch (field.type) {
    case FieldType::String:
        schema = {{"type", "string"}};
        break;
    case FieldType::StringArray:
        schema = {{"type", "array"}, {"items", {{"type", "string"}}}};
        break;
    case FieldType::ObjectArray: {
        json properties = json::object();
        json required = json::array();
        for (const auto& item : field.itemFields) {
            properties[item.name] = FieldSchema(item);
            required.push_back(item.name);
        }
        schema = {
            {"type", "array"},
            {"items", {{"type", "object"}, {"properties", properties}, {"required", required}}}
        };
        break;
    }
    }
    if (!field.description.empty()) {
        schema["description"] = field.description;
    }
    return schema;
}

std::optional<std::string> CheckFields(const json& object,
                                       const std::vector<ShapeField>& fields,
                                       const std::string& path) {
    if (!object.is_object()) {
        return path + " is not an object";
    }
    for (const auto& field : fields) {
        std::string fieldPath = path + "." + field.name;
        auto it = object.find(field.name);
        if (it == object.end()) {
            return "missing field " + fieldPath;
        }
        const json& value = *it;
        switch (field.type) {
        case FieldType::String:
            if (!value.is_string()) return fieldPath + " is not a string";
            break;
        case FieldType::StringArray:
            if (!value.is_array()) return fieldPath + " is not an array";
            for (const auto& item : value) {
                if (!item.is_string()) return fieldPath + " contains a non-string item";
            }
            break;
        case FieldType::ObjectArray:
            if (!value.is_array()) return fieldPath + " is not an array";
            for (std::size_t i = 0; i < value.size(); ++i) {
                auto problem = CheckFields(value[i], field.itemFields, fieldPath + "[" + std::to_string(i) + "]");
                if (problem) return problem;
            }
            break;
        }
    }
    return std::nullopt;
}

} // namespace

OutputShape::OutputShape(std::string name, bool text, std::vector<ShapeField> fields)
    : m_name(std::move(name)), m_text(text), m_fields(std::move(fields)) {}

OutputShape OutputShape::Text(std::string name) {
    return OutputShape(std::move(name), true, {});
}

OutputShape OutputShape::Object(std::string name, std::vector<ShapeField> fields) {
    return OutputShape(std::move(name), false, std::move(fields));
}

json OutputShape::toJsonSchema() const {
    if (m_text) {
        return json::object();
    }
    json properties = json::object();
    json required = json::array();
    for (const auto& field : m_fields) {
        properties[field.name] = FieldSchema(field);
        required.push_back(field.name);
    }
    return {
        {"type", "object"},
        {"properties", properties},
        {"required", required}
    };
}

std::optional<std::string> OutputShape::validate(const json& value) const {
    if (m_text) {
        if (!value.is_string()) {
            return m_name + " must be a string";
        }
        return std::nullopt;
    }
    return CheckFields(value, m_fields, m_name);
}

} // namespace deepresearch::domain
