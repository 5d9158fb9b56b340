/**
 * @file OutputShape.hpp
 * @brief Declared shape of a completion result (named fields with primitive/array types).
 */

#pragma once

#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace deepresearch::domain {

/**
 * @enum FieldType
 * @brief Types a shape field may declare.
 */
enum class FieldType {
    String,
    StringArray,
    ObjectArray ///< Array of objects whose fields are described by ShapeField::itemFields.
};

/**
 * @struct ShapeField
 * @brief One required field of a structured result.
 */
struct ShapeField {
    std::string name;
    FieldType type = FieldType::String;
    std::string description;
    std::vector<ShapeField> itemFields;
};

/**
 * @class OutputShape
 * @brief Describes what a completion call must return; either plain text or a JSON object.
 */
class OutputShape {
public:
    /** @brief A result that is a single string. */
    static OutputShape Text(std::string name);

    /** @brief A result that is a JSON object with the given required fields. */
    static OutputShape Object(std::string name, std::vector<ShapeField> fields);

    const std::string& name() const { return m_name; }
    bool isText() const { return m_text; }
    const std::vector<ShapeField>& fields() const { return m_fields; }

    /** @brief JSON schema of the object shape (empty object for text shapes). */
    nlohmann::json toJsonSchema() const;

    /**
     * @brief Checks a returned value against the shape.
     * @return Description of the first mismatch, or nullopt when the value conforms.
     */
    std::optional<std::string> validate(const nlohmann::json& value) const;

private:
    OutputShape(std::string name, bool text, std::vector<ShapeField> fields);

    std::string m_name;
    bool m_text = false;
    std::vector<ShapeField> m_fields;
};

} // namespace deepresearch::domain
