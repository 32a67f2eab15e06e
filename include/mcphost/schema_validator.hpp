#pragma once
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

namespace mcphost {

/// One field-level validation failure.
struct ValidationIssue {
    std::string path;       // "" for the root, "a.b[2]" below it
    std::string expected;
    std::string actual;
    std::string message;

    bool operator==(const ValidationIssue& o) const {
        return path == o.path && expected == o.expected && actual == o.actual
               && message == o.message;
    }
};

void to_json(nlohmann::json& j, const ValidationIssue& v);

/// Checks a value against a tool input schema. Empty result means valid.
class ISchemaValidator {
public:
    virtual ~ISchemaValidator() = default;

    [[nodiscard]] virtual std::vector<ValidationIssue>
    validate(const nlohmann::json& schema, const nlohmann::json& value) const = 0;
};

/// Validator for the JSON Schema subset tool schemas use in practice:
/// type, properties, required, additionalProperties, items, enum, const,
/// minimum/maximum, minLength/maxLength, minItems/maxItems.
/// Keywords it does not know are ignored.
class JsonSchemaValidator : public ISchemaValidator {
public:
    std::vector<ValidationIssue>
    validate(const nlohmann::json& schema, const nlohmann::json& value) const override;

private:
    void check(const nlohmann::json& schema, const nlohmann::json& value,
               const std::string& path, std::vector<ValidationIssue>& out) const;
};

/// JSON Schema type name of a value ("integer" for whole numbers).
std::string json_type_name(const nlohmann::json& value);

} // namespace mcphost
