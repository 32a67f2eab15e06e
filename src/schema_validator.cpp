#include "mcphost/schema_validator.hpp"
#include <algorithm>
#include <cmath>

namespace mcphost {

namespace {

bool matches_type(const std::string& type, const nlohmann::json& value) {
    if (type == "object")  return value.is_object();
    if (type == "array")   return value.is_array();
    if (type == "string")  return value.is_string();
    if (type == "boolean") return value.is_boolean();
    if (type == "null")    return value.is_null();
    if (type == "number")  return value.is_number();
    if (type == "integer") {
        if (value.is_number_integer()) return true;
        if (value.is_number_float()) {
            double d = value.get<double>();
            return std::isfinite(d) && std::floor(d) == d;
        }
        return false;
    }
    return true;  // unknown type names do not constrain
}

// Non-negative integer keyword value (minLength, maxItems, ...).
bool is_count(const nlohmann::json& v) {
    return v.is_number_integer() && v.get<int64_t>() >= 0;
}

std::string join_path(const std::string& base, const std::string& key) {
    return base.empty() ? key : base + "." + key;
}

std::string short_repr(const nlohmann::json& value) {
    std::string s = value.dump();
    if (s.size() > 64) s = s.substr(0, 61) + "...";
    return s;
}

} // anonymous namespace

void to_json(nlohmann::json& j, const ValidationIssue& v) {
    j = {{"path", v.path}, {"expected", v.expected}, {"actual", v.actual},
         {"message", v.message}};
}

std::string json_type_name(const nlohmann::json& value) {
    switch (value.type()) {
        case nlohmann::json::value_t::object:          return "object";
        case nlohmann::json::value_t::array:           return "array";
        case nlohmann::json::value_t::string:          return "string";
        case nlohmann::json::value_t::boolean:         return "boolean";
        case nlohmann::json::value_t::number_integer:
        case nlohmann::json::value_t::number_unsigned: return "integer";
        case nlohmann::json::value_t::number_float:    return "number";
        case nlohmann::json::value_t::null:            return "null";
        default:                                       return "unknown";
    }
}

std::vector<ValidationIssue>
JsonSchemaValidator::validate(const nlohmann::json& schema, const nlohmann::json& value) const {
    std::vector<ValidationIssue> issues;
    if (schema.is_object()) {
        check(schema, value, "", issues);
    }
    return issues;
}

void JsonSchemaValidator::check(const nlohmann::json& schema, const nlohmann::json& value,
                                const std::string& path,
                                std::vector<ValidationIssue>& out) const {
    if (!schema.is_object()) return;

    if (auto it = schema.find("type"); it != schema.end()) {
        std::vector<std::string> types;
        if (it->is_string()) {
            types.push_back(it->get<std::string>());
        } else if (it->is_array()) {
            for (const auto& t : *it) {
                if (t.is_string()) types.push_back(t.get<std::string>());
            }
        }
        if (!types.empty() &&
            std::none_of(types.begin(), types.end(),
                         [&](const std::string& t) { return matches_type(t, value); })) {
            std::string expected;
            for (const auto& t : types) {
                if (!expected.empty()) expected += "|";
                expected += t;
            }
            out.push_back({path, expected, json_type_name(value),
                           "expected " + expected + ", got " + json_type_name(value)});
            return;  // nested keywords are meaningless on the wrong type
        }
    }

    if (auto it = schema.find("enum"); it != schema.end() && it->is_array()) {
        if (std::find(it->begin(), it->end(), value) == it->end()) {
            out.push_back({path, "one of " + it->dump(), short_repr(value),
                           "value is not one of the allowed values"});
        }
    }

    if (auto it = schema.find("const"); it != schema.end() && *it != value) {
        out.push_back({path, it->dump(), short_repr(value), "value does not equal the constant"});
    }

    if (value.is_number()) {
        double d = value.get<double>();
        if (auto it = schema.find("minimum"); it != schema.end() && it->is_number()
            && d < it->get<double>()) {
            out.push_back({path, ">= " + it->dump(), value.dump(), "value is below the minimum"});
        }
        if (auto it = schema.find("maximum"); it != schema.end() && it->is_number()
            && d > it->get<double>()) {
            out.push_back({path, "<= " + it->dump(), value.dump(), "value is above the maximum"});
        }
    }

    if (value.is_string()) {
        auto len = value.get_ref<const std::string&>().size();
        if (auto it = schema.find("minLength"); it != schema.end() && is_count(*it)
            && len < it->get<size_t>()) {
            out.push_back({path, "length >= " + it->dump(), std::to_string(len),
                           "string is too short"});
        }
        if (auto it = schema.find("maxLength"); it != schema.end() && is_count(*it)
            && len > it->get<size_t>()) {
            out.push_back({path, "length <= " + it->dump(), std::to_string(len),
                           "string is too long"});
        }
    }

    if (value.is_object()) {
        const auto properties = schema.value("properties", nlohmann::json::object());

        if (auto it = schema.find("required"); it != schema.end() && it->is_array()) {
            for (const auto& name : *it) {
                if (!name.is_string()) continue;
                const auto& key = name.get_ref<const std::string&>();
                if (!value.contains(key)) {
                    std::string expected = "present";
                    if (properties.contains(key) && properties.at(key).contains("type")) {
                        expected = properties.at(key).at("type").dump();
                    }
                    out.push_back({join_path(path, key), expected, "missing",
                                   "required property '" + key + "' is missing"});
                }
            }
        }

        for (auto prop = value.begin(); prop != value.end(); ++prop) {
            auto sub = properties.find(prop.key());
            if (sub != properties.end()) {
                check(*sub, prop.value(), join_path(path, prop.key()), out);
                continue;
            }
            auto extra = schema.find("additionalProperties");
            if (extra == schema.end()) continue;
            if (extra->is_boolean() && !extra->get<bool>()) {
                out.push_back({join_path(path, prop.key()), "no such property", "present",
                               "unexpected property '" + prop.key() + "'"});
            } else if (extra->is_object()) {
                check(*extra, prop.value(), join_path(path, prop.key()), out);
            }
        }
    }

    if (value.is_array()) {
        if (auto it = schema.find("minItems"); it != schema.end() && is_count(*it)
            && value.size() < it->get<size_t>()) {
            out.push_back({path, "at least " + it->dump() + " items",
                           std::to_string(value.size()), "array has too few items"});
        }
        if (auto it = schema.find("maxItems"); it != schema.end() && is_count(*it)
            && value.size() > it->get<size_t>()) {
            out.push_back({path, "at most " + it->dump() + " items",
                           std::to_string(value.size()), "array has too many items"});
        }
        if (auto it = schema.find("items"); it != schema.end() && it->is_object()) {
            for (size_t i = 0; i < value.size(); ++i) {
                check(*it, value[i], path + "[" + std::to_string(i) + "]", out);
            }
        }
    }
}

} // namespace mcphost
