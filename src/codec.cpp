#include "mcphost/codec.hpp"
#include "mcphost/error.hpp"
#include "mcphost/version.hpp"
#include <nlohmann/json.hpp>
#include <simdjson.h>
#include <cstdint>
#include <limits>
#include <string>

namespace mcphost {

namespace {

nlohmann::json simdjson_to_nlohmann(simdjson::ondemand::value val) {
    switch (val.type()) {
        case simdjson::ondemand::json_type::object: {
            nlohmann::json obj = nlohmann::json::object();
            for (auto field : val.get_object()) {
                std::string_view key = field.unescaped_key();
                obj[std::string(key)] = simdjson_to_nlohmann(field.value());
            }
            return obj;
        }
        case simdjson::ondemand::json_type::array: {
            nlohmann::json arr = nlohmann::json::array();
            for (auto elem : val.get_array()) {
                arr.push_back(simdjson_to_nlohmann(elem.value()));
            }
            return arr;
        }
        case simdjson::ondemand::json_type::string: {
            std::string_view sv = val.get_string();
            return nlohmann::json(std::string(sv));
        }
        case simdjson::ondemand::json_type::number: {
            auto as_int = val.get_int64();
            if (as_int.error() == simdjson::SUCCESS) {
                return nlohmann::json(as_int.value());
            }
            auto as_uint = val.get_uint64();
            if (as_uint.error() == simdjson::SUCCESS) {
                return nlohmann::json(as_uint.value());
            }
            return nlohmann::json(val.get_double().value());
        }
        case simdjson::ondemand::json_type::boolean:
            return nlohmann::json(val.get_bool().value());
        case simdjson::ondemand::json_type::null:
        default:
            return nlohmann::json(nullptr);
    }
}

// Scalar documents ("42", "true") have no value handle in ondemand.
nlohmann::json scalar_document(simdjson::ondemand::document& doc) {
    switch (doc.type()) {
        case simdjson::ondemand::json_type::string:
            return nlohmann::json(std::string(std::string_view(doc.get_string())));
        case simdjson::ondemand::json_type::number:
            return nlohmann::json(double(doc.get_double()));
        case simdjson::ondemand::json_type::boolean:
            return nlohmann::json(bool(doc.get_bool()));
        default:
            return nlohmann::json(nullptr);
    }
}

} // anonymous namespace

nlohmann::json Codec::parse_json(std::string_view raw) {
    if (raw.empty()) {
        throw McpParseError("Empty input");
    }

    simdjson::ondemand::parser parser;
    simdjson::padded_string padded(raw.data(), raw.size());

    simdjson::ondemand::document doc;
    auto error = parser.iterate(padded).get(doc);
    if (error) {
        throw McpParseError(std::string("JSON parse error: ") + simdjson::error_message(error));
    }

    try {
        nlohmann::json j;
        bool scalar = false;
        if (doc.is_scalar().get(scalar) == simdjson::SUCCESS && scalar) {
            j = scalar_document(doc);
        } else {
            auto val = doc.get_value();
            if (val.error()) {
                throw McpParseError(std::string("JSON parse error: ") +
                                    simdjson::error_message(val.error()));
            }
            j = simdjson_to_nlohmann(val.value());
        }
        if (!doc.at_end()) {
            throw McpParseError("JSON parse error: trailing content");
        }
        return j;
    } catch (const McpParseError&) {
        throw;
    } catch (const simdjson::simdjson_error& e) {
        throw McpParseError(std::string("JSON parse error: ") + e.what());
    }
}

JsonRpcMessage Codec::parse_object(const nlohmann::json& j) {
    nlohmann::json id = j.contains("id") ? j.at("id") : nlohmann::json(nullptr);
    if (!id.is_null() && !id.is_string() && !id.is_number_integer()) {
        throw McpInvalidRequestError("Request ID must be an integer or a string");
    }
    // Ids above INT64_MAX cannot be echoed back unchanged.
    if (id.is_number_unsigned() &&
        id.get<uint64_t>() > static_cast<uint64_t>(std::numeric_limits<int64_t>::max())) {
        throw McpInvalidRequestError("Request ID is out of range");
    }

    auto version = j.find("jsonrpc");
    if (version == j.end()) {
        throw McpInvalidRequestError("Missing 'jsonrpc' field", id);
    }
    if (!version->is_string() || version->get<std::string>() != JSONRPC_VERSION) {
        throw McpInvalidRequestError("Invalid jsonrpc version, expected '2.0'", id);
    }

    bool has_id = j.contains("id");
    bool has_method = j.contains("method");

    if (has_method) {
        if (!j.at("method").is_string()) {
            throw McpInvalidRequestError("'method' must be a string", id);
        }
        if (j.contains("params") && !j.at("params").is_object() && !j.at("params").is_array()) {
            throw McpInvalidRequestError("'params' must be an object or an array", id);
        }
    }

    if (has_method && has_id) {
        if (id.is_null()) {
            throw McpInvalidRequestError("Request ID must not be null");
        }
        JsonRpcRequest req;
        from_json(id, req.id);
        req.method = j.at("method").get<std::string>();
        if (j.contains("params")) req.params = j.at("params");
        return req;
    } else if (has_method) {
        JsonRpcNotification notif;
        notif.method = j.at("method").get<std::string>();
        if (j.contains("params")) notif.params = j.at("params");
        return notif;
    } else if (has_id) {
        if (!j.contains("result") && !j.contains("error")) {
            throw McpInvalidRequestError("Response must carry 'result' or 'error'", id);
        }
        JsonRpcResponse resp;
        from_json(id, resp.id);
        if (j.contains("result")) resp.result = j.at("result");
        if (j.contains("error")) {
            try {
                resp.error = j.at("error").get<JsonRpcError>();
            } catch (const nlohmann::json::exception& e) {
                throw McpInvalidRequestError(std::string("Malformed error object: ") + e.what(), id);
            }
        }
        return resp;
    }
    throw McpInvalidRequestError("Cannot determine message type: missing both 'id' and 'method'");
}

JsonRpcMessage Codec::parse(std::string_view raw) {
    nlohmann::json j = parse_json(raw);
    if (j.is_array()) {
        throw McpInvalidRequestError("Batch requests are not supported");
    }
    if (!j.is_object()) {
        throw McpInvalidRequestError("Message must be a JSON object");
    }
    return parse_object(j);
}

std::string Codec::serialize(const JsonRpcMessage& msg) {
    nlohmann::json j;
    to_json(j, msg);
    return j.dump();
}

} // namespace mcphost
