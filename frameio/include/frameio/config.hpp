#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <nlohmann/json.hpp>
#include "types/result.hpp"

namespace frameio {

/// @brief Parse a backend selection record from text
/// @retval InvalidConfig Not valid JSON, or not a JSON object
[[nodiscard]] inline Result<nlohmann::json> parse_config(std::string_view text) noexcept {
    nlohmann::json record = nlohmann::json::parse(text.begin(), text.end(), nullptr, false);
    if (record.is_discarded()) {
        return Err(Error::Code::InvalidConfig, "backend record is not valid JSON");
    }
    if (!record.is_object()) {
        return Err(Error::Code::InvalidConfig, "backend record must be a JSON object");
    }
    return Ok(std::move(record));
}

namespace config {

    /// Read an optional boolean field; `out` keeps its default when the field is absent
    [[nodiscard]] inline Result<void> read_bool(const nlohmann::json& record,
                                                const char* key, bool& out) noexcept {
        auto it = record.find(key);
        if (it == record.end() || it->is_null()) {
            return Ok();
        }
        if (!it->is_boolean()) {
            return Err(Error::Code::InvalidConfig,
                       std::string("field '") + key + "' must be a boolean");
        }
        out = it->get<bool>();
        return Ok();
    }

    /// Read an optional positive integer field
    [[nodiscard]] inline Result<void> read_size(const nlohmann::json& record,
                                                const char* key, std::size_t& out) noexcept {
        auto it = record.find(key);
        if (it == record.end() || it->is_null()) {
            return Ok();
        }
        if (!it->is_number_integer() || it->get<int64_t>() <= 0) {
            return Err(Error::Code::InvalidConfig,
                       std::string("field '") + key + "' must be a positive integer");
        }
        out = static_cast<std::size_t>(it->get<int64_t>());
        return Ok();
    }

    /// The mandatory "id" field
    [[nodiscard]] inline Result<std::string> read_id(const nlohmann::json& record) noexcept {
        if (!record.is_object()) {
            return Err(Error::Code::InvalidConfig, "backend record must be a JSON object");
        }
        auto it = record.find("id");
        if (it == record.end()) {
            return Err(Error::Code::InvalidConfig, "backend record has no 'id' field");
        }
        if (!it->is_string()) {
            return Err(Error::Code::InvalidConfig, "backend 'id' must be a string");
        }
        return Ok(it->get<std::string>());
    }

} // namespace config

} // namespace frameio
