/*
 * (C) 2025 The University of Chicago
 *
 * See COPYRIGHT in top-level directory.
 */
#ifndef KCORE_JSON_UTIL_H
#define KCORE_JSON_UTIL_H

#include "kcore/Exception.hpp"
#include "kcore/Offset.hpp"
#include "kcore/Compression.hpp"

#include <nlohmann/json.hpp>
#include <nlohmann/json-schema.hpp>
#include <fmt/format.h>
#include <sstream>
#include <string>
#include <string_view>
#include <vector>

namespace kcore {

struct JsonValidator {

    using ErrorList = std::vector<std::string>;

    nlohmann::json_schema::json_validator m_validator;

    JsonValidator(const nlohmann::json& schema) {
        m_validator.set_root_schema(schema);
    }

    JsonValidator(const char* schema) {
        m_validator.set_root_schema(nlohmann::json::parse(schema));
    }

    struct ErrorHandler : public nlohmann::json_schema::basic_error_handler {

        ErrorList m_errors;

        void error(const nlohmann::json::json_pointer &pointer,
                   const nlohmann::json &instance,
                   const std::string &message) override {
            nlohmann::json_schema::basic_error_handler::error(pointer, instance, message);
            std::stringstream ss;
            ss << "'" << pointer << "' - '" << instance << "': " << message;
            m_errors.push_back(std::move(ss).str());
        }
    };

    ErrorList validate(const nlohmann::json& json) const {
        ErrorHandler err;
        m_validator.validate(json, err);
        return std::move(err).m_errors;
    }

    /**
     * @brief Validates the json and throws an Exception listing the
     * errors, prefixed by what, if it does not comply.
     */
    void validateOrThrow(const nlohmann::json& json, std::string_view what) const {
        auto errors = validate(json);
        if(errors.empty()) return;
        std::stringstream ss;
        ss << "Invalid " << what << " configuration:";
        for(auto& e : errors) ss << "\n" << e;
        throw Exception{ss.str()};
    }
};

/**
 * @brief Parses an offset given as "earliest", "latest" or an integer.
 */
static inline Offset ParseOffset(const nlohmann::json& value) {
    if(value.is_string()) {
        auto& str = value.get_ref<const std::string&>();
        if(str == "earliest") return Offset::Earliest();
        if(str == "latest") return Offset::Latest();
        throw Exception{fmt::format(
            "Invalid offset \"{}\" (expected \"earliest\", \"latest\" or an integer)", str)};
    }
    if(value.is_number_integer())
        return Offset::Exact(value.get<int64_t>());
    throw Exception{fmt::format(
        "Invalid offset {} (expected \"earliest\", \"latest\" or an integer)", value.dump())};
}

/**
 * @brief Parses a codec given as a name or as {"type": name, "level": n}.
 */
static inline CompressionCodec ParseCompressionCodec(const nlohmann::json& value) {
    if(value.is_string())
        return CompressionCodec{compressionTypeFromName(value.get<std::string>()), std::nullopt};
    if(!value.is_object() || !value.contains("type") || !value["type"].is_string())
        throw Exception{fmt::format("Invalid compression codec {}", value.dump())};
    CompressionCodec codec{compressionTypeFromName(value["type"].get<std::string>()), std::nullopt};
    if(value.contains("level")) {
        if(!value["level"].is_number_integer())
            throw Exception{fmt::format("Invalid compression level {}", value["level"].dump())};
        codec.level = value["level"].get<int>();
    }
    return codec;
}

static inline nlohmann::json CompressionCodecToJson(const CompressionCodec& codec) {
    if(!codec.level) return compressionTypeName(codec.type);
    return nlohmann::json{{"type", compressionTypeName(codec.type)}, {"level", *codec.level}};
}

}

#endif
