#ifndef MODLINT_JSON_UTILS_HPP
#define MODLINT_JSON_UTILS_HPP

/**
 * @file json_utils.hpp
 * @brief nlohmann/json helpers returning Result instead of throwing.
 */

#include "modlint/result.hpp"
#include "modlint/error.hpp"

#include <nlohmann/json.hpp>

#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>
#include <string_view>

namespace modlint::json_utils {

    namespace fs = std::filesystem;
    using json = nlohmann::json;

    inline Result<json, Error> parse(std::string_view content) {
        try {
            return Result<json, Error>::success(json::parse(content));
        } catch (const json::parse_error& e) {
            return Result<json, Error>::failure(
                Error::parse_error("JSON parse error", e.what())
            );
        }
    }

    /**
     * Reads and parses a JSON file.
     */
    inline Result<json, Error> read_file(const fs::path& path) {
        if (std::error_code ec; !fs::is_regular_file(path, ec)) {
            return Result<json, Error>::failure(
                Error::not_found("JSON file not found", path.string())
            );
        }

        std::ifstream file(path);
        if (!file) {
            return Result<json, Error>::failure(
                Error::io_error("Failed to open JSON file", path.string())
            );
        }

        std::ostringstream buffer;
        buffer << file.rdbuf();
        auto parsed = parse(buffer.str());
        if (parsed.is_err()) {
            return Result<json, Error>::failure(parsed.error().with_context(path.string()));
        }
        return parsed;
    }

    /**
     * @param indent -1 for compact output.
     */
    inline std::string to_string(const json& data, const int indent = -1) {
        return data.dump(indent);
    }

    /**
     * Value of key, or an error when it is missing or has the wrong type.
     */
    template<typename T>
    Result<T, Error> get(const json& obj, const std::string& key) {
        if (!obj.contains(key)) {
            return Result<T, Error>::failure(
                Error::not_found("JSON key not found", key)
            );
        }

        try {
            return Result<T, Error>::success(obj.at(key).get<T>());
        } catch (const json::type_error& e) {
            return Result<T, Error>::failure(
                Error::parse_error("JSON type mismatch", key + ": " + e.what())
            );
        }
    }

}  // namespace modlint::json_utils

#endif // MODLINT_JSON_UTILS_HPP
