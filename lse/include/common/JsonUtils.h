#pragma once

#include <cstdint>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>

namespace LSE {

using json = nlohmann::json;

/**
 * @brief Context field helpers built on nlohmann/json
 *
 * Machine contexts are JSON objects. Domain helpers read typed fields through
 * these accessors so a missing or mistyped field falls back to a default
 * instead of throwing json::type_error.
 */
class JsonUtils {
public:
    /**
     * @brief Safely get string value from JSON object
     * @param object JSON object
     * @param key Key to lookup
     * @param defaultValue Default value if key doesn't exist or isn't a string
     * @return String value or default
     */
    static std::string getString(const json &object, const std::string &key, const std::string &defaultValue = "");

    /**
     * @brief Safely get integer value from JSON object
     * @param object JSON object
     * @param key Key to lookup
     * @param defaultValue Default value if key doesn't exist or isn't an integer
     * @return Integer value or default
     */
    static int64_t getInt(const json &object, const std::string &key, int64_t defaultValue = 0);

    /**
     * @brief Get a nullable string field
     * @return Value, or nullopt when the key is absent, null or not a string
     */
    static std::optional<std::string> getOptionalString(const json &object, const std::string &key);

    /**
     * @brief Get a nullable integer field
     * @return Value, or nullopt when the key is absent, null or not an integer
     */
    static std::optional<int64_t> getOptionalInt(const json &object, const std::string &key);

    /**
     * @brief Check whether a value can be merged into a context
     *
     * Only objects (field updates) and null (no update) qualify.
     */
    static bool isMergeable(const json &delta);

    /**
     * @brief Shallow merge of delta into a copy of base
     *
     * Top-level keys of delta replace those of base; nested objects are
     * replaced, not merged. A null delta returns base unchanged.
     *
     * @param base Object to merge into
     * @param delta Object or null
     * @return Merged copy
     */
    static json shallowMerge(const json &base, const json &delta);
};

}  // namespace LSE
