#include "common/JsonUtils.h"

namespace LSE {

std::string JsonUtils::getString(const json &object, const std::string &key, const std::string &defaultValue) {
    if (!object.is_object()) {
        return defaultValue;
    }

    auto it = object.find(key);
    if (it == object.end() || !it->is_string()) {
        return defaultValue;
    }

    return it->get<std::string>();
}

int64_t JsonUtils::getInt(const json &object, const std::string &key, int64_t defaultValue) {
    if (!object.is_object()) {
        return defaultValue;
    }

    auto it = object.find(key);
    if (it == object.end() || !it->is_number_integer()) {
        return defaultValue;
    }

    return it->get<int64_t>();
}

std::optional<std::string> JsonUtils::getOptionalString(const json &object, const std::string &key) {
    if (!object.is_object()) {
        return std::nullopt;
    }

    auto it = object.find(key);
    if (it == object.end() || !it->is_string()) {
        return std::nullopt;
    }

    return it->get<std::string>();
}

std::optional<int64_t> JsonUtils::getOptionalInt(const json &object, const std::string &key) {
    if (!object.is_object()) {
        return std::nullopt;
    }

    auto it = object.find(key);
    if (it == object.end() || !it->is_number_integer()) {
        return std::nullopt;
    }

    return it->get<int64_t>();
}

bool JsonUtils::isMergeable(const json &delta) {
    return delta.is_null() || delta.is_object();
}

json JsonUtils::shallowMerge(const json &base, const json &delta) {
    json merged = base;
    if (delta.is_object()) {
        merged.update(delta);
    }
    return merged;
}

}  // namespace LSE
