/*
 * certrun - Certification Session Engine
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "validate.hpp"
#include "certrun/errors.hpp"

namespace certrun {

namespace {
std::string keyName(const std::string& key) {
    return "key '" + key + "'";
}

const Json& requireNonNull(const Json& obj, const std::string& key) {
    const Json& value = requireKey(obj, key);
    if (value.is_null()) {
        throw CorruptedSessionError("Value of " + keyName(key) + " cannot be None");
    }
    return value;
}

[[noreturn]] void wrongType(const std::string& what, const Json& value) {
    throw CorruptedSessionError("Value of " + what + " is of incorrect type " + value.type_name());
}

bool matchesType(const Json& value, Json::value_t type) {
    switch (type) {
        case Json::value_t::number_integer:
        case Json::value_t::number_unsigned:
            return value.is_number_integer();
        case Json::value_t::number_float:
            return value.is_number();
        default:
            return value.type() == type;
    }
}
}

const Json& requireKey(const Json& obj, const std::string& key) {
    if (!obj.is_object()) {
        wrongType("object", obj);
    }
    auto it = obj.find(key);
    if (it == obj.end()) {
        throw CorruptedSessionError("Missing value for " + keyName(key));
    }
    return *it;
}

const Json& requireObject(const Json& obj, const std::string& key) {
    const Json& value = requireNonNull(obj, key);
    if (!value.is_object()) {
        wrongType(keyName(key), value);
    }
    return value;
}

const Json& requireArray(const Json& obj, const std::string& key) {
    const Json& value = requireNonNull(obj, key);
    if (!value.is_array()) {
        wrongType(keyName(key), value);
    }
    return value;
}

std::string requireString(const Json& obj, const std::string& key) {
    const Json& value = requireNonNull(obj, key);
    if (!value.is_string()) {
        wrongType(keyName(key), value);
    }
    return value.get<std::string>();
}

std::optional<std::string> nullableString(const Json& obj, const std::string& key) {
    const Json& value = requireKey(obj, key);
    if (value.is_null()) {
        return std::nullopt;
    }
    if (!value.is_string()) {
        wrongType(keyName(key), value);
    }
    return value.get<std::string>();
}

std::optional<long long> nullableInteger(const Json& obj, const std::string& key) {
    const Json& value = requireKey(obj, key);
    if (value.is_null()) {
        return std::nullopt;
    }
    if (!value.is_number_integer()) {
        wrongType(keyName(key), value);
    }
    return value.get<long long>();
}

std::optional<double> nullableNumber(const Json& obj, const std::string& key) {
    const Json& value = requireKey(obj, key);
    if (value.is_null()) {
        return std::nullopt;
    }
    if (!value.is_number()) {
        wrongType(keyName(key), value);
    }
    return value.get<double>();
}

std::vector<std::string> requireStringList(const Json& obj, const std::string& key) {
    std::vector<std::string> items;
    for (const auto& item : requireArray(obj, key)) {
        if (!item.is_string()) {
            throw CorruptedSessionError("Each item of " + keyName(key) + " must be a string");
        }
        items.push_back(item.get<std::string>());
    }
    return items;
}

void requireType(const Json& value, Json::value_t type, const std::string& what) {
    if (!matchesType(value, type)) {
        wrongType(what, value);
    }
}

}
