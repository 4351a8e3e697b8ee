#pragma once

#include <boost/lexical_cast.hpp>
#include <nlohmann/json.hpp>
#include <optional>
#include <stdexcept>
#include <string>

namespace nlohmann {

template <typename... Keys>
json access_optional(const json &j, Keys &&...keys) {
    const json *ref = j.is_null() ? nullptr : &j;
    auto step = [&ref](const auto &key) {
        if (ref && ref->is_object() && ref->count(key))
            ref = &ref->at(key);
        else
            ref = nullptr;
    };
    (step(keys), ...);
    return !ref ? json{} : *ref;
}

template <typename... Keys>
std::invalid_argument build_invalid_argument(const json &j, Keys &&...keys) {
    std::string msg = "Unexpected value type of: ";
    ((msg += boost::lexical_cast<std::string>(keys) + "."), ...);
    msg += " in " + j.dump(2);
    return std::invalid_argument(msg);
}

/**
 * @brief 读取 j[keys...]，若不存在、为 null 或者类型不匹配，返回 def_value
 */
template <typename T, typename... Keys>
T get_value_def(const json &j, const T &def_value, Keys &&...keys) {
    json res = access_optional(j, keys...);
    if (res.is_null()) return def_value;
    try {
        return res.get<T>();
    } catch (json::exception &) {
        return def_value;
    }
}

/**
 * @brief 读取 j[keys...]，若不存在或为 null，返回 nullopt
 * @throw std::invalid_argument 若值存在但类型不匹配
 */
template <typename T, typename... Keys>
std::optional<T> get_optional(const json &j, Keys &&...keys) {
    json res = access_optional(j, keys...);
    if (res.is_null()) return std::nullopt;
    try {
        return res.get<T>();
    } catch (json::exception &) {
        throw build_invalid_argument(j, keys...);
    }
}

/**
 * @brief 读取 j[keys...]
 * @throw std::invalid_argument 若值不存在或者类型不匹配
 */
template <typename T, typename... Keys>
T get_value(const json &j, Keys &&...keys) {
    auto res = get_optional<T>(j, keys...);
    if (!res) throw build_invalid_argument(j, keys...);
    return *res;
}

/**
 * @brief 将 optional 写入 j[key]，nullopt 写入 null
 */
template <typename T>
void put_optional(json &j, const std::string &key, const std::optional<T> &value) {
    if (value)
        j[key] = *value;
    else
        j[key] = nullptr;
}

}  // namespace nlohmann
