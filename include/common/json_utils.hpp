#pragma once

#include <boost/lexical_cast.hpp>
#include <nlohmann/json.hpp>
#include <stdexcept>
#include <string>

namespace nlohmann {

namespace detail_path {

inline const json *step(const json *ref, const std::string &key) {
    if (ref && ref->is_object() && ref->count(key)) return &ref->at(key);
    return nullptr;
}

inline const json *step(const json *ref, std::size_t index) {
    if (ref && ref->is_array() && index < ref->size()) return &ref->at(index);
    return nullptr;
}

template <typename... Keys>
const json *locate(const json &j, Keys &&...keys) {
    const json *ref = j.is_null() ? nullptr : &j;
    ((ref = step(ref, keys)), ...);
    return ref;
}

}  // namespace detail_path

/**
 * @brief 判断 json 中是否存在路径 keys，且对应值不为 null
 * @code{.cpp}
 *     exists(body, "kwargs", "submission_data")
 * @endcode
 */
template <typename... Keys>
bool exists(const json &j, Keys &&...keys) {
    const json *ref = detail_path::locate(j, keys...);
    return ref && !ref->is_null();
}

template <typename... Keys>
std::invalid_argument build_invalid_argument(const json &j, Keys &&...keys) {
    std::string msg = "Unexpected value type of: ";
    ((msg += boost::lexical_cast<std::string>(keys) + "."), ...);
    msg += " in " + j.dump();
    return std::invalid_argument(msg);
}

/**
 * @brief 访问路径 keys 对应的值
 * @throw std::invalid_argument 若路径不存在
 */
template <typename... Keys>
const json &access(const json &j, Keys &&...keys) {
    const json *ref = detail_path::locate(j, keys...);
    if (!ref)
        throw build_invalid_argument(j, keys...);
    else
        return *ref;
}

template <typename T, typename... Keys>
T get_value(const json &j, Keys &&...keys) {
    const json &res = access(j, keys...);
    try {
        return res.get<T>();
    } catch (json::exception &e) {
        throw build_invalid_argument(j, keys...);
    }
}

/**
 * @brief 读取路径 keys 对应的值，不存在或者为 null 时返回 def_value
 * @throw std::invalid_argument 若值存在但类型不对
 */
template <typename T, typename... Keys>
T get_value_def(const json &j, const T &def_value, Keys &&...keys) {
    const json *ref = detail_path::locate(j, keys...);
    if (!ref || ref->is_null()) return def_value;
    try {
        return ref->get<T>();
    } catch (json::exception &e) {
        throw build_invalid_argument(j, keys...);
    }
}

}  // namespace nlohmann
