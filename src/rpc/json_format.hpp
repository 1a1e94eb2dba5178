// Copyright (c) 2021 MIT Digital Currency Initiative,
//                    Federal Reserve Bank of Boston
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

/**
 * \file json_format.hpp
 * Conversions between C++ values and jsoncpp values: \ref to_json for RPC
 * parameters and \ref json_decoder for typed RPC results.
 */

#ifndef BTCRPC_SRC_RPC_JSON_FORMAT_H_
#define BTCRPC_SRC_RPC_JSON_FORMAT_H_

#include <cstdint>
#include <json/json.h>
#include <map>
#include <optional>
#include <string>
#include <type_traits>
#include <utility>
#include <variant>
#include <vector>

namespace btcrpc::rpc {
    template<typename T>
    auto to_json(const std::optional<T>& val) -> Json::Value;

    template<typename T>
    auto to_json(const std::vector<T>& vec) -> Json::Value;

    /// Converts any value jsoncpp can represent directly (booleans, numbers,
    /// strings, Json::Value).
    template<typename T>
    auto to_json(const T& val) -> typename std::
        enable_if_t<std::is_constructible_v<Json::Value, const T&>,
                    Json::Value> {
        return Json::Value(val);
    }

    /// Converts a value which provides its own `to_json()` member.
    template<typename T>
    auto to_json(const T& val) -> decltype(val.to_json()) {
        return val.to_json();
    }

    /// Converts an optional value: null if empty.
    template<typename T>
    auto to_json(const std::optional<T>& val) -> Json::Value {
        if(!val.has_value()) {
            return Json::Value(Json::nullValue);
        }
        return to_json(val.value());
    }

    /// Converts a vector to a JSON array, each element in-order.
    template<typename T>
    auto to_json(const std::vector<T>& vec) -> Json::Value {
        auto arr = Json::Value(Json::arrayValue);
        for(const auto& elem : vec) {
            arr.append(to_json(elem));
        }
        return arr;
    }

    /// Builds a positional parameter array from the arguments, in-order.
    template<typename... Targs>
    auto make_params(const Targs&... args) -> Json::Value {
        auto params = Json::Value(Json::arrayValue);
        (params.append(to_json(args)), ...);
        return params;
    }

    /// \brief Decodes a JSON value into a T.
    ///
    /// The primary template delegates to
    /// `static auto T::from_json(const Json::Value&) -> std::optional<T>`.
    /// Specializations below cover the standard types a daemon returns.
    /// \tparam T the type to decode.
    template<typename T>
    struct json_decoder {
        static auto decode(const Json::Value& val) -> std::optional<T> {
            return T::from_json(val);
        }
    };

    /// Identity decoder; accepts any value.
    template<>
    struct json_decoder<Json::Value> {
        static auto decode(const Json::Value& val)
            -> std::optional<Json::Value> {
            return val;
        }
    };

    /// Decodes JSON null, for calls that return nothing.
    template<>
    struct json_decoder<std::monostate> {
        static auto decode(const Json::Value& val)
            -> std::optional<std::monostate> {
            if(!val.isNull()) {
                return std::nullopt;
            }
            return std::monostate{};
        }
    };

    template<>
    struct json_decoder<bool> {
        static auto decode(const Json::Value& val) -> std::optional<bool> {
            if(!val.isBool()) {
                return std::nullopt;
            }
            return val.asBool();
        }
    };

    template<>
    struct json_decoder<std::string> {
        static auto decode(const Json::Value& val)
            -> std::optional<std::string> {
            if(!val.isString()) {
                return std::nullopt;
            }
            return val.asString();
        }
    };

    /// Accepts integral numbers within the int32_t range.
    template<>
    struct json_decoder<int32_t> {
        static auto decode(const Json::Value& val) -> std::optional<int32_t> {
            if(!val.isInt()) {
                return std::nullopt;
            }
            return static_cast<int32_t>(val.asInt());
        }
    };

    /// Accepts integral numbers within the int64_t range.
    template<>
    struct json_decoder<int64_t> {
        static auto decode(const Json::Value& val) -> std::optional<int64_t> {
            if(!val.isInt64()) {
                return std::nullopt;
            }
            return static_cast<int64_t>(val.asInt64());
        }
    };

    /// Accepts non-negative integral numbers within the uint64_t range.
    template<>
    struct json_decoder<uint64_t> {
        static auto decode(const Json::Value& val)
            -> std::optional<uint64_t> {
            if(!val.isUInt64()) {
                return std::nullopt;
            }
            return static_cast<uint64_t>(val.asUInt64());
        }
    };

    template<>
    struct json_decoder<double> {
        static auto decode(const Json::Value& val) -> std::optional<double> {
            if(!val.isNumeric()) {
                return std::nullopt;
            }
            return val.asDouble();
        }
    };

    /// JSON null decodes to an empty optional, anything else must decode
    /// as T.
    template<typename T>
    struct json_decoder<std::optional<T>> {
        static auto decode(const Json::Value& val)
            -> std::optional<std::optional<T>> {
            if(val.isNull()) {
                return std::optional<T>();
            }
            auto inner = json_decoder<T>::decode(val);
            if(!inner.has_value()) {
                return std::nullopt;
            }
            return std::optional<T>(std::move(inner.value()));
        }
    };

    /// Decodes a JSON array. Fails if any element fails to decode.
    template<typename T>
    struct json_decoder<std::vector<T>> {
        static auto decode(const Json::Value& val)
            -> std::optional<std::vector<T>> {
            if(!val.isArray()) {
                return std::nullopt;
            }
            auto ret = std::vector<T>();
            ret.reserve(val.size());
            for(const auto& elem : val) {
                auto dec = json_decoder<T>::decode(elem);
                if(!dec.has_value()) {
                    return std::nullopt;
                }
                ret.emplace_back(std::move(dec.value()));
            }
            return ret;
        }
    };

    /// Decodes a JSON object keyed by string. Fails if any value fails to
    /// decode.
    template<typename T>
    struct json_decoder<std::map<std::string, T>> {
        static auto decode(const Json::Value& val)
            -> std::optional<std::map<std::string, T>> {
            if(!val.isObject()) {
                return std::nullopt;
            }
            auto ret = std::map<std::string, T>();
            for(const auto& key : val.getMemberNames()) {
                auto dec = json_decoder<T>::decode(val[key]);
                if(!dec.has_value()) {
                    return std::nullopt;
                }
                ret.emplace(key, std::move(dec.value()));
            }
            return ret;
        }
    };

    /// Shorthand for json_decoder<T>::decode.
    template<typename T>
    auto from_json(const Json::Value& val) -> std::optional<T> {
        return json_decoder<T>::decode(val);
    }
}

#endif
