// Copyright (c) 2021 MIT Digital Currency Initiative,
//                    Federal Reserve Bank of Boston
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "envelope.hpp"

#include <memory>

namespace btcrpc::rpc {
    namespace {
        auto make_writer_builder() -> Json::StreamWriterBuilder {
            auto builder = Json::StreamWriterBuilder();
            builder["indentation"] = "";
            // Enough digits for any amount, without rounding away smaller
            // values.
            builder["precision"] = 16;
            builder["precisionType"] = "significant";
            return builder;
        }

        auto make_reader_builder() -> Json::CharReaderBuilder {
            auto builder = Json::CharReaderBuilder();
            Json::CharReaderBuilder::strictMode(&builder.settings_);
            // Duplicate keys are accepted, the last one wins.
            builder["rejectDupKeys"] = false;
            return builder;
        }

        auto parse_error(const Json::Value& val)
            -> std::optional<std::optional<api_error>> {
            if(val.isNull()) {
                return std::optional<api_error>();
            }
            if(!val.isObject()) {
                return std::nullopt;
            }
            if(!val.isMember(code_key) || !val.isMember(message_key)) {
                return std::nullopt;
            }
            const auto& code = val[code_key];
            const auto& message = val[message_key];
            if(!code.isInt64() || !message.isString()) {
                return std::nullopt;
            }
            return std::optional<api_error>(
                api_error{code.asInt64(), message.asString()});
        }
    }

    auto make_request(const std::string& method, Json::Value params)
        -> Json::Value {
        if(params.isNull()) {
            params = Json::Value(Json::arrayValue);
        } else if(!params.isArray()) {
            auto wrapped = Json::Value(Json::arrayValue);
            wrapped.append(std::move(params));
            params = std::move(wrapped);
        }

        auto req = Json::Value(Json::objectValue);
        req[jsonrpc_key] = json_rpc_version;
        req[method_key] = method;
        req[params_key] = std::move(params);
        req[id_key] = request_id;
        return req;
    }

    auto encode_request(const std::string& method, Json::Value params)
        -> std::string {
        static const auto builder = make_writer_builder();
        return Json::writeString(builder,
                                 make_request(method, std::move(params)));
    }

    auto parse_response(const std::string& raw)
        -> std::optional<response_envelope> {
        static const auto builder = make_reader_builder();
        auto reader
            = std::unique_ptr<Json::CharReader>(builder.newCharReader());

        auto root = Json::Value();
        std::string errs;
        const auto* begin = raw.data();
        if(!reader->parse(begin, begin + raw.size(), &root, &errs)) {
            return std::nullopt;
        }

        if(!root.isObject() || !root.isMember(result_key)
           || !root.isMember(error_key)) {
            return std::nullopt;
        }

        auto err = parse_error(root[error_key]);
        if(!err.has_value()) {
            return std::nullopt;
        }

        return response_envelope{root[result_key], std::move(err.value())};
    }
}
