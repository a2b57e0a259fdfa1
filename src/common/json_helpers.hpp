//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#ifndef DDPRPC_COMMON_JSON_HELPERS_HPP_INCLUDED
#define DDPRPC_COMMON_JSON_HELPERS_HPP_INCLUDED

#include <ddprpc/sdk/types.hpp>

#include <string>
#include <utility>

namespace ddprpc
{
namespace common
{

/// Gets a string field of a JSON object.
///
/// Unlike `Json::value`, never throws: a missing field, a field of another type,
/// or a non-object `json` all result in the default value.
///
inline std::string getStringOr(const sdk::Json& json, const char* const key, std::string default_value)
{
    if (!json.is_object())
    {
        return default_value;
    }
    const auto found = json.find(key);
    if ((found != json.end()) && found->is_string())
    {
        return found->get<std::string>();
    }
    return default_value;
}

/// Compact single line text of the JSON value (for logging and error messages).
///
inline std::string toCompactString(const sdk::Json& json)
{
    return json.dump(-1, ' ', false, sdk::Json::error_handler_t::replace);
}

}  // namespace common
}  // namespace ddprpc

#endif  // DDPRPC_COMMON_JSON_HELPERS_HPP_INCLUDED
