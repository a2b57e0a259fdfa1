//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#include "config.hpp"

#include <cetl/pf17/cetlpf.hpp>

#include <spdlog/spdlog.h>
#include <toml.hpp>

#include <chrono>
#include <cstdint>
#include <cstdlib>
#include <exception>
#include <memory>
#include <sstream>
#include <string>
#include <utility>

namespace ddprpc
{
namespace cli
{
namespace
{

constexpr std::int64_t DefaultCallTimeoutMs     = 30000;
constexpr std::int64_t DefaultJobPollIntervalMs = 2000;
constexpr std::int64_t DefaultJobMaxWaitMs      = 30LL * 60LL * 1000LL;  // 30 minutes

class ConfigImpl final : public Config
{
public:
    using TomlConf  = toml::ordered_type_config;
    using TomlValue = toml::basic_value<TomlConf>;

    explicit ConfigImpl(TomlValue&& root)
        : root_{std::move(root)}
    {
    }

    // Config

    auto getServerAddress() const -> cetl::optional<std::string> override
    {
        auto address = findImpl<std::string>("server", "address");
        if (address && address->empty())
        {
            return cetl::nullopt;
        }
        return address;
    }

    auto getServerApiKey() const -> std::string override
    {
        auto api_key = expandEnvVars(find_or(root_, "server", "api_key", std::string{}));
        if (api_key.empty())
        {
            if (const auto* const env_api_key = std::getenv(ApiKeyEnvVar))
            {
                api_key = env_api_key;
            }
        }
        return api_key;
    }

    auto getCallTimeout() const -> std::chrono::milliseconds override
    {
        return std::chrono::milliseconds{findPositiveMs("call_timeout_ms", DefaultCallTimeoutMs)};
    }

    auto getJobPollInterval() const -> std::chrono::milliseconds override
    {
        return std::chrono::milliseconds{findPositiveMs("job_poll_interval_ms", DefaultJobPollIntervalMs)};
    }

    auto getJobMaxWait() const -> cetl::optional<std::chrono::milliseconds> override
    {
        const auto max_wait_ms = findImpl<std::int64_t>("rpc", "job_max_wait_ms").value_or(DefaultJobMaxWaitMs);
        if (max_wait_ms <= 0)
        {
            return cetl::nullopt;
        }
        return std::chrono::milliseconds{max_wait_ms};
    }

    auto getLoggingFile() const -> cetl::optional<std::string> override
    {
        return findImpl<std::string>("logging", "file");
    }

    auto getLoggingLevel() const -> cetl::optional<std::string> override
    {
        return findImpl<std::string>("logging", "level");
    }

    auto getLoggingFlushLevel() const -> cetl::optional<std::string> override
    {
        return findImpl<std::string>("logging", "flush_level");
    }

private:
    template <typename T, typename... Keys>
    cetl::optional<T> findImpl(Keys&&... keys) const
    {
        try
        {
            return cetl::make_optional(toml::find<T>(root_, std::forward<Keys>(keys)...));

        } catch (const std::exception&)
        {
            // Missing key (or a value of another type).
            return cetl::nullopt;
        }
    }

    std::int64_t findPositiveMs(const char* const key, const std::int64_t default_ms) const
    {
        const auto value_ms = findImpl<std::int64_t>("rpc", key);
        if (value_ms && (*value_ms <= 0))
        {
            spdlog::warn("Ignoring non-positive 'rpc.{}' value ({}).", key, *value_ms);
            return default_ms;
        }
        return value_ms.value_or(default_ms);
    }

    TomlValue root_;

};  // ConfigImpl

}  // namespace

Config::Ptr Config::make(const std::string& file_path)
{
    auto root = toml::parse<ConfigImpl::TomlConf>(file_path);
    return std::make_shared<ConfigImpl>(std::move(root));
}

Config::Ptr Config::makeFromString(const std::string& content, const std::string& file_name)
{
    std::istringstream stream{content};
    auto               root = toml::parse<ConfigImpl::TomlConf>(stream, file_name);
    return std::make_shared<ConfigImpl>(std::move(root));
}

std::string expandEnvVars(const std::string& text)
{
    std::string result;
    result.reserve(text.size());

    std::size_t pos = 0;
    while (pos < text.size())
    {
        const auto ref_begin = text.find("${", pos);
        if (ref_begin == std::string::npos)
        {
            break;
        }
        const auto ref_end = text.find('}', ref_begin + 2);
        if (ref_end == std::string::npos)
        {
            spdlog::warn("Unterminated environment variable reference in config value.");
            break;
        }

        result.append(text, pos, ref_begin - pos);

        const auto var_name = text.substr(ref_begin + 2, ref_end - ref_begin - 2);
        if (const auto* const var_value = var_name.empty() ? nullptr : std::getenv(var_name.c_str()))
        {
            result.append(var_value);
        }
        else
        {
            spdlog::warn("Environment variable '{}' is not defined - reference is left as is.", var_name);
            result.append(text, ref_begin, ref_end - ref_begin + 1);
        }
        pos = ref_end + 1;
    }
    result.append(text, pos, std::string::npos);
    return result;
}

}  // namespace cli
}  // namespace ddprpc
