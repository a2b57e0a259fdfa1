//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#ifndef DDPRPC_CLI_CONFIG_HPP_INCLUDED
#define DDPRPC_CLI_CONFIG_HPP_INCLUDED

#include <cetl/cetl.hpp>
#include <cetl/pf17/cetlpf.hpp>

#include <chrono>
#include <memory>
#include <string>

namespace ddprpc
{
namespace cli
{

/// Configuration of the CLI tool (TOML file).
///
class Config
{
public:
    using Ptr = std::shared_ptr<Config>;

    static constexpr auto DefaultFilePath = "./ddprpc.toml";
    static constexpr auto ApiKeyEnvVar    = "TRUENAS_API_KEY";

    /// Loads configuration from the given file.
    ///
    /// @throws std::exception (`toml::file_io_error`, `toml::syntax_error`) if the file can't be read or parsed.
    ///
    CETL_NODISCARD static Ptr make(const std::string& file_path);

    /// Parses configuration from the given TOML text (the file name is used in error messages only).
    ///
    CETL_NODISCARD static Ptr makeFromString(const std::string& content, const std::string& file_name);

    Config(const Config&)                = delete;
    Config(Config&&) noexcept            = delete;
    Config& operator=(const Config&)     = delete;
    Config& operator=(Config&&) noexcept = delete;

    virtual ~Config() = default;

    CETL_NODISCARD virtual auto getServerAddress() const -> cetl::optional<std::string> = 0;

    /// API key with `${VAR}` references expanded; falls back to `TRUENAS_API_KEY` environment variable.
    CETL_NODISCARD virtual auto getServerApiKey() const -> std::string = 0;

    CETL_NODISCARD virtual auto getCallTimeout() const -> std::chrono::milliseconds     = 0;
    CETL_NODISCARD virtual auto getJobPollInterval() const -> std::chrono::milliseconds = 0;

    /// Max total wait of a job; `nullopt` if unlimited (configured as zero).
    CETL_NODISCARD virtual auto getJobMaxWait() const -> cetl::optional<std::chrono::milliseconds> = 0;

    CETL_NODISCARD virtual auto getLoggingFile() const -> cetl::optional<std::string>       = 0;
    CETL_NODISCARD virtual auto getLoggingLevel() const -> cetl::optional<std::string>      = 0;
    CETL_NODISCARD virtual auto getLoggingFlushLevel() const -> cetl::optional<std::string> = 0;

protected:
    Config() = default;

};  // Config

/// Expands `${VAR}` references with values of the environment variables.
///
/// References to undefined variables (and unterminated ones) are left as is.
///
std::string expandEnvVars(const std::string& text);

}  // namespace cli
}  // namespace ddprpc

#endif  // DDPRPC_CLI_CONFIG_HPP_INCLUDED
