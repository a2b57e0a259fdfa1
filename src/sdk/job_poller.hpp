//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#ifndef DDPRPC_SDK_JOB_POLLER_HPP_INCLUDED
#define DDPRPC_SDK_JOB_POLLER_HPP_INCLUDED

#include <ddprpc/sdk/error.hpp>

#include "rpc/correlator.hpp"

#include <cetl/cetl.hpp>
#include <cetl/pf17/cetlpf.hpp>
#include <libcyphal/executor.hpp>
#include <libcyphal/types.hpp>

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>

namespace ddprpc
{
namespace sdk
{

/// Latest polled snapshot of a remote job.
///
struct Job final
{
    enum class State : std::uint8_t
    {
        Running,
        Succeeded,
        Failed,

    };  // State

    Json                   id;
    State                  state{State::Running};
    std::string            state_name;  // as reported by the server (f.e. "WAITING")
    cetl::optional<double> progress_percent;
    std::string            progress_description;
    Json                   result;
    Json                   error;

    /// Makes a snapshot out of a `core.get_jobs` record.
    ///
    /// `SUCCESS` maps to `Succeeded`; `FAILED` and `ABORTED` to `Failed`; anything else is `Running`.
    ///
    static Job fromJson(const Json& record);

};  // Job

/// Textual form of a job id (numbers as is, strings without quotes).
///
std::string jobIdToString(const Json& job_id);

/// Polls status of a remote job until it reaches a terminal state.
///
/// Each poll is a regular correlator call, so it is subject to its own timeout;
/// a timed out poll is not fatal, and the next one is scheduled as usual.
/// Any other call failure (f.e. connection loss) terminates the wait with the same error,
/// and so does a status record without `state` (as `JobFailed` with `EPROTO`).
///
class JobPoller
{
public:
    using Ptr = std::shared_ptr<JobPoller>;

    struct Options final
    {
        libcyphal::Duration                 poll_interval{std::chrono::seconds{2}};
        libcyphal::Duration                 call_timeout{std::chrono::seconds{30}};
        cetl::optional<libcyphal::Duration> max_wait;  // unlimited if `nullopt`

    };  // Options

    struct Wait final
    {
        using Success = Json;
        using Failure = Error;
        using Result  = cetl::variant<Success, Failure>;
    };
    using Completion = std::function<void(Wait::Result&&)>;

    static constexpr auto QueryMethod = "core.get_jobs";

    CETL_NODISCARD static Ptr make(libcyphal::IExecutor&        executor,
                                   common::rpc::Correlator::Ptr correlator,
                                   Json                         job_id,
                                   const Options&               options);

    JobPoller(const JobPoller&)                = delete;
    JobPoller(JobPoller&&) noexcept            = delete;
    JobPoller& operator=(const JobPoller&)     = delete;
    JobPoller& operator=(JobPoller&&) noexcept = delete;

    virtual ~JobPoller() = default;

    /// Starts polling (the first poll is issued immediately).
    ///
    /// The completion is called exactly once - with the job result, or with the failure.
    ///
    virtual void start(Completion completion) = 0;

    /// Stops waiting; the completion receives `Cancelled` error.
    virtual void cancel() = 0;

    /// Stops waiting with the given error.
    virtual void fail(const Error& error) = 0;

    CETL_NODISCARD virtual std::size_t pollCount() const = 0;
    CETL_NODISCARD virtual bool        isDone() const    = 0;

protected:
    JobPoller() = default;

};  // JobPoller

}  // namespace sdk
}  // namespace ddprpc

#endif  // DDPRPC_SDK_JOB_POLLER_HPP_INCLUDED
