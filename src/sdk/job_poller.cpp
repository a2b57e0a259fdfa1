//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#include "job_poller.hpp"

#include <ddprpc/sdk/error.hpp>

#include "common_helpers.hpp"
#include "json_helpers.hpp"
#include "logging.hpp"
#include "rpc/correlator.hpp"

#include <cetl/cetl.hpp>
#include <cetl/pf17/cetlpf.hpp>
#include <libcyphal/executor.hpp>
#include <libcyphal/types.hpp>

#include <spdlog/fmt/fmt.h>

#include <cerrno>
#include <cstddef>
#include <memory>
#include <string>
#include <utility>

namespace ddprpc
{
namespace sdk
{
namespace
{

std::string describeJobError(const Json& error)
{
    if (error.is_null())
    {
        return "Unknown error";
    }
    if (error.is_string())
    {
        return error.get<std::string>();
    }
    return common::toCompactString(error);
}

class JobPollerImpl final : public JobPoller, public std::enable_shared_from_this<JobPollerImpl>
{
public:
    JobPollerImpl(libcyphal::IExecutor&        executor,
                  common::rpc::Correlator::Ptr correlator,
                  Json                         job_id,
                  const Options&               options)
        : executor_{executor}
        , correlator_{std::move(correlator)}
        , job_id_{std::move(job_id)}
        , job_id_str_{jobIdToString(job_id_)}
        , options_{options}
        , logger_{common::getLogger("sdk")}
        , poll_count_{0}
        , is_done_{false}
    {
        CETL_DEBUG_ASSERT(correlator_, "");
        logger_->trace("JobPoller(job={}).", job_id_str_);
    }

    JobPollerImpl(const JobPollerImpl&)                = delete;
    JobPollerImpl(JobPollerImpl&&) noexcept            = delete;
    JobPollerImpl& operator=(const JobPollerImpl&)     = delete;
    JobPollerImpl& operator=(JobPollerImpl&&) noexcept = delete;

    ~JobPollerImpl() override
    {
        logger_->trace("~JobPoller(job={}, polls={}, done={}).", job_id_str_, poll_count_, is_done_);
    }

    // MARK: JobPoller

    void start(Completion completion) override
    {
        CETL_DEBUG_ASSERT(completion, "");
        CETL_DEBUG_ASSERT(!completion_, "Already started.");

        completion_ = std::move(completion);
        logger_->info("Waiting for job {} to complete...", job_id_str_);

        std::weak_ptr<JobPollerImpl> weak_self{shared_from_this()};

        poll_callback_ = executor_.registerCallback([weak_self](const auto&) {
            //
            if (const auto self = weak_self.lock())
            {
                self->poll();
            }
        });

        if (options_.max_wait)
        {
            const auto max_wait = *options_.max_wait;
            max_wait_callback_  = executor_.registerCallback([weak_self, max_wait](const auto&) {
                //
                if (const auto self = weak_self.lock())
                {
                    self->finish(Error::timeout(fmt::format("Job {} did not complete within {}ms",
                                                            self->job_id_str_,
                                                            common::toMillis(max_wait))));
                }
            });
            (void) max_wait_callback_.schedule(
                libcyphal::IExecutor::Callback::Schedule::Once{executor_.now() + max_wait});
        }

        poll();
    }

    void cancel() override
    {
        finish(Error::cancelled(fmt::format("Wait for job {} is cancelled", job_id_str_)));
    }

    void fail(const Error& error) override
    {
        finish(error);
    }

    CETL_NODISCARD std::size_t pollCount() const override
    {
        return poll_count_;
    }

    CETL_NODISCARD bool isDone() const override
    {
        return is_done_;
    }

private:
    void poll()
    {
        if (is_done_)
        {
            return;
        }

        ++poll_count_;
        logger_->trace("Polling job {} (poll #{}).", job_id_str_, poll_count_);

        // Filter: `[["id", "=", <job_id>]]`.
        const Json filter = Json::array({"id", "=", job_id_});
        Json       params = Json::array({Json::array({filter})});

        std::weak_ptr<JobPollerImpl> weak_self{shared_from_this()};
        correlator_->call(QueryMethod,
                          std::move(params),
                          options_.call_timeout,
                          [weak_self](common::rpc::Correlator::Call::Result&& result) {
                              //
                              if (const auto self = weak_self.lock())
                              {
                                  self->handlePollResult(std::move(result));
                              }
                          });
    }

    void scheduleNextPoll()
    {
        (void) poll_callback_.schedule(
            libcyphal::IExecutor::Callback::Schedule::Once{executor_.now() + options_.poll_interval});
    }

    void handlePollResult(common::rpc::Correlator::Call::Result&& result)
    {
        if (is_done_)
        {
            return;
        }

        if (const auto* const failure = cetl::get_if<common::rpc::Correlator::Call::Failure>(&result))
        {
            if (failure->kind == Error::Kind::Timeout)
            {
                logger_->warn("Job {} status query timed out - will retry.", job_id_str_);
                scheduleNextPoll();
                return;
            }
            logger_->error("Error checking job {} status ({}).", job_id_str_, *failure);
            finish(*failure);
            return;
        }

        const auto& jobs = cetl::get<common::rpc::Correlator::Call::Success>(result);
        if (!jobs.is_array())
        {
            finish(Error::jobFailed(EPROTO, fmt::format("Unexpected status of job {}", job_id_str_), jobs));
            return;
        }
        if (jobs.empty())
        {
            finish(Error::jobFailed(ENOENT, fmt::format("Job {} not found", job_id_str_)));
            return;
        }

        const auto& record = jobs.front();
        const auto  state  = record.is_object() ? record.find("state") : record.end();
        if ((state == record.end()) || !state->is_string())
        {
            finish(Error::jobFailed(EPROTO, fmt::format("Unexpected status of job {}", job_id_str_), record));
            return;
        }

        const auto job = Job::fromJson(record);
        logger_->debug("Job {} state: {}, progress: {}%{}{}.",
                       job_id_str_,
                       job.state_name,
                       job.progress_percent.value_or(0.0),
                       job.progress_description.empty() ? "" : " - ",
                       job.progress_description);

        switch (job.state)
        {
        case Job::State::Succeeded:
            logger_->info("Job {} completed successfully.", job_id_str_);
            finish(job.result);
            break;

        case Job::State::Failed:
            finish(Error::jobFailed(EREMOTEIO,
                                    fmt::format("Job {} failed: {}", job_id_str_, describeJobError(job.error)),
                                    job.error));
            break;

        case Job::State::Running:
            scheduleNextPoll();
            break;
        }
    }

    /// Completes the wait (only once), and releases own executor callbacks.
    ///
    void finish(Wait::Result&& result)
    {
        if (is_done_)
        {
            return;
        }
        is_done_ = true;
        poll_callback_.reset();
        max_wait_callback_.reset();

        if (const auto* const failure = cetl::get_if<Wait::Failure>(&result))
        {
            logger_->warn("Wait for job {} has ended ({}).", job_id_str_, *failure);
        }

        if (auto completion = std::move(completion_))
        {
            completion_ = nullptr;
            completion(std::move(result));
        }
    }

    libcyphal::IExecutor&               executor_;
    common::rpc::Correlator::Ptr        correlator_;
    const Json                          job_id_;
    const std::string                   job_id_str_;
    const Options                       options_;
    common::LoggerPtr                   logger_;
    std::size_t                         poll_count_;
    bool                                is_done_;
    Completion                          completion_;
    libcyphal::IExecutor::Callback::Any poll_callback_;
    libcyphal::IExecutor::Callback::Any max_wait_callback_;

};  // JobPollerImpl

}  // namespace

Job Job::fromJson(const Json& record)
{
    Job job{};
    if (!record.is_object())
    {
        return job;
    }

    job.id = record.value("id", Json{});

    job.state_name = common::getStringOr(record, "state", "");
    if (job.state_name == "SUCCESS")
    {
        job.state = State::Succeeded;
    }
    else if ((job.state_name == "FAILED") || (job.state_name == "ABORTED"))
    {
        job.state = State::Failed;
    }

    const auto progress = record.find("progress");
    if ((progress != record.end()) && progress->is_object())
    {
        const auto percent = progress->find("percent");
        if ((percent != progress->end()) && percent->is_number())
        {
            job.progress_percent = percent->get<double>();
        }
        job.progress_description = common::getStringOr(*progress, "description", "");
    }

    job.result = record.value("result", Json{});
    job.error  = record.value("error", Json{});
    if (job.error.is_null())
    {
        job.error = record.value("exception", Json{});
    }
    return job;
}

std::string jobIdToString(const Json& job_id)
{
    if (job_id.is_string())
    {
        return job_id.get<std::string>();
    }
    return common::toCompactString(job_id);
}

CETL_NODISCARD JobPoller::Ptr JobPoller::make(libcyphal::IExecutor&        executor,
                                              common::rpc::Correlator::Ptr correlator,
                                              Json                         job_id,
                                              const Options&               options)
{
    return std::make_shared<JobPollerImpl>(executor, std::move(correlator), std::move(job_id), options);
}

}  // namespace sdk
}  // namespace ddprpc
