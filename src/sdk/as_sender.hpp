//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#ifndef DDPRPC_SDK_AS_SENDER_HPP_INCLUDED
#define DDPRPC_SDK_AS_SENDER_HPP_INCLUDED

#include "logging.hpp"

#include <ddprpc/sdk/execution.hpp>

#include <functional>
#include <string>
#include <utility>

namespace ddprpc
{
namespace sdk
{

/// Adapter of a deferred client operation to be used as a sender.
///
/// The operation is not started until the sender is submitted.
///
template <typename Result>
class AsSender final : public SenderOf<Result>
{
public:
    using Receiver  = std::function<void(Result&&)>;
    using Operation = std::function<void(Receiver&&)>;

    AsSender(std::string op_name, Operation&& operation, common::LoggerPtr logger)
        : op_name_{std::move(op_name)}
        , operation_{std::move(operation)}
        , logger_{std::move(logger)}
    {
    }

    void submitImpl(Receiver&& receiver) override
    {
        logger_->trace("Submitting `{}` operation.", op_name_);

        // The sender might be gone by the time of the result, hence copies of the name and the logger.
        operation_([op_name = op_name_, logger = logger_, receiver = std::move(receiver)](Result&& result) mutable {
            //
            logger->trace("Received result of `{}` operation.", op_name);
            receiver(std::move(result));
        });
    }

private:
    std::string       op_name_;
    Operation         operation_;
    common::LoggerPtr logger_;

};  // AsSender

}  // namespace sdk
}  // namespace ddprpc

#endif  // DDPRPC_SDK_AS_SENDER_HPP_INCLUDED
