//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#ifndef DDPRPC_SDK_FACTORY_HPP_INCLUDED
#define DDPRPC_SDK_FACTORY_HPP_INCLUDED

#include <ddprpc/sdk/client.hpp>

#include "rpc/pipe/client_pipe.hpp"

#include <cetl/cetl.hpp>
#include <libcyphal/executor.hpp>

namespace ddprpc
{
namespace sdk
{

struct Factory
{
    /// Makes a client on top of the given (not yet started) pipe.
    ///
    CETL_NODISCARD static Client::Ptr makeClient(libcyphal::IExecutor&              executor,
                                                 common::rpc::pipe::ClientPipe::Ptr client_pipe,
                                                 const Client::Options&             options);

};  // Factory

}  // namespace sdk
}  // namespace ddprpc

#endif  // DDPRPC_SDK_FACTORY_HPP_INCLUDED
