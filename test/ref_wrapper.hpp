//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#ifndef DDPRPC_REF_WRAPPER_HPP_INCLUDED
#define DDPRPC_REF_WRAPPER_HPP_INCLUDED

namespace ddprpc
{

/// Owning facade of a (non-owned) mock.
///
/// Lets a test keep the mock on its stack, while the code under test owns the interface by `unique_ptr`.
/// Destruction of the facade is reported to the mock as `deinit()` call.
///
template <typename Interface, typename Reference>
struct RefWrapper : Interface
{
    explicit RefWrapper(Reference& reference)
        : reference_{reference}
    {
    }

    RefWrapper(const RefWrapper& other)          = delete;
    RefWrapper(RefWrapper&&) noexcept            = delete;
    RefWrapper& operator=(const RefWrapper&)     = delete;
    RefWrapper& operator=(RefWrapper&&) noexcept = delete;

    ~RefWrapper() override
    {
        reference_.deinit();
    }

    Reference& reference()
    {
        return reference_;
    }

    const Reference& reference() const
    {
        return reference_;
    }

private:
    Reference& reference_;

};  // RefWrapper

}  // namespace ddprpc

#endif  // DDPRPC_REF_WRAPPER_HPP_INCLUDED
