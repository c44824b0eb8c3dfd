// Copyright (c) 2023, QuantStack and Mamba Contributors
//
// Distributed under the terms of the BSD 3-Clause License.
//
// The full license is in the file LICENSE, distributed with this software.

#include "takeout/core/auth_provider.hpp"

namespace takeout
{
    expected_t<AuthSession> AuthProvider::refresh(const Credentials& credentials)
    {
        try
        {
            return refresh_impl(credentials);
        }
        catch (const takeout_error& e)
        {
            return tl::make_unexpected(e);
        }
        catch (const std::exception& e)
        {
            return make_unexpected(e.what(), takeout_error_code::auth_failure);
        }
    }
}
