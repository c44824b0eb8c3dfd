// Copyright (c) 2023, QuantStack and Mamba Contributors
//
// Distributed under the terms of the BSD 3-Clause License.
//
// The full license is in the file LICENSE, distributed with this software.

#ifndef TAKEOUT_CORE_AUTH_PROVIDER_HPP
#define TAKEOUT_CORE_AUTH_PROVIDER_HPP

#include <string>

#include "takeout/core/auth_session.hpp"
#include "takeout/core/error_handling.hpp"

namespace takeout
{
    /// Who the session is for. Providers are free to ignore any of it.
    struct Credentials
    {
        std::string account = "";
        std::string job_id = "";
    };

    /**
     * Obtains a fresh AuthSession by whatever mean (replaying a captured
     * request, a browser, a cache, ...).
     *
     * Calls may be slow or interactive, they are made synchronously.
     */
    class AuthProvider
    {
    public:

        virtual ~AuthProvider() = default;

        AuthProvider(const AuthProvider&) = delete;
        AuthProvider& operator=(const AuthProvider&) = delete;
        AuthProvider(AuthProvider&&) = delete;
        AuthProvider& operator=(AuthProvider&&) = delete;

        /// Never throws, exceptions of the implementation become errors.
        expected_t<AuthSession> refresh(const Credentials& credentials);

    protected:

        AuthProvider() = default;

    private:

        virtual expected_t<AuthSession> refresh_impl(const Credentials& credentials) = 0;
    };
}

#endif
