// Copyright (c) 2023, QuantStack and Mamba Contributors
//
// Distributed under the terms of the BSD 3-Clause License.
//
// The full license is in the file LICENSE, distributed with this software.

#include "takeout/core/error_handling.hpp"

namespace takeout
{
    const char* name_of(takeout_error_code ec) noexcept
    {
        switch (ec)
        {
            case takeout_error_code::configuration_error:
                return "configuration error";
            case takeout_error_code::state_store_failure:
                return "state store failure";
            case takeout_error_code::auth_failure:
                return "authentication failure";
            case takeout_error_code::capture_parse_error:
                return "capture parse error";
            case takeout_error_code::download_failure:
                return "download failure";
            case takeout_error_code::user_interrupted:
                return "user interrupted";
            case takeout_error_code::incorrect_usage:
                return "incorrect usage";
            case takeout_error_code::lockfile_failure:
                return "lockfile failure";
            case takeout_error_code::internal_failure:
                return "internal failure";
            case takeout_error_code::unknown:
            default:
                return "unknown error";
        }
    }

    takeout_error::takeout_error(const std::string& msg, takeout_error_code ec)
        : base_type(msg)
        , m_error_code(ec)
    {
    }

    takeout_error::takeout_error(const char* msg, takeout_error_code ec)
        : base_type(msg)
        , m_error_code(ec)
    {
    }

    takeout_error_code takeout_error::error_code() const noexcept
    {
        return m_error_code;
    }

    tl::unexpected<takeout_error> make_unexpected(const char* msg, takeout_error_code ec)
    {
        return tl::make_unexpected(takeout_error(msg, ec));
    }

    tl::unexpected<takeout_error> make_unexpected(const std::string& msg, takeout_error_code ec)
    {
        return tl::make_unexpected(takeout_error(msg, ec));
    }
}
