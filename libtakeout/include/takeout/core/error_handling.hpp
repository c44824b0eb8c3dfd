// Copyright (c) 2023, QuantStack and Mamba Contributors
//
// Distributed under the terms of the BSD 3-Clause License.
//
// The full license is in the file LICENSE, distributed with this software.

#ifndef TAKEOUT_CORE_ERROR_HANDLING_HPP
#define TAKEOUT_CORE_ERROR_HANDLING_HPP

#include <stdexcept>
#include <string>
#include <utility>

#include <tl/expected.hpp>

namespace takeout
{

    /*********************
     * Takeout exceptions *
     *********************/

    enum class takeout_error_code
    {
        unknown,
        configuration_error,
        state_store_failure,
        auth_failure,
        capture_parse_error,
        download_failure,
        user_interrupted,
        incorrect_usage,
        lockfile_failure,
        internal_failure
    };

    /// @returns The name of the error code, used when reporting errors to the user.
    const char* name_of(takeout_error_code ec) noexcept;

    class takeout_error : public std::runtime_error
    {
    public:

        using base_type = std::runtime_error;

        takeout_error(const std::string& msg, takeout_error_code ec);
        takeout_error(const char* msg, takeout_error_code ec);

        takeout_error_code error_code() const noexcept;

    private:

        takeout_error_code m_error_code;
    };

    /********************************
     * wrappers around tl::expected *
     ********************************/

    template <class T, class E = takeout_error>
    using expected_t = tl::expected<T, E>;

    /********************
     * helper functions *
     ********************/

    tl::unexpected<takeout_error> make_unexpected(const char* msg, takeout_error_code ec);

    tl::unexpected<takeout_error> make_unexpected(const std::string& msg, takeout_error_code ec);

    template <class T, class E>
    tl::unexpected<E> forward_error(const tl::expected<T, E>& exp);

    template <class T, class E>
    T& extract(tl::expected<T, E>& exp);

    template <class T, class E>
    const T& extract(const tl::expected<T, E>& exp);

    template <class T, class E>
    T&& extract(tl::expected<T, E>&& exp);

    template <class E>
    void extract(const tl::expected<void, E>& exp);

    /***********************************
     * helper functions implementation *
     ***********************************/

    template <class T, class E>
    tl::unexpected<E> forward_error(const tl::expected<T, E>& exp)
    {
        return tl::make_unexpected(exp.error());
    }

    namespace detail
    {
        template <class T>
        decltype(auto) extract_impl(T&& exp)
        {
            if (exp)
            {
                return std::forward<T>(exp).value();
            }
            else
            {
                throw exp.error();
            }
        }
    }

    template <class T, class E>
    T& extract(tl::expected<T, E>& exp)
    {
        return detail::extract_impl(exp);
    }

    template <class T, class E>
    const T& extract(const tl::expected<T, E>& exp)
    {
        return detail::extract_impl(exp);
    }

    template <class T, class E>
    T&& extract(tl::expected<T, E>&& exp)
    {
        return detail::extract_impl(std::move(exp));
    }

    template <class E>
    void extract(const tl::expected<void, E>& exp)
    {
        if (!exp)
        {
            throw exp.error();
        }
    }
}

#endif
