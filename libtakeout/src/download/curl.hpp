// Copyright (c) 2023, QuantStack and Mamba Contributors
//
// Distributed under the terms of the BSD 3-Clause License.
//
// The full license is in the file LICENSE, distributed with this software.

#ifndef TAKEOUT_DL_CURL_HPP
#define TAKEOUT_DL_CURL_HPP

#include <array>
#include <map>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <type_traits>

extern "C"
{
#include <curl/curl.h>
}

#include <tl/expected.hpp>

#include "takeout/download/parameters.hpp"

namespace takeout::download
{
    /// Initialize libcurl globally, once per process.
    void init_curl_once();

    class curl_error : public std::runtime_error
    {
    public:

        explicit curl_error(const std::string& what);
    };

    class CURLHandle
    {
    public:

        CURLHandle();
        ~CURLHandle();

        CURLHandle(const CURLHandle&) = delete;
        CURLHandle& operator=(const CURLHandle&) = delete;

        CURLHandle(CURLHandle&&) = delete;
        CURLHandle& operator=(CURLHandle&&) = delete;

        template <class T>
        tl::expected<T, CURLcode> get_info(CURLINFO option) const;

        void configure_handle(const std::string& url, const RemoteFetchParams& params);

        void reset_handle();

        CURLHandle& add_header(const std::string& header);
        CURLHandle& reset_headers();

        template <class T>
        CURLHandle& set_opt(CURLoption opt, const T& val);

        CURLHandle& set_opt_header();

        const char* get_error_buffer() const;
        std::string get_curl_effective_url() const;

        CURLcode perform();

        static bool is_curl_res_ok(CURLcode res);
        static std::string get_res_error(CURLcode res);

    private:

        CURL* m_handle;
        curl_slist* p_headers = nullptr;
        std::array<char, CURL_ERROR_SIZE> m_errorbuffer;
    };

    template <>
    tl::expected<int, CURLcode> CURLHandle::get_info(CURLINFO option) const;

    template <>
    tl::expected<std::string, CURLcode> CURLHandle::get_info(CURLINFO option) const;

    /**************************************
     * CURLHandle template implementation *
     **************************************/

    template <class T>
    CURLHandle& CURLHandle::set_opt(CURLoption opt, const T& val)
    {
        CURLcode ok = CURLE_OK;
        if constexpr (std::is_same<T, std::string>())
        {
            ok = curl_easy_setopt(m_handle, opt, val.c_str());
        }
        else if constexpr (std::is_same<T, bool>())
        {
            ok = curl_easy_setopt(m_handle, opt, val ? 1L : 0L);
        }
        else
        {
            ok = curl_easy_setopt(m_handle, opt, val);
        }
        if (ok != CURLE_OK)
        {
            throw curl_error(std::string("Could not set CURL option: ") + curl_easy_strerror(ok));
        }
        return *this;
    }
}

#endif
