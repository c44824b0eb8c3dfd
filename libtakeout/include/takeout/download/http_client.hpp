// Copyright (c) 2023, QuantStack and Mamba Contributors
//
// Distributed under the terms of the BSD 3-Clause License.
//
// The full license is in the file LICENSE, distributed with this software.

#ifndef TAKEOUT_DOWNLOAD_HTTP_CLIENT_HPP
#define TAKEOUT_DOWNLOAD_HTTP_CLIENT_HPP

#include <memory>

#include "takeout/download/parameters.hpp"
#include "takeout/download/request.hpp"

namespace takeout::download
{
    /**
     * Performs one HTTP GET at a time, streaming the body to a file.
     *
     * The client never retries: deciding what a failed transfer means is the
     * caller's business.
     */
    class HttpClient
    {
    public:

        virtual ~HttpClient() = default;

        HttpClient(const HttpClient&) = delete;
        HttpClient& operator=(const HttpClient&) = delete;
        HttpClient(HttpClient&&) = delete;
        HttpClient& operator=(HttpClient&&) = delete;

        Result get(const Request& request);

    protected:

        HttpClient() = default;

    private:

        virtual Result get_impl(const Request& request) = 0;
    };

    class CURLHandle;

    /**
     * HttpClient on top of a single reused libcurl easy handle.
     */
    class CurlHttpClient : public HttpClient
    {
    public:

        explicit CurlHttpClient(RemoteFetchParams params);
        ~CurlHttpClient() override;

        const RemoteFetchParams& params() const;

    private:

        Result get_impl(const Request& request) override;

        RemoteFetchParams m_params;
        std::unique_ptr<CURLHandle> p_handle;
    };
}
#endif
