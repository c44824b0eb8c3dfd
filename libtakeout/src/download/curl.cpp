// Copyright (c) 2023, QuantStack and Mamba Contributors
//
// Distributed under the terms of the BSD 3-Clause License.
//
// The full license is in the file LICENSE, distributed with this software.

#include <algorithm>
#include <mutex>

#include <fmt/format.h>

#include "takeout/core/logging.hpp"
#include "takeout/core/util.hpp"  // for hide_secrets
#include "takeout/fs/filesystem.hpp"
#include "takeout/util/environment.hpp"
#include "takeout/util/string.hpp"

#include "curl.hpp"

namespace takeout::download
{
    namespace
    {
        void configure_curl_handle(
            CURL* handle,
            const std::string& url,
            const RemoteFetchParams& params
        )
        {
            curl_easy_setopt(handle, CURLOPT_URL, url.c_str());
            curl_easy_setopt(handle, CURLOPT_NETRC, CURL_NETRC_OPTIONAL);
            // The archive URL answers with a redirect to the storage host.
            curl_easy_setopt(handle, CURLOPT_FOLLOWLOCATION, 1L);
            curl_easy_setopt(handle, CURLOPT_MAXREDIRS, 10L);

            // if NETRC is exported in ENV, we forward it to curl
            std::string netrc_file = util::get_env("NETRC").value_or("");
            if (netrc_file != "")
            {
                curl_easy_setopt(handle, CURLOPT_NETRC_FILE, netrc_file.c_str());
            }

            // This can improve throughput significantly, see
            // https://github.com/curl/curl/issues/9601
            curl_easy_setopt(handle, CURLOPT_BUFFERSIZE, 100 * 1024L);

            // No CURLOPT_TIMEOUT: archives are several gigabytes, a stalled
            // transfer is caught by the low speed limit instead.
            curl_easy_setopt(handle, CURLOPT_HTTP_VERSION, CURL_HTTP_VERSION_1_1);
            curl_easy_setopt(handle, CURLOPT_LOW_SPEED_TIME, params.low_speed_time_secs);
            curl_easy_setopt(handle, CURLOPT_LOW_SPEED_LIMIT, params.low_speed_limit_bps);
            curl_easy_setopt(
                handle,
                CURLOPT_CONNECTTIMEOUT_MS,
                static_cast<long>(params.connect_timeout_secs * 1000.)
            );

            if (!params.user_agent.empty())
            {
                curl_easy_setopt(handle, CURLOPT_USERAGENT, params.user_agent.c_str());
            }

            if (params.ssl_no_revoke)
            {
                curl_easy_setopt(handle, CURLOPT_SSL_OPTIONS, CURLSSLOPT_NO_REVOKE);
            }

            const auto proxy = proxy_match(url, params.proxy_servers);
            if (proxy)
            {
                curl_easy_setopt(handle, CURLOPT_PROXY, proxy->c_str());
                LOG_INFO << fmt::format("Using Proxy {}", hide_secrets(*proxy));
            }

            const std::string& ssl_verify = params.ssl_verify;
            if (ssl_verify.size())
            {
                if (ssl_verify == "<false>")
                {
                    curl_easy_setopt(handle, CURLOPT_SSL_VERIFYPEER, 0L);
                    curl_easy_setopt(handle, CURLOPT_SSL_VERIFYHOST, 0L);
                    if (proxy)
                    {
                        curl_easy_setopt(handle, CURLOPT_PROXY_SSL_VERIFYPEER, 0L);
                        curl_easy_setopt(handle, CURLOPT_PROXY_SSL_VERIFYHOST, 0L);
                    }
                }
                else if (ssl_verify == "<system>")
                {
                    // libcurl default bundle
                }
                else
                {
                    if (!fs::exists(ssl_verify))
                    {
                        throw std::runtime_error("ssl_verify does not contain a valid file path.");
                    }
                    else
                    {
                        curl_easy_setopt(handle, CURLOPT_CAINFO, ssl_verify.c_str());
                        if (proxy)
                        {
                            curl_easy_setopt(handle, CURLOPT_PROXY_CAINFO, ssl_verify.c_str());
                        }
                    }
                }
            }
        }
    }

    std::optional<std::string>
    proxy_match(std::string_view url, const proxy_map_type& proxy_servers)
    {
        if (proxy_servers.empty())
        {
            return std::nullopt;
        }

        auto [scheme, rest] = util::split_once(url, "://");
        std::string_view host = {};
        if (!rest.empty())
        {
            host = rest.substr(0, rest.find_first_of("/?#"));
            // Drop user info and port
            if (const auto at = host.rfind('@'); at != std::string_view::npos)
            {
                host = host.substr(at + 1);
            }
            if (const auto colon = host.find(':'); colon != std::string_view::npos)
            {
                host = host.substr(0, colon);
            }
        }
        else
        {
            // No scheme separator, this is not something we can match on.
            scheme = {};
        }

        std::vector<std::string> options;
        if (host.empty())
        {
            options = { std::string(scheme), "all" };
        }
        else
        {
            options = {
                fmt::format("{}://{}", scheme, host),
                std::string(scheme),
                fmt::format("all://{}", host),
                "all",
            };
        }

        for (auto& option : options)
        {
            auto proxy = proxy_servers.find(option);
            if (proxy != proxy_servers.end())
            {
                return proxy->second;
            }
        }

        return std::nullopt;
    }

    void init_curl_once()
    {
        static std::once_flag flag;
        std::call_once(
            flag,
            []
            {
                const CURLcode res = curl_global_init(CURL_GLOBAL_ALL);
                if (res != CURLE_OK)
                {
                    throw curl_error(
                        fmt::format("Could not initialize libcurl: {}", curl_easy_strerror(res))
                    );
                }
                const auto* info = curl_version_info(CURLVERSION_NOW);
                LOG_DEBUG << "Using libcurl " << info->version << " ("
                          << (info->ssl_version ? info->ssl_version : "no SSL") << ")";
            }
        );
    }

    /**************
     * curl_error *
     **************/

    curl_error::curl_error(const std::string& what)
        : std::runtime_error(what)
    {
    }

    /**************
     * CURLHandle *
     **************/

    CURLHandle::CURLHandle()
        : m_handle(curl_easy_init())
    {
        if (m_handle == nullptr)
        {
            throw curl_error("Could not initialize CURL handle");
        }

        // Set error buffer
        std::fill(m_errorbuffer.begin(), m_errorbuffer.end(), '\0');
        set_opt(CURLOPT_ERRORBUFFER, m_errorbuffer.data());
    }

    CURLHandle::~CURLHandle()
    {
        curl_easy_cleanup(m_handle);
        curl_slist_free_all(p_headers);
    }

    template <class T>
    tl::expected<T, CURLcode> CURLHandle::get_info(CURLINFO option) const
    {
        T val;
        CURLcode result = curl_easy_getinfo(m_handle, option, &val);
        if (result != CURLE_OK)
        {
            return tl::unexpected(result);
        }
        return val;
    }

    // Note that `curl_off_t` can be either `long` or `long long` depending on the platform,
    // both are instantiated.

    // WARNING curl_easy_getinfo MUST have its third argument pointing to long,
    // curl_off_t, char*, double, curl_slist*, curl_certinfo*, curl_tlssessioninfo*
    // or curl_socket_t depending on the used option.
    // cf. each option man page for more details.
    // https://curl.se/libcurl/c/curl_easy_getinfo.html

    template tl::expected<long, CURLcode> CURLHandle::get_info(CURLINFO option) const;
    template tl::expected<char*, CURLcode> CURLHandle::get_info(CURLINFO option) const;
    template tl::expected<long long, CURLcode> CURLHandle::get_info(CURLINFO option) const;

    template <>
    tl::expected<int, CURLcode> CURLHandle::get_info(CURLINFO option) const
    {
        auto res = get_info<long>(option);
        if (res)
        {
            return static_cast<int>(res.value());
        }
        else
        {
            return tl::unexpected(res.error());
        }
    }

    template <>
    tl::expected<std::string, CURLcode> CURLHandle::get_info(CURLINFO option) const
    {
        auto res = get_info<char*>(option);
        if (res)
        {
            // Some infos (e.g. CURLINFO_CONTENT_TYPE) are legitimately null.
            return res.value() ? std::string(res.value()) : std::string();
        }
        else
        {
            return tl::unexpected(res.error());
        }
    }

    void CURLHandle::configure_handle(const std::string& url, const RemoteFetchParams& params)
    {
        configure_curl_handle(m_handle, url, params);
    }

    void CURLHandle::reset_handle()
    {
        curl_easy_reset(m_handle);
        set_opt(CURLOPT_ERRORBUFFER, m_errorbuffer.data());
    }

    CURLHandle& CURLHandle::add_header(const std::string& header)
    {
        p_headers = curl_slist_append(p_headers, header.c_str());
        if (!p_headers)
        {
            throw std::bad_alloc();
        }
        return *this;
    }

    CURLHandle& CURLHandle::reset_headers()
    {
        curl_slist_free_all(p_headers);
        p_headers = nullptr;
        return *this;
    }

    CURLHandle& CURLHandle::set_opt_header()
    {
        set_opt(CURLOPT_HTTPHEADER, p_headers);
        return *this;
    }

    const char* CURLHandle::get_error_buffer() const
    {
        return m_errorbuffer.data();
    }

    std::string CURLHandle::get_curl_effective_url() const
    {
        return get_info<std::string>(CURLINFO_EFFECTIVE_URL).value_or("");
    }

    CURLcode CURLHandle::perform()
    {
        return curl_easy_perform(m_handle);
    }

    bool CURLHandle::is_curl_res_ok(CURLcode res)
    {
        return res == CURLE_OK;
    }

    std::string CURLHandle::get_res_error(CURLcode res)
    {
        return static_cast<std::string>(curl_easy_strerror(res));
    }
}
