// Copyright (c) 2023, QuantStack and Mamba Contributors
//
// Distributed under the terms of the BSD 3-Clause License.
//
// The full license is in the file LICENSE, distributed with this software.

#include <system_error>

#include <fmt/format.h>

#include "takeout/core/logging.hpp"
#include "takeout/download/http_client.hpp"
#include "takeout/util/cfile.hpp"

#include "curl.hpp"

namespace takeout::download
{
    /**************
     * HttpClient *
     **************/

    Result HttpClient::get(const Request& request)
    {
        return get_impl(request);
    }

    namespace
    {
        struct TransferContext
        {
            const Request& request;
            const CURLHandle& handle;
            std::optional<util::CFile> file = std::nullopt;
            std::optional<ResponseHead> head = std::nullopt;
            std::size_t written = 0;
            bool rejected = false;
            std::string failure = "";
        };

        ResponseHead read_response_head(const CURLHandle& handle)
        {
            ResponseHead head;
            head.http_status = handle.get_info<int>(CURLINFO_RESPONSE_CODE).value_or(0);
            head.content_type = handle.get_info<std::string>(CURLINFO_CONTENT_TYPE).value_or("");
            const auto length = handle.get_info<curl_off_t>(CURLINFO_CONTENT_LENGTH_DOWNLOAD_T);
            if (length && length.value() >= 0)
            {
                head.content_length = static_cast<std::size_t>(length.value());
            }
            return head;
        }

        // Returns false if the response must not be written.
        bool check_response_head(TransferContext& ctx)
        {
            if (ctx.head)
            {
                return !ctx.rejected;
            }
            ctx.head = read_response_head(ctx.handle);
            if (ctx.request.accept)
            {
                try
                {
                    ctx.rejected = !(*ctx.request.accept)(*ctx.head);
                }
                catch (const std::exception& e)
                {
                    ctx.rejected = true;
                    ctx.failure = e.what();
                }
            }
            return !ctx.rejected;
        }

        std::size_t write_callback(char* ptr, std::size_t size, std::size_t nmemb, void* self)
        {
            auto& ctx = *static_cast<TransferContext*>(self);
            const std::size_t total = size * nmemb;
            if (!check_response_head(ctx))
            {
                // Returning less than total makes the transfer fail with CURLE_WRITE_ERROR
                return 0;
            }
            if (!ctx.file)
            {
                std::error_code ec;
                auto file = util::CFile::try_open(ctx.request.filename, "wb", ec);
                if (ec)
                {
                    ctx.failure = fmt::format(
                        "Could not open '{}' for writing: {}",
                        ctx.request.filename,
                        ec.message()
                    );
                    return 0;
                }
                ctx.file.emplace(std::move(file));
            }
            if (auto res = ctx.file->try_write(std::string_view(ptr, total)); !res)
            {
                ctx.failure = fmt::format(
                    "Could not write to '{}': {}",
                    ctx.request.filename,
                    res.error().message()
                );
                return 0;
            }
            ctx.written += total;
            return total;
        }

        int progress_callback(
            void* self,
            curl_off_t total_to_download,
            curl_off_t now_downloaded,
            curl_off_t,
            curl_off_t
        )
        {
            // A shutdown request does not cut the stream, the engine checks it between archives.
            auto& ctx = *static_cast<TransferContext*>(self);
            if (ctx.request.progress && now_downloaded > 0)
            {
                const auto speed = ctx.handle.get_info<curl_off_t>(CURLINFO_SPEED_DOWNLOAD_T);
                (*ctx.request.progress)(Progress{
                    static_cast<std::size_t>(now_downloaded),
                    static_cast<std::size_t>(total_to_download),
                    static_cast<std::size_t>(speed.value_or(0)),
                });
            }
            return 0;
        }

        int debug_callback(CURL*, curl_infotype type, char* data, std::size_t size, void*)
        {
            std::string_view text(data, size);
            while (!text.empty() && (text.back() == '\n' || text.back() == '\r'))
            {
                text.remove_suffix(1);
            }
            switch (type)
            {
                case CURLINFO_TEXT:
                    logging::MessageLogger(log_level::debug, log_source::libcurl).stream()
                        << "* " << text;
                    break;
                case CURLINFO_HEADER_OUT:
                    logging::MessageLogger(log_level::debug, log_source::libcurl).stream()
                        << "> " << text;
                    break;
                case CURLINFO_HEADER_IN:
                    logging::MessageLogger(log_level::debug, log_source::libcurl).stream()
                        << "< " << text;
                    break;
                default:
                    break;
            }
            return 0;
        }

        void remove_partial_file(const std::string& filename)
        {
            std::error_code ec;
            fs::remove(filename, ec);
            if (ec)
            {
                LOG_WARNING << "Could not remove '" << filename << "': " << ec.message();
            }
        }

        bool is_success_status(int status)
        {
            return status >= 200 && status < 300;
        }
    }

    /******************
     * CurlHttpClient *
     ******************/

    CurlHttpClient::CurlHttpClient(RemoteFetchParams params)
        : m_params(std::move(params))
    {
        init_curl_once();
        p_handle = std::make_unique<CURLHandle>();
    }

    CurlHttpClient::~CurlHttpClient() = default;

    const RemoteFetchParams& CurlHttpClient::params() const
    {
        return m_params;
    }

    Result CurlHttpClient::get_impl(const Request& request)
    {
        CURLHandle& handle = *p_handle;
        handle.reset_handle();
        handle.reset_headers();
        handle.configure_handle(request.url, m_params);

        for (const auto& [name, value] : request.headers)
        {
            handle.add_header(fmt::format("{}: {}", name, value));
        }
        handle.set_opt_header();
        if (!request.cookies.empty())
        {
            handle.set_opt(CURLOPT_COOKIE, request.cookies);
        }

        TransferContext ctx{ request, handle };
        handle.set_opt(CURLOPT_WRITEFUNCTION, &write_callback);
        handle.set_opt(CURLOPT_WRITEDATA, static_cast<void*>(&ctx));
        handle.set_opt(CURLOPT_XFERINFOFUNCTION, &progress_callback);
        handle.set_opt(CURLOPT_XFERINFODATA, static_cast<void*>(&ctx));
        handle.set_opt(CURLOPT_NOPROGRESS, 0L);
        if (m_params.verbose)
        {
            handle.set_opt(CURLOPT_VERBOSE, 1L);
            handle.set_opt(CURLOPT_DEBUGFUNCTION, &debug_callback);
        }

        LOG_INFO << "Downloading " << request.name << " from " << request.url;
        const CURLcode res = handle.perform();

        // Empty bodies never reach the write callback.
        const bool accepted = check_response_head(ctx);

        std::error_code close_ec;
        if (ctx.file)
        {
            ctx.file->try_close(close_ec);
        }

        TransferData transfer;
        transfer.http_status = ctx.head->http_status;
        transfer.effective_url = handle.get_curl_effective_url();
        transfer.content_type = ctx.head->content_type;
        transfer.content_length = ctx.head->content_length;
        transfer.downloaded_size = ctx.written;
        transfer.average_speed_Bps = static_cast<std::size_t>(
            handle.get_info<curl_off_t>(CURLINFO_SPEED_DOWNLOAD_T).value_or(0)
        );

        auto make_error = [&](std::string message) -> Result
        {
            remove_partial_file(request.filename);
            Error error;
            error.message = std::move(message);
            error.rejected = ctx.rejected;
            if (transfer.http_status != 0)
            {
                error.transfer = transfer;
            }
            return tl::make_unexpected(std::move(error));
        };

        if (!accepted)
        {
            return make_error(fmt::format(
                "Response for {} refused (HTTP {}, content type '{}'){}",
                request.name,
                transfer.http_status,
                transfer.content_type,
                ctx.failure.empty() ? "" : ": " + ctx.failure
            ));
        }
        if (!CURLHandle::is_curl_res_ok(res))
        {
            std::string reason = ctx.failure;
            if (reason.empty())
            {
                reason = fmt::format(
                    "{} ({})",
                    CURLHandle::get_res_error(res),
                    handle.get_error_buffer()
                );
            }
            return make_error(fmt::format("Transfer of {} failed: {}", request.name, reason));
        }
        if (close_ec)
        {
            return make_error(
                fmt::format("Could not close '{}': {}", request.filename, close_ec.message())
            );
        }
        if (!is_success_status(transfer.http_status))
        {
            return make_error(fmt::format(
                "Transfer of {} failed with HTTP {}",
                request.name,
                transfer.http_status
            ));
        }

        if (!ctx.file)
        {
            // Successful but empty body: still honour the destination.
            auto empty = util::CFile::try_open(request.filename, "wb");
            if (!empty || !empty->try_close())
            {
                return make_error(fmt::format("Could not create '{}'", request.filename));
            }
        }

        LOG_DEBUG << fmt::format(
            "Transfer of {} done: {} bytes at {} B/s",
            request.name,
            transfer.downloaded_size,
            transfer.average_speed_Bps
        );
        return Success{ request.filename, std::move(transfer) };
    }
}
