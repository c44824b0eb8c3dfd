// Copyright (c) 2023, QuantStack and Mamba Contributors
//
// Distributed under the terms of the BSD 3-Clause License.
//
// The full license is in the file LICENSE, distributed with this software.

#include <fmt/format.h>

#include "takeout/core/archive_fetcher.hpp"
#include "takeout/core/logging.hpp"
#include "takeout/core/util_scope.hpp"
#include "takeout/util/cfile.hpp"
#include "takeout/util/random.hpp"
#include "takeout/util/string.hpp"

namespace takeout
{
    std::string make_download_url(
        std::string_view service_host,
        int index,
        std::string_view job_id,
        std::string_view session_token
    )
    {
        return fmt::format(
            "https://{}/settings/takeout/download?i={}&j={}&download=true&rapt={}",
            service_host,
            index,
            job_id,
            session_token
        );
    }

    const char* name_of(FetchStatus status) noexcept
    {
        switch (status)
        {
            case FetchStatus::success:
                return "Success";
            case FetchStatus::not_found:
                return "NotFound";
            case FetchStatus::auth_failure:
                return "AuthFailure";
            case FetchStatus::size_mismatch:
                return "SizeMismatch";
            case FetchStatus::transport_error:
                return "TransportError";
        }
        return "Unknown";
    }

    bool FetchOutcome::ok() const
    {
        return status == FetchStatus::success;
    }

    namespace
    {
        bool is_success_status(int status)
        {
            return status >= 200 && status < 300;
        }

        // Sign-in and error pages come back as HTML, archives never do.
        bool is_html(std::string_view content_type)
        {
            return util::contains(util::to_lower(content_type), "html");
        }

        FetchOutcome make_outcome(FetchStatus status, std::string message)
        {
            FetchOutcome outcome;
            outcome.status = status;
            outcome.message = std::move(message);
            return outcome;
        }

        FetchOutcome classify(int index, const download::Error& error)
        {
            if (!error.transfer)
            {
                return make_outcome(FetchStatus::transport_error, error.message);
            }

            const auto& transfer = *error.transfer;
            FetchOutcome outcome;
            outcome.http_status = transfer.http_status;
            outcome.bytes_written = transfer.downloaded_size;
            outcome.message = error.message;

            if (transfer.http_status == 404)
            {
                outcome.status = FetchStatus::not_found;
                outcome.message = fmt::format("Archive {:03d} does not exist (yet)", index);
            }
            else if (is_html(transfer.content_type))
            {
                outcome.status = FetchStatus::auth_failure;
                outcome.message = fmt::format(
                    "Got a web page instead of archive {:03d} (HTTP {}), the session has expired",
                    index,
                    transfer.http_status
                );
            }
            else if (!is_success_status(transfer.http_status))
            {
                outcome.status = FetchStatus::auth_failure;
                outcome.message = fmt::format(
                    "Archive {:03d} refused with HTTP {}",
                    index,
                    transfer.http_status
                );
            }
            else if (transfer.content_length
                     && *transfer.content_length != transfer.downloaded_size)
            {
                outcome.status = FetchStatus::size_mismatch;
                outcome.message = fmt::format(
                    "Archive {:03d} truncated: {} bytes received out of {} ({})",
                    index,
                    transfer.downloaded_size,
                    *transfer.content_length,
                    error.message
                );
            }
            else
            {
                outcome.status = FetchStatus::transport_error;
            }
            return outcome;
        }
    }

    ArchiveFetcher::ArchiveFetcher(
        download::HttpClient& client,
        Options options,
        const Clock& clock
    )
        : m_client(client)
        , m_options(std::move(options))
        , m_clock(clock)
    {
    }

    void ArchiveFetcher::set_progress_callback(progress_callback_t callback)
    {
        m_progress = std::move(callback);
    }

    auto ArchiveFetcher::options() const -> const Options&
    {
        return m_options;
    }

    FetchOutcome
    ArchiveFetcher::fetch(int index, const AuthSession& session, const fs::path& destination) const
    {
        try
        {
            return fetch_impl(index, session, destination);
        }
        catch (const std::exception& e)
        {
            return make_outcome(
                FetchStatus::transport_error,
                fmt::format("Archive {:03d} failed: {}", index, e.what())
            );
        }
    }

    FetchOutcome
    ArchiveFetcher::fetch_impl(int index, const AuthSession& session, const fs::path& destination)
        const
    {
        const auto started_at = m_clock.now();
        const fs::path tmp_path = destination
                                  / temporary_filename(
                                      index,
                                      started_at,
                                      util::generate_random_alphanumeric_string(8)
                                  );

        bool published = false;
        auto cleanup = on_scope_exit(
            [&]
            {
                if (!published)
                {
                    std::error_code ec;
                    if (fs::remove(tmp_path, ec))
                    {
                        LOG_DEBUG << "Removed " << tmp_path;
                    }
                }
            }
        );

        auto url = make_download_url(
            m_options.service_host,
            index,
            m_options.job_id,
            session.session_token()
        );
        download::Request request(
            fmt::format("archive {:03d}", index),
            std::move(url),
            tmp_path.string()
        );
        for (const auto& [name, value] : session.headers())
        {
            request.headers.emplace_back(name, value);
        }
        request.cookies = session.cookie_header();
        request.accept = [](const download::ResponseHead& head)
        { return is_success_status(head.http_status) && !is_html(head.content_type); };
        request.progress = m_progress;

        auto result = m_client.get(request);
        if (!result)
        {
            return classify(index, result.error());
        }

        const auto& transfer = result->transfer;
        const auto written = static_cast<std::size_t>(fs::file_size(tmp_path));
        if (transfer.content_length && *transfer.content_length != written)
        {
            FetchOutcome outcome = make_outcome(
                FetchStatus::size_mismatch,
                fmt::format(
                    "Archive {:03d} has {} bytes, {} were announced",
                    index,
                    written,
                    *transfer.content_length
                )
            );
            outcome.bytes_written = written;
            outcome.http_status = transfer.http_status;
            return outcome;
        }

        if (auto synced = util::sync_path(tmp_path); !synced)
        {
            return make_outcome(
                FetchStatus::transport_error,
                fmt::format("Could not sync {}: {}", tmp_path.string(), synced.error().message())
            );
        }

        ArchiveFile archive;
        archive.index = index;
        archive.size_bytes = transfer.content_length;
        archive.path = destination / archive_filename(index, started_at);
        archive.created_at = started_at;

        fs::rename(tmp_path, archive.path);
        published = true;

        if (auto synced = util::sync_path(destination); !synced)
        {
            LOG_WARNING << "Could not sync " << destination << ": " << synced.error().message();
        }

        LOG_INFO << fmt::format(
            "Archive {:03d} saved to {} ({} bytes)",
            index,
            archive.path.string(),
            written
        );

        FetchOutcome outcome;
        outcome.status = FetchStatus::success;
        outcome.bytes_written = written;
        outcome.http_status = transfer.http_status;
        outcome.archive = std::move(archive);
        return outcome;
    }
}
