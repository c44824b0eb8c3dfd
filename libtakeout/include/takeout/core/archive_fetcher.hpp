// Copyright (c) 2023, QuantStack and Mamba Contributors
//
// Distributed under the terms of the BSD 3-Clause License.
//
// The full license is in the file LICENSE, distributed with this software.

#ifndef TAKEOUT_CORE_ARCHIVE_FETCHER_HPP
#define TAKEOUT_CORE_ARCHIVE_FETCHER_HPP

#include <optional>
#include <string>
#include <string_view>

#include "takeout/core/archive_file.hpp"
#include "takeout/core/auth_session.hpp"
#include "takeout/core/clock.hpp"
#include "takeout/download/http_client.hpp"
#include "takeout/fs/filesystem.hpp"

namespace takeout
{
    /**
     * URL of one archive. The query parameters and their order are what the
     * service expects, do not reorder them.
     */
    std::string make_download_url(
        std::string_view service_host,
        int index,
        std::string_view job_id,
        std::string_view session_token
    );

    enum class FetchStatus
    {
        success,
        // The export job has not produced this archive (yet).
        not_found,
        // Login page, or any other non successful answer.
        auth_failure,
        size_mismatch,
        transport_error,
    };

    const char* name_of(FetchStatus status) noexcept;

    struct FetchOutcome
    {
        FetchStatus status = FetchStatus::transport_error;
        // Set on success only.
        std::optional<ArchiveFile> archive = std::nullopt;
        std::size_t bytes_written = 0;
        std::string message = "";
        std::optional<int> http_status = std::nullopt;

        bool ok() const;
    };

    /**
     * Downloads a single archive and publishes it under its final name.
     *
     * The body is streamed into a ``tmp_`` file next to the destination, its
     * size checked against the declared content length, then renamed. On any
     * outcome but success the temporary file is removed, so the final name
     * only ever designates a complete archive.
     */
    class ArchiveFetcher
    {
    public:

        using progress_callback_t = download::Request::progress_callback_t;

        struct Options
        {
            std::string service_host = "takeout.google.com";
            std::string job_id = "";
        };

        ArchiveFetcher(download::HttpClient& client, Options options, const Clock& clock);

        /// Never throws.
        FetchOutcome
        fetch(int index, const AuthSession& session, const fs::path& destination) const;

        void set_progress_callback(progress_callback_t callback);

        const Options& options() const;

    private:

        FetchOutcome fetch_impl(int index, const AuthSession& session, const fs::path& destination)
            const;

        download::HttpClient& m_client;
        Options m_options;
        const Clock& m_clock;
        std::optional<progress_callback_t> m_progress;
    };
}

#endif
