// Copyright (c) 2023, QuantStack and Mamba Contributors
//
// Distributed under the terms of the BSD 3-Clause License.
//
// The full license is in the file LICENSE, distributed with this software.

#ifndef TAKEOUT_DOWNLOAD_REQUEST_HPP
#define TAKEOUT_DOWNLOAD_REQUEST_HPP

#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include <tl/expected.hpp>

namespace takeout::download
{
    /*******************************
     * Download results structures *
     *******************************/

    struct TransferData
    {
        int http_status = 0;
        std::string effective_url = "";
        std::string content_type = "";
        std::optional<std::size_t> content_length = std::nullopt;
        std::size_t downloaded_size = 0;
        std::size_t average_speed_Bps = 0;
    };

    struct Success
    {
        std::string filename = "";
        TransferData transfer = {};
    };

    struct Error
    {
        std::string message = "";
        std::optional<TransferData> transfer = std::nullopt;
        // The response head was seen and refused by Request::accept,
        // no body byte has been written.
        bool rejected = false;
    };

    using Result = tl::expected<Success, Error>;

    /*****************************
     * Download event structures *
     *****************************/

    // What is known of a response once its headers have been received.
    struct ResponseHead
    {
        int http_status = 0;
        std::string content_type = "";
        std::optional<std::size_t> content_length = std::nullopt;
    };

    struct Progress
    {
        std::size_t downloaded_size = 0;
        std::size_t total_to_download = 0;
        std::size_t speed_Bps = 0;
    };

    /*******************************
     * Download request structures *
     *******************************/

    struct Request
    {
        using header_list = std::vector<std::pair<std::string, std::string>>;
        using accept_callback_t = std::function<bool(const ResponseHead&)>;
        using progress_callback_t = std::function<void(const Progress&)>;

        Request(std::string_view lname, std::string lurl, std::string lfilename);

        std::string name;
        std::string url;
        header_list headers = {};
        // Value of the Cookie header, sent as is.
        std::string cookies = "";
        // The body is streamed into this file, created on the first byte.
        std::string filename;

        // Called once, before the first byte of the body is written.
        // Returning false aborts the transfer and leaves no file behind.
        std::optional<accept_callback_t> accept = std::nullopt;
        std::optional<progress_callback_t> progress = std::nullopt;
    };
}
#endif
