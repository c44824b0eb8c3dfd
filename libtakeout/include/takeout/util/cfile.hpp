// Copyright (c) 2023, QuantStack and Mamba Contributors
//
// Distributed under the terms of the BSD 3-Clause License.
//
// The full license is in the file LICENSE, distributed with this software.

#ifndef TAKEOUT_UTIL_CFILE_HPP
#define TAKEOUT_UTIL_CFILE_HPP

#include <cstdio>
#include <memory>
#include <string_view>
#include <system_error>

#include <tl/expected.hpp>

#include "takeout/fs/filesystem.hpp"

namespace takeout::util
{
    class CFile
    {
    public:

        /**
         * Open a file with C API.
         *
         * In case of error, set the error code @p ec.
         */
        static auto try_open(  //
            const fs::path& path,
            const char* mode,
            std::error_code& ec
        ) -> CFile;

        static auto try_open(  //
            const fs::path& path,
            const char* mode
        ) -> tl::expected<CFile, std::error_code>;

        CFile(CFile&&) = default;
        auto operator=(CFile&&) -> CFile& = default;

        /**
         * The destructor will flush and close the file descriptor.
         *
         * Like ``std::fstream``, exceptions are ignored.
         * Explicitly call @ref close to get the exception.
         */
        ~CFile();

        [[nodiscard]] auto try_write(std::string_view data) noexcept
            -> tl::expected<void, std::error_code>;

        /**
         * Flush the C buffers and ask the kernel to commit the file to disk.
         */
        [[nodiscard]] auto try_sync() noexcept -> tl::expected<void, std::error_code>;

        void try_close(std::error_code& ec) noexcept;
        [[nodiscard]] auto try_close() noexcept -> tl::expected<void, std::error_code>;

        auto raw() noexcept -> std::FILE*;

    private:

        struct FileClose
        {
            void operator()(std::FILE* ptr);
        };

        std::unique_ptr<std::FILE, FileClose> m_ptr = nullptr;

        explicit CFile(std::FILE* ptr);
    };

    /**
     * Commit an existing file or directory to disk.
     *
     * Syncing the parent directory after a rename makes the new directory
     * entry durable.
     */
    [[nodiscard]] auto sync_path(const fs::path& path) noexcept
        -> tl::expected<void, std::error_code>;
}
#endif
