// Copyright (c) 2023, QuantStack and Mamba Contributors
//
// Distributed under the terms of the BSD 3-Clause License.
//
// The full license is in the file LICENSE, distributed with this software.

#include <cerrno>
#include <iostream>

#include <fcntl.h>
#include <unistd.h>

#include "takeout/util/cfile.hpp"

namespace takeout::util
{
    namespace
    {
        void try_close_impl(std::FILE* ptr, std::error_code& ec) noexcept
        {
            if (ptr)
            {
                const auto close_res = std::fclose(ptr);  // This flush too
                if (close_res != 0)
                {
                    ec = std::make_error_code(std::errc::io_error);
                }
            }
        }

        auto last_error() noexcept -> std::error_code
        {
            return std::error_code(errno, std::generic_category());
        }
    }

    void CFile::FileClose::operator()(std::FILE* ptr)
    {
        auto ec = std::error_code();
        try_close_impl(ptr, ec);
        if (ec)
        {
            std::cerr << "Developer error: error closing file in CFile::~CFile, "
                         "explicitly call CFile::try_close to handle error.\n";
        }
    }

    CFile::CFile(std::FILE* ptr)
        : m_ptr{ ptr }
    {
    }

    CFile::~CFile() = default;

    auto CFile::try_open(const fs::path& path, const char* mode, std::error_code& ec) -> CFile
    {
        std::string name = path.string();
        std::FILE* ptr = std::fopen(name.c_str(), mode);
        if (ptr == nullptr)
        {
            ec = last_error();
        }
        return CFile{ ptr };
    }

    auto CFile::try_open(const fs::path& path, const char* mode)
        -> tl::expected<CFile, std::error_code>
    {
        auto io_error = std::error_code();
        auto file_ptr = util::CFile::try_open(path, mode, io_error);
        if (io_error)
        {
            return tl::unexpected(io_error);
        }
        return { std::move(file_ptr) };
    }

    auto CFile::try_write(std::string_view data) noexcept -> tl::expected<void, std::error_code>
    {
        if (!m_ptr)
        {
            return tl::unexpected(std::make_error_code(std::errc::bad_file_descriptor));
        }
        const auto written = std::fwrite(data.data(), 1, data.size(), m_ptr.get());
        if (written != data.size())
        {
            return tl::unexpected(std::make_error_code(std::errc::io_error));
        }
        return {};
    }

    auto CFile::try_sync() noexcept -> tl::expected<void, std::error_code>
    {
        if (!m_ptr)
        {
            return tl::unexpected(std::make_error_code(std::errc::bad_file_descriptor));
        }
        if (std::fflush(m_ptr.get()) != 0)
        {
            return tl::unexpected(last_error());
        }
        if (::fsync(::fileno(m_ptr.get())) != 0)
        {
            return tl::unexpected(last_error());
        }
        return {};
    }

    void CFile::try_close(std::error_code& ec) noexcept
    {
        try_close_impl(m_ptr.get(), ec);
        [[maybe_unused]] auto raw = m_ptr.release();  // No need to call dtor anymore
    }

    auto CFile::try_close() noexcept -> tl::expected<void, std::error_code>
    {
        auto io_error = std::error_code();
        try_close(io_error);
        if (io_error)
        {
            return tl::unexpected(io_error);
        }
        return {};
    }

    auto CFile::raw() noexcept -> std::FILE*
    {
        return m_ptr.get();
    }

    auto sync_path(const fs::path& path) noexcept -> tl::expected<void, std::error_code>
    {
        const int fd = ::open(path.c_str(), O_RDONLY | O_CLOEXEC);
        if (fd < 0)
        {
            return tl::unexpected(last_error());
        }
        auto result = tl::expected<void, std::error_code>();
        if (::fsync(fd) != 0)
        {
            result = tl::unexpected(last_error());
        }
        ::close(fd);
        return result;
    }
}
