// Copyright (c) 2019, QuantStack and Mamba Contributors
//
// Distributed under the terms of the BSD 3-Clause License.
//
// The full license is in the file LICENSE, distributed with this software.

#ifndef TAKEOUT_CORE_UTIL_HPP
#define TAKEOUT_CORE_UTIL_HPP

#include <fstream>
#include <string>
#include <string_view>

#include "takeout/core/error_handling.hpp"
#include "takeout/fs/filesystem.hpp"

namespace takeout
{
    class TemporaryDirectory
    {
    public:

        TemporaryDirectory();
        ~TemporaryDirectory();

        TemporaryDirectory(const TemporaryDirectory&) = delete;
        TemporaryDirectory& operator=(const TemporaryDirectory&) = delete;

        const fs::path& path() const;
        operator fs::path();

    private:

        fs::path m_path;
    };

    /**
     * Read a whole (small) text file.
     */
    expected_t<std::string> read_contents(const fs::path& path);

    /**
     * Mask the credentials that may appear in URLs, HTTP headers or curl traces:
     * the ``rapt`` session token and ``Cookie``/``Authorization`` header values.
     */
    std::string hide_secrets(std::string_view str);

    /**
     * Exclusive advisory lock on a file, released on destruction.
     *
     * Used to serialize invocations working on the same output directory;
     * the lock does not block, a second owner gets an error immediately.
     */
    class LockFile
    {
    public:

        static expected_t<LockFile> try_lock(const fs::path& path);

        ~LockFile();

        LockFile(const LockFile&) = delete;
        LockFile& operator=(const LockFile&) = delete;

        LockFile(LockFile&& other) noexcept;
        LockFile& operator=(LockFile&& other) noexcept;

        const fs::path& path() const;
        bool is_locked() const noexcept;

    private:

        LockFile(fs::path path, int fd);

        void release() noexcept;

        fs::path m_path;
        int m_fd = -1;
    };
}

#endif
