// Copyright (c) 2019, QuantStack and Mamba Contributors
//
// Distributed under the terms of the BSD 3-Clause License.
//
// The full license is in the file LICENSE, distributed with this software.

#include <cerrno>
#include <cstring>
#include <regex>
#include <sstream>
#include <utility>

#include <fcntl.h>
#include <sys/file.h>
#include <unistd.h>

#include <fmt/format.h>

#include "takeout/core/logging.hpp"
#include "takeout/core/util.hpp"
#include "takeout/util/random.hpp"

namespace takeout
{
    /***********************
     * TemporaryDirectory *
     ***********************/

    TemporaryDirectory::TemporaryDirectory()
    {
        const auto base = fs::temp_directory_path();
        // A few tries in the unlikely event of a name clash.
        for (int attempt = 0; attempt < 10; ++attempt)
        {
            auto candidate = base / ("takeout" + util::generate_random_alphanumeric_string(10));
            if (fs::create_directory(candidate))
            {
                m_path = std::move(candidate);
                return;
            }
        }
        throw std::runtime_error("Could not create temporary directory in " + base.string());
    }

    TemporaryDirectory::~TemporaryDirectory()
    {
        std::error_code ec;
        fs::remove_all(m_path, ec);
        if (ec)
        {
            LOG_ERROR << "Could not remove temporary directory " << m_path << ": " << ec.message();
        }
    }

    const fs::path& TemporaryDirectory::path() const
    {
        return m_path;
    }

    TemporaryDirectory::operator fs::path()
    {
        return m_path;
    }

    expected_t<std::string> read_contents(const fs::path& path)
    {
        std::ifstream in(path, std::ios::in | std::ios::binary);
        if (!in)
        {
            return make_unexpected(
                fmt::format("Could not read '{}': {}", path.string(), std::strerror(errno)),
                takeout_error_code::unknown
            );
        }
        std::ostringstream contents;
        contents << in.rdbuf();
        return contents.str();
    }

    /****************
     * hide_secrets *
     ****************/

    namespace
    {
        const std::regex& session_token_regex()
        {
            static const std::regex token_regex("(rapt=)[^&\\s'\"]+");
            return token_regex;
        }

        const std::regex& credential_header_regex()
        {
            static const std::regex header_regex(
                "(cookie|authorization)(:\\s*)[^\\r\\n]+",
                std::regex::ECMAScript | std::regex::icase
            );
            return header_regex;
        }
    }

    std::string hide_secrets(std::string_view str)
    {
        std::string copy(str);
        copy = std::regex_replace(copy, session_token_regex(), "$1*****");
        copy = std::regex_replace(copy, credential_header_regex(), "$1$2*****");
        return copy;
    }

    /************
     * LockFile *
     ************/

    expected_t<LockFile> LockFile::try_lock(const fs::path& path)
    {
        const int fd = ::open(path.c_str(), O_RDWR | O_CREAT | O_CLOEXEC, 0644);
        if (fd < 0)
        {
            return make_unexpected(
                fmt::format(
                    "Could not open lock file '{}': {}",
                    path.string(),
                    std::strerror(errno)
                ),
                takeout_error_code::lockfile_failure
            );
        }

        if (::flock(fd, LOCK_EX | LOCK_NB) != 0)
        {
            const int err = errno;
            ::close(fd);
            if (err == EWOULDBLOCK)
            {
                return make_unexpected(
                    fmt::format(
                        "'{}' is locked by another process, "
                        "only one download can run per output directory",
                        path.string()
                    ),
                    takeout_error_code::lockfile_failure
                );
            }
            return make_unexpected(
                fmt::format("Could not lock '{}': {}", path.string(), std::strerror(err)),
                takeout_error_code::lockfile_failure
            );
        }

        // The pid is informative only, the lock itself is the flock.
        const auto pid = std::to_string(::getpid()) + "\n";
        if (::ftruncate(fd, 0) != 0 || ::write(fd, pid.data(), pid.size()) < 0)
        {
            LOG_DEBUG << "Could not write pid to lock file " << path;
        }

        LOG_DEBUG << "Locked " << path;
        return LockFile(path, fd);
    }

    LockFile::LockFile(fs::path path, int fd)
        : m_path(std::move(path))
        , m_fd(fd)
    {
    }

    LockFile::~LockFile()
    {
        release();
    }

    LockFile::LockFile(LockFile&& other) noexcept
        : m_path(std::move(other.m_path))
        , m_fd(std::exchange(other.m_fd, -1))
    {
    }

    LockFile& LockFile::operator=(LockFile&& other) noexcept
    {
        if (this != &other)
        {
            release();
            m_path = std::move(other.m_path);
            m_fd = std::exchange(other.m_fd, -1);
        }
        return *this;
    }

    const fs::path& LockFile::path() const
    {
        return m_path;
    }

    bool LockFile::is_locked() const noexcept
    {
        return m_fd >= 0;
    }

    void LockFile::release() noexcept
    {
        if (m_fd >= 0)
        {
            ::flock(m_fd, LOCK_UN);
            ::close(m_fd);
            m_fd = -1;
        }
    }
}
