/**
 * @file
 * SPDX-FileCopyrightText: 2026 The pinwave authors
 * SPDX-License-Identifier: GPL-3.0-or-later
 */

#include "file_descriptor.hpp"
#include <system_error>
#include <cerrno>
#include <utility>
#include <fcntl.h>
#include <unistd.h>

namespace Pinwave
{

FileDescriptor::FileDescriptor(const std::string& path, int flags)
: fd(open(path.c_str(), flags | O_CLOEXEC))
, path(path)
{
    if (this->fd == -1) {
        throw std::system_error(
            errno,
            std::generic_category(),
            "Open " + path
        );
    }
}

FileDescriptor::FileDescriptor(int fd)
: fd(fd)
{}

FileDescriptor::FileDescriptor(FileDescriptor&& other) noexcept
: fd(std::exchange(other.fd, -1))
, path(std::move(other.path))
{}

auto FileDescriptor::operator=(FileDescriptor&& other) noexcept
-> FileDescriptor&
{
    if (this != &other) {
        this->close_fd();
        this->fd = std::exchange(other.fd, -1);
        this->path = std::move(other.path);
    }

    return *this;
}

FileDescriptor::operator int() const
{
    return this->fd;
}

auto FileDescriptor::is_open() const -> bool
{
    return this->fd != -1;
}

auto FileDescriptor::get_path() const -> const std::string&
{
    return this->path;
}

void FileDescriptor::close_fd() noexcept
{
    if (this->fd != -1) {
        close(this->fd);
        this->fd = -1;
    }
}

FileDescriptor::~FileDescriptor()
{
    this->close_fd();
}

} // namespace Pinwave
