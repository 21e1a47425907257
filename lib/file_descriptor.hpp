/**
 * @file
 * SPDX-FileCopyrightText: 2026 The pinwave authors
 * SPDX-License-Identifier: GPL-3.0-or-later
 */

#ifndef PINWAVE_FILE_DESCRIPTOR_HPP
#define PINWAVE_FILE_DESCRIPTOR_HPP

#include <string>

namespace Pinwave
{

/** Owning wrapper around a C file descriptor. */
class FileDescriptor
{
public:
    /**
     * Open a file or device node.
     *
     * @param path Path to the file to open.
     * @param flags Opening flags, as for open(2).
     * @throws std::system_error If opening fails.
     */
    FileDescriptor(const std::string& path, int flags);

    /** Take ownership of an existing file descriptor. */
    explicit FileDescriptor(int fd);

    // Disallow copying device handles
    FileDescriptor(const FileDescriptor& other) = delete;
    FileDescriptor& operator=(const FileDescriptor& other) = delete;

    // Transfer handle ownership
    FileDescriptor(FileDescriptor&& other) noexcept;
    FileDescriptor& operator=(FileDescriptor&& other) noexcept;

    /** Get the underlying file descriptor. */
    operator int() const;

    /** Check whether this wrapper currently owns a descriptor. */
    bool is_open() const;

    /** Path the descriptor was opened from, empty if adopted. */
    const std::string& get_path() const;

    /** Close the file. */
    ~FileDescriptor();

private:
    int fd;
    std::string path;

    void close_fd() noexcept;
}; // class FileDescriptor

} // namespace Pinwave

#endif // PINWAVE_FILE_DESCRIPTOR_HPP
