#pragma once

#include <cstddef>
#include <sys/types.h>
#include <sys/uio.h>

namespace fdcore {
    /**
     * The kernel interface used by every descriptor operation.
     *
     * Members follow the POSIX calling convention: -1 on failure with the
     * reason left in errno. Implementations must not retry on EINTR.
     */
    class syscalls {
    public:
        virtual ~syscalls() = default;

        virtual auto close(int fd) -> int = 0;

        virtual auto fcntl(int fd, int command, int arg) -> int = 0;

        virtual auto ioctl(int fd, unsigned long request, int* arg) -> int = 0;

        virtual auto pread(
            int fd,
            void* buf,
            std::size_t count,
            off_t offset
        ) -> ssize_t = 0;

        virtual auto pwrite(
            int fd,
            const void* buf,
            std::size_t count,
            off_t offset
        ) -> ssize_t = 0;

        virtual auto read(int fd, void* buf, std::size_t count) -> ssize_t = 0;

        virtual auto readv(int fd, const iovec* iov, int iovcnt) -> ssize_t = 0;

        virtual auto write(
            int fd,
            const void* buf,
            std::size_t count
        ) -> ssize_t = 0;

        virtual auto writev(int fd, const iovec* iov, int iovcnt) -> ssize_t = 0;
    };

    auto active_syscalls() noexcept -> syscalls&;

    /// Makes 'table' the active syscall table and returns the previous one.
    auto install(syscalls& table) noexcept -> syscalls&;

    auto posix_syscalls() noexcept -> syscalls&;
}
