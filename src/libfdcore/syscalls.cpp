#include <fdcore/syscalls.hpp>

#include <atomic>
#include <fcntl.h>
#include <sys/ioctl.h>
#include <unistd.h>

namespace {
    class posix final : public fdcore::syscalls {
    public:
        auto close(int fd) -> int override { return ::close(fd); }

        auto fcntl(int fd, int command, int arg) -> int override {
            return ::fcntl(fd, command, arg);
        }

        auto ioctl(int fd, unsigned long request, int* arg) -> int override {
            return ::ioctl(fd, request, arg);
        }

        auto pread(int fd, void* buf, std::size_t count, off_t offset)
            -> ssize_t override {
            return ::pread(fd, buf, count, offset);
        }

        auto pwrite(int fd, const void* buf, std::size_t count, off_t offset)
            -> ssize_t override {
            return ::pwrite(fd, buf, count, offset);
        }

        auto read(int fd, void* buf, std::size_t count) -> ssize_t override {
            return ::read(fd, buf, count);
        }

        auto readv(int fd, const iovec* iov, int iovcnt) -> ssize_t override {
            return ::readv(fd, iov, iovcnt);
        }

        auto write(int fd, const void* buf, std::size_t count)
            -> ssize_t override {
            return ::write(fd, buf, count);
        }

        auto writev(int fd, const iovec* iov, int iovcnt) -> ssize_t override {
            return ::writev(fd, iov, iovcnt);
        }
    };

    // Null selects the POSIX table.
    std::atomic<fdcore::syscalls*> active = nullptr;
}

namespace fdcore {
    auto active_syscalls() noexcept -> syscalls& {
        auto* const table = active.load(std::memory_order_acquire);
        return table ? *table : posix_syscalls();
    }

    auto install(syscalls& table) noexcept -> syscalls& {
        auto* const previous = active.exchange(&table, std::memory_order_acq_rel);
        return previous ? *previous : posix_syscalls();
    }

    auto posix_syscalls() noexcept -> syscalls& {
        static auto table = posix();
        return table;
    }
}
