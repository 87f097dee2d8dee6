#include "syscall.hpp"

#include <fdcore/except.hpp>
#include <fdcore/fd.hpp>
#include <fdcore/syscalls.hpp>

#include <algorithm>
#include <atomic>
#include <climits>
#include <cstring>
#include <fcntl.h>
#include <memory>
#include <sys/ioctl.h>
#include <timber/timber>
#include <utility>

namespace {
    constexpr auto invalid = -1;

    // Kernels older than 2.6.24 reject F_DUPFD_CLOEXEC with EINVAL; the
    // argument of 0 is always valid otherwise. Once seen, stop asking.
    std::atomic<bool> try_dupfd_cloexec = true;

    auto sys() noexcept -> fdcore::syscalls& {
        return fdcore::active_syscalls();
    }

    auto clamp_len(std::size_t len) noexcept -> std::size_t {
        return std::min(len, fdcore::max_len());
    }

    auto clamp_count(std::size_t count) noexcept -> int {
        return static_cast<int>(
            std::min(count, static_cast<std::size_t>(IOV_MAX))
        );
    }

    auto plural(std::size_t n) noexcept -> const char* {
        return n == 1 ? "" : "s";
    }

    auto adopt(int descriptor) -> fdcore::fd {
        auto result = fdcore::fd(descriptor);

        // Set even when F_DUPFD_CLOEXEC succeeded: some kernels reported
        // success without setting the flag.
        result.set_cloexec();

        return result;
    }
}

namespace fdcore {
    fd::fd() : descriptor(invalid) {}

    fd::fd(int descriptor) : descriptor(descriptor) {}

    fd::fd(fd&& other) noexcept :
        descriptor(std::exchange(other.descriptor, invalid)) {}

    fd::~fd() {
        if (descriptor == invalid) return;
        close();
    }

    fd::operator int() const { return descriptor; }

    auto fd::operator=(fd&& other) noexcept -> fd& {
        if (this != &other) {
            std::destroy_at(this);
            std::construct_at(this, std::forward<fd>(other));
        }

        return *this;
    }

    auto fd::close() noexcept -> void {
        fdcore::close(std::exchange(descriptor, invalid));
    }

    auto fd::duplicate() const -> fd {
        if (try_dupfd_cloexec.load(std::memory_order_relaxed)) {
            const auto result = detail::retry([this] {
                return sys().fcntl(descriptor, F_DUPFD_CLOEXEC, 0);
            });

            if (result != -1) {
                auto copy = adopt(result);
                TIMBER_DEBUG("{} duplicated as {}", *this, copy);
                return copy;
            }

            if (errno != EINVAL) {
                detail::failure(
                    "failed to duplicate file descriptor ({})",
                    descriptor
                );
            }

            try_dupfd_cloexec.store(false, std::memory_order_relaxed);
            TIMBER_DEBUG("F_DUPFD_CLOEXEC unsupported: falling back to F_DUPFD");
        }

        auto copy = adopt(detail::syscall(
            [this] { return sys().fcntl(descriptor, F_DUPFD, 0); },
            "failed to duplicate file descriptor ({})",
            descriptor
        ));

        TIMBER_DEBUG("{} duplicated as {} (F_DUPFD)", *this, copy);
        return copy;
    }

    auto fd::get() const noexcept -> int { return descriptor; }

    auto fd::get_cloexec() const -> bool {
        const auto flags = detail::syscall(
            [this] { return sys().fcntl(descriptor, F_GETFD, 0); },
            "failed to get flags for file descriptor ({})",
            descriptor
        );

        return (flags & FD_CLOEXEC) != 0;
    }

    auto fd::read(std::span<std::byte> buffer) const -> std::size_t {
        const auto bytes = static_cast<std::size_t>(detail::syscall(
            [&] {
                return sys().read(
                    descriptor,
                    buffer.data(),
                    clamp_len(buffer.size())
                );
            },
            "failed to read from file descriptor ({})",
            descriptor
        ));

        TIMBER_TRACE("{} read {:L} byte{}", *this, bytes, plural(bytes));
        return bytes;
    }

    auto fd::read_at(
        std::span<std::byte> buffer,
        std::uint64_t offset
    ) const -> std::size_t {
        const auto bytes = static_cast<std::size_t>(detail::syscall(
            [&] {
                return sys().pread(
                    descriptor,
                    buffer.data(),
                    clamp_len(buffer.size()),
                    static_cast<off_t>(offset)
                );
            },
            "failed to read from file descriptor ({}) at offset {}",
            descriptor,
            offset
        ));

        TIMBER_TRACE(
            "{} read {:L} byte{} at offset {:L}",
            *this,
            bytes,
            plural(bytes),
            offset
        );

        return bytes;
    }

    auto fd::read_exact(std::span<std::byte> buffer) const -> void {
        while (!buffer.empty()) {
            const auto bytes = read(buffer);
            if (bytes == 0) throw eof();
            buffer = buffer.subspan(bytes);
        }
    }

    auto fd::read_to_end(std::vector<std::byte>& buffer) const -> std::size_t {
        constexpr auto probe = std::size_t(32);

        const auto start = buffer.size();

        while (true) {
            if (buffer.size() == buffer.capacity()) {
                buffer.reserve(std::max(
                    buffer.capacity() * 2,
                    buffer.capacity() + probe
                ));
            }

            const auto filled = buffer.size();
            buffer.resize(buffer.capacity());

            auto bytes = std::size_t();

            try {
                bytes = read({buffer.data() + filled, buffer.size() - filled});
            }
            catch (...) {
                buffer.resize(filled);
                throw;
            }

            buffer.resize(filled + bytes);
            if (bytes == 0) break;
        }

        return buffer.size() - start;
    }

    auto fd::read_vectored(std::span<const iovec> buffers) const
        -> std::size_t {
        const auto bytes = static_cast<std::size_t>(detail::syscall(
            [&] {
                return sys().readv(
                    descriptor,
                    buffers.data(),
                    clamp_count(buffers.size())
                );
            },
            "failed to read from file descriptor ({})",
            descriptor
        ));

        TIMBER_TRACE("{} readv {:L} byte{}", *this, bytes, plural(bytes));
        return bytes;
    }

    auto fd::release() noexcept -> int {
        return std::exchange(descriptor, invalid);
    }

    auto fd::set_cloexec() const -> void {
        const auto previous = detail::syscall(
            [this] { return sys().fcntl(descriptor, F_GETFD, 0); },
            "failed to get flags for file descriptor ({})",
            descriptor
        );

        const auto flags = previous | FD_CLOEXEC;
        if (flags == previous) return;

        detail::syscall(
            [&] { return sys().fcntl(descriptor, F_SETFD, flags); },
            "failed to set flags for file descriptor ({})",
            descriptor
        );

        TIMBER_TRACE("{} set close-on-exec", *this);
    }

    auto fd::set_nonblocking(bool nonblocking) const -> void {
        auto value = static_cast<int>(nonblocking);

        detail::syscall(
            [&] { return sys().ioctl(descriptor, FIONBIO, &value); },
            "failed to {} non-blocking mode for file descriptor ({})",
            nonblocking ? "enable" : "disable",
            descriptor
        );

        TIMBER_TRACE("{} non-blocking: {}", *this, nonblocking);
    }

    auto fd::valid() const noexcept -> bool { return descriptor != invalid; }

    auto fd::write(std::span<const std::byte> buffer) const -> std::size_t {
        const auto bytes = static_cast<std::size_t>(detail::syscall(
            [&] {
                return sys().write(
                    descriptor,
                    buffer.data(),
                    clamp_len(buffer.size())
                );
            },
            "failed to write to file descriptor ({})",
            descriptor
        ));

        TIMBER_TRACE("{} write {:L} byte{}", *this, bytes, plural(bytes));
        return bytes;
    }

    auto fd::write_all(std::span<const std::byte> buffer) const -> void {
        while (!buffer.empty()) {
            const auto bytes = write(buffer);
            if (bytes == 0) throw write_zero();
            buffer = buffer.subspan(bytes);
        }
    }

    auto fd::write_at(
        std::span<const std::byte> buffer,
        std::uint64_t offset
    ) const -> std::size_t {
        const auto bytes = static_cast<std::size_t>(detail::syscall(
            [&] {
                return sys().pwrite(
                    descriptor,
                    buffer.data(),
                    clamp_len(buffer.size()),
                    static_cast<off_t>(offset)
                );
            },
            "failed to write to file descriptor ({}) at offset {}",
            descriptor,
            offset
        ));

        TIMBER_TRACE(
            "{} write {:L} byte{} at offset {:L}",
            *this,
            bytes,
            plural(bytes),
            offset
        );

        return bytes;
    }

    auto fd::write_vectored(std::span<const iovec> buffers) const
        -> std::size_t {
        const auto bytes = static_cast<std::size_t>(detail::syscall(
            [&] {
                return sys().writev(
                    descriptor,
                    buffers.data(),
                    clamp_count(buffers.size())
                );
            },
            "failed to write to file descriptor ({})",
            descriptor
        ));

        TIMBER_TRACE("{} writev {:L} byte{}", *this, bytes, plural(bytes));
        return bytes;
    }

    auto close(int fd) noexcept -> void {
        if (sys().close(fd) == -1) {
            TIMBER_ERROR(
                "Failed to close file descriptor ({}): {}",
                fd,
                std::strerror(errno)
            );
        }
        else { TIMBER_TRACE("fd ({}) closed", fd); }
    }

    auto dupfd_cloexec_supported() noexcept -> bool {
        return try_dupfd_cloexec.load(std::memory_order_relaxed);
    }

    auto max_len() noexcept -> std::size_t {
        return static_cast<std::size_t>(SSIZE_MAX);
    }
}
