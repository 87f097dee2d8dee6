#pragma once

#include <fdcore/syscalls.hpp>

#include <cstddef>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace fdcore::test {
    struct call {
        std::string name;
        int fd = -1;
        int arg = 0;
        std::size_t count = 0;
        std::int64_t offset = -1;
        std::vector<std::byte> data;
    };

    /**
     * Records every call and simulates a small kernel.
     *
     * fcntl calls are recorded under the command name (F_GETFD, F_SETFD,
     * F_DUPFD, F_DUPFD_CLOEXEC). Reads consume 'input'; positional reads
     * copy from 'input' without consuming it. Writes append to 'output'.
     */
    class mock_syscalls final : public syscalls {
        struct failure {
            std::string name;
            int error;
            int skip;
        };

        std::vector<failure> failures;

        auto fail_next(std::string_view name) -> bool;

        auto record(call&& c) -> void;
    public:
        std::vector<call> calls;
        std::map<int, int> descriptor_flags;
        std::vector<std::byte> input;
        std::size_t input_position = 0;
        std::vector<std::byte> output;
        int next_descriptor = 100;

        /// When set, F_DUPFD_CLOEXEC succeeds without setting the flag.
        bool dupfd_cloexec_ignores_flag = false;

        /// Upper bound on the bytes accepted by a single write.
        std::optional<std::size_t> write_limit;

        /// Makes the next 'times' calls named 'name' fail with 'error'.
        auto fail(std::string_view name, int error, int times = 1) -> void;

        /// Lets 'successes' calls named 'name' through, then fails one.
        auto fail_after(std::string_view name, int successes, int error)
            -> void;

        auto count(std::string_view name) const -> std::size_t;

        auto names() const -> std::vector<std::string>;

        auto close(int fd) -> int override;

        auto fcntl(int fd, int command, int arg) -> int override;

        auto ioctl(int fd, unsigned long request, int* arg) -> int override;

        auto pread(int fd, void* buf, std::size_t count, off_t offset)
            -> ssize_t override;

        auto pwrite(int fd, const void* buf, std::size_t count, off_t offset)
            -> ssize_t override;

        auto read(int fd, void* buf, std::size_t count) -> ssize_t override;

        auto readv(int fd, const iovec* iov, int iovcnt) -> ssize_t override;

        auto write(int fd, const void* buf, std::size_t count)
            -> ssize_t override;

        auto writev(int fd, const iovec* iov, int iovcnt) -> ssize_t override;
    };

    /// Installs a syscall table for the lifetime of the object.
    class scoped_install {
        syscalls& previous;
    public:
        explicit scoped_install(syscalls& table);

        scoped_install(const scoped_install&) = delete;

        ~scoped_install();

        auto operator=(const scoped_install&) -> scoped_install& = delete;
    };
}
