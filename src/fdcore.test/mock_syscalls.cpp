#include "mock_syscalls.hpp"

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <sys/ioctl.h>
#include <utility>

namespace {
    auto command_name(int command) -> std::string {
        switch (command) {
            case F_GETFD: return "F_GETFD";
            case F_SETFD: return "F_SETFD";
            case F_DUPFD: return "F_DUPFD";
            case F_DUPFD_CLOEXEC: return "F_DUPFD_CLOEXEC";
            default: return "fcntl";
        }
    }

    auto bytes(const void* data, std::size_t len) -> std::vector<std::byte> {
        const auto* const begin = static_cast<const std::byte*>(data);
        return {begin, begin + len};
    }
}

namespace fdcore::test {
    auto mock_syscalls::fail_next(std::string_view name) -> bool {
        const auto it = std::find_if(
            failures.begin(),
            failures.end(),
            [name](const failure& f) { return f.name == name; }
        );

        if (it == failures.end()) return false;

        if (it->skip > 0) {
            --it->skip;
            return false;
        }

        errno = it->error;
        failures.erase(it);
        return true;
    }

    auto mock_syscalls::record(call&& c) -> void {
        calls.push_back(std::move(c));
    }

    auto mock_syscalls::fail(std::string_view name, int error, int times)
        -> void {
        for (auto i = 0; i < times; ++i) {
            failures.push_back({std::string(name), error, 0});
        }
    }

    auto mock_syscalls::fail_after(
        std::string_view name,
        int successes,
        int error
    ) -> void {
        failures.push_back({std::string(name), error, successes});
    }

    auto mock_syscalls::count(std::string_view name) const -> std::size_t {
        return std::count_if(
            calls.begin(),
            calls.end(),
            [name](const call& c) { return c.name == name; }
        );
    }

    auto mock_syscalls::names() const -> std::vector<std::string> {
        auto result = std::vector<std::string>();
        for (const auto& c : calls) result.push_back(c.name);
        return result;
    }

    auto mock_syscalls::close(int fd) -> int {
        record({.name = "close", .fd = fd});
        if (fail_next("close")) return -1;

        descriptor_flags.erase(fd);
        return 0;
    }

    auto mock_syscalls::fcntl(int fd, int command, int arg) -> int {
        const auto name = command_name(command);

        record({.name = name, .fd = fd, .arg = arg});
        if (fail_next(name)) return -1;

        switch (command) {
            case F_GETFD:
                return descriptor_flags[fd];
            case F_SETFD:
                descriptor_flags[fd] = arg;
                return 0;
            case F_DUPFD: {
                const auto result = next_descriptor++;
                descriptor_flags[result] = 0;
                return result;
            }
            case F_DUPFD_CLOEXEC: {
                const auto result = next_descriptor++;
                descriptor_flags[result] =
                    dupfd_cloexec_ignores_flag ? 0 : FD_CLOEXEC;
                return result;
            }
            default:
                errno = EINVAL;
                return -1;
        }
    }

    auto mock_syscalls::ioctl(int fd, unsigned long request, int* arg) -> int {
        record({
            .name = request == FIONBIO ? "FIONBIO" : "ioctl",
            .fd = fd,
            .arg = arg ? *arg : 0
        });
        if (fail_next("ioctl")) return -1;

        return 0;
    }

    auto mock_syscalls::pread(
        int fd,
        void* buf,
        std::size_t count,
        off_t offset
    ) -> ssize_t {
        record({.name = "pread", .fd = fd, .count = count, .offset = offset});
        if (fail_next("pread")) return -1;

        const auto start = std::min(static_cast<std::size_t>(offset), input.size());
        const auto len = std::min(count, input.size() - start);

        if (len > 0) std::memcpy(buf, input.data() + start, len);
        return static_cast<ssize_t>(len);
    }

    auto mock_syscalls::pwrite(
        int fd,
        const void* buf,
        std::size_t count,
        off_t offset
    ) -> ssize_t {
        record({
            .name = "pwrite",
            .fd = fd,
            .count = count,
            .offset = offset,
            .data = bytes(buf, count)
        });
        if (fail_next("pwrite")) return -1;

        return static_cast<ssize_t>(count);
    }

    auto mock_syscalls::read(int fd, void* buf, std::size_t count) -> ssize_t {
        record({.name = "read", .fd = fd, .count = count});
        if (fail_next("read")) return -1;

        const auto len = std::min(count, input.size() - input_position);

        if (len > 0) std::memcpy(buf, input.data() + input_position, len);
        input_position += len;

        return static_cast<ssize_t>(len);
    }

    auto mock_syscalls::readv(int fd, const iovec* iov, int iovcnt)
        -> ssize_t {
        record({.name = "readv", .fd = fd, .count = std::size_t(iovcnt)});
        if (fail_next("readv")) return -1;

        auto total = std::size_t();

        for (auto i = 0; i < iovcnt; ++i) {
            const auto len = std::min(
                iov[i].iov_len,
                input.size() - input_position
            );

            if (len > 0) {
                std::memcpy(iov[i].iov_base, input.data() + input_position, len);
            }
            input_position += len;
            total += len;
        }

        return static_cast<ssize_t>(total);
    }

    auto mock_syscalls::write(int fd, const void* buf, std::size_t count)
        -> ssize_t {
        record({
            .name = "write",
            .fd = fd,
            .count = count,
            .data = bytes(buf, count)
        });
        if (fail_next("write")) return -1;

        const auto len = std::min(count, write_limit.value_or(count));
        const auto data = bytes(buf, len);
        output.insert(output.end(), data.begin(), data.end());

        return static_cast<ssize_t>(len);
    }

    auto mock_syscalls::writev(int fd, const iovec* iov, int iovcnt)
        -> ssize_t {
        auto data = std::vector<std::byte>();

        for (auto i = 0; i < iovcnt; ++i) {
            const auto part = bytes(iov[i].iov_base, iov[i].iov_len);
            data.insert(data.end(), part.begin(), part.end());
        }

        record({
            .name = "writev",
            .fd = fd,
            .count = std::size_t(iovcnt),
            .data = data
        });
        if (fail_next("writev")) return -1;

        output.insert(output.end(), data.begin(), data.end());
        return static_cast<ssize_t>(data.size());
    }

    scoped_install::scoped_install(syscalls& table) :
        previous(fdcore::install(table))
    {}

    scoped_install::~scoped_install() { fdcore::install(previous); }
}
