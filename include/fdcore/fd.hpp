#pragma once

#include <cstddef>
#include <cstdint>
#include <fmt/format.h>
#include <span>
#include <sys/uio.h>
#include <vector>

namespace fdcore {
    /**
     * Exclusive owner of an open file descriptor.
     *
     * The descriptor is closed exactly once when the owner is destroyed.
     * Errors reported by close are discarded: the descriptor may or may not
     * have been released, and retrying could close an unrelated descriptor
     * that reused the number.
     *
     * Operations that fail throw ext::system_error carrying errno.
     */
    class fd {
        int descriptor;

        auto close() noexcept -> void;
    public:
        fd();

        /// Takes ownership of 'descriptor', which must be open and unowned.
        explicit fd(int descriptor);

        fd(const fd&) = delete;
        fd(fd&& other) noexcept;

        ~fd();

        operator int() const;

        auto operator=(const fd&) -> fd& = delete;
        auto operator=(fd&& other) noexcept -> fd&;

        /**
         * Creates a new descriptor referring to the same open file.
         *
         * Close-on-exec is set on the new descriptor without racing
         * concurrent calls to exec where the kernel supports it.
         */
        auto duplicate() const -> fd;

        auto get() const noexcept -> int;

        auto get_cloexec() const -> bool;

        auto read(std::span<std::byte> buffer) const -> std::size_t;

        auto read_at(
            std::span<std::byte> buffer,
            std::uint64_t offset
        ) const -> std::size_t;

        /// Reads until 'buffer' is full; throws eof if the stream ends first.
        auto read_exact(std::span<std::byte> buffer) const -> void;

        /**
         * Appends everything up to end of stream to 'buffer' and returns the
         * number of bytes appended. Bytes read before an error are kept.
         */
        auto read_to_end(std::vector<std::byte>& buffer) const -> std::size_t;

        auto read_vectored(std::span<const iovec> buffers) const
            -> std::size_t;

        /// Gives up ownership without closing the descriptor.
        auto release() noexcept -> int;

        auto set_cloexec() const -> void;

        auto set_nonblocking(bool nonblocking) const -> void;

        auto valid() const noexcept -> bool;

        auto write(std::span<const std::byte> buffer) const -> std::size_t;

        /// Writes the entire buffer; throws write_zero if no progress is made.
        auto write_all(std::span<const std::byte> buffer) const -> void;

        auto write_at(
            std::span<const std::byte> buffer,
            std::uint64_t offset
        ) const -> std::size_t;

        auto write_vectored(std::span<const iovec> buffers) const
            -> std::size_t;
    };

    /// Closes 'fd' once, logging but otherwise ignoring failure.
    auto close(int fd) noexcept -> void;

    /// Reports whether F_DUPFD_CLOEXEC is still believed to work.
    auto dupfd_cloexec_supported() noexcept -> bool;

    /// The largest byte count passed to a single read or write.
    auto max_len() noexcept -> std::size_t;
}

template <>
struct fmt::formatter<fdcore::fd> {
    template <typename ParseContext>
    constexpr auto parse(ParseContext& ctx) {
        return ctx.begin();
    }

    template <typename FormatContext>
    auto format(const fdcore::fd& fd, FormatContext& ctx) const {
        return fmt::format_to(ctx.out(), "fd ({})", fd.get());
    }
};
