#pragma once

#include <cerrno>
#include <ext/except.h>
#include <fmt/format.h>
#include <type_traits>
#include <utility>

namespace fdcore::detail {
    /// Throws the error left in errno by the last failed call.
    template <typename... Args>
    [[noreturn]]
    auto failure(fmt::format_string<Args...> format, Args&&... args) -> void {
        const auto error = errno;
        const auto message = fmt::format(format, std::forward<Args>(args)...);

        errno = error;
        throw ext::system_error(message);
    }

    /// Invokes 'call' until it completes without being interrupted.
    template <typename Call>
    auto retry(Call&& call) -> std::invoke_result_t<Call&> {
        auto result = call();
        while (result == -1 && errno == EINTR) result = call();
        return result;
    }

    template <typename Call, typename... Args>
    auto syscall(
        Call&& call,
        fmt::format_string<Args...> format,
        Args&&... args
    ) -> std::invoke_result_t<Call&> {
        const auto result = retry(call);
        if (result == -1) failure(format, std::forward<Args>(args)...);
        return result;
    }
}
