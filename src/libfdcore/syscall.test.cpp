#include "syscall.hpp"

#include <gtest/gtest.h>
#include <string>
#include <system_error>

TEST(Syscall, RetryInterrupted) {
    auto calls = 0;

    const auto result = fdcore::detail::retry([&] {
        if (++calls < 3) {
            errno = EINTR;
            return -1;
        }

        return 42;
    });

    EXPECT_EQ(42, result);
    EXPECT_EQ(3, calls);
}

TEST(Syscall, RetryStopsOnOtherErrors) {
    auto calls = 0;

    const auto result = fdcore::detail::retry([&] {
        ++calls;
        errno = EAGAIN;
        return -1;
    });

    EXPECT_EQ(-1, result);
    EXPECT_EQ(1, calls);
    EXPECT_EQ(EAGAIN, errno);
}

TEST(Syscall, Success) {
    const auto result = fdcore::detail::syscall(
        [] { return 5L; },
        "failed to read from file descriptor ({})",
        3
    );

    EXPECT_EQ(5L, result);
}

TEST(Syscall, Failure) {
    try {
        fdcore::detail::syscall(
            [] {
                errno = ENOSPC;
                return -1;
            },
            "failed to write to file descriptor ({})",
            3
        );
        FAIL() << "syscall should have thrown";
    }
    catch (const std::system_error& ex) {
        EXPECT_EQ(ENOSPC, ex.code().value());
        EXPECT_NE(
            std::string::npos,
            std::string(ex.what()).find("failed to write to file descriptor (3)")
        );
    }
}
