#pragma once

#include <stdexcept>

namespace fdcore {
    struct eof : std::exception {
        auto what() const noexcept -> const char* override;
    };

    struct write_zero : std::runtime_error {
        write_zero();
    };
}
