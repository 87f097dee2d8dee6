#include <fdcore/except.hpp>

namespace fdcore {
    auto eof::what() const noexcept -> const char* {
        return "Unexpected EOF";
    }

    write_zero::write_zero() : std::runtime_error("failed to write whole buffer") {}
}
