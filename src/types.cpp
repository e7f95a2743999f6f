#include "hostmux/types.hpp"

#include "hostmux/format.hpp"

#include <array>
#include <random>

using namespace hostmux::literals;

namespace hostmux {

    std::string make_uuid() {
        static thread_local std::mt19937_64 rng{std::random_device{}()};

        std::array<uint8_t, 16> bytes{};
        for (size_t i = 0; i < bytes.size(); i += 8) {
            auto word = rng();
            for (size_t j = 0; j < 8; ++j) {
                bytes[i + j] = static_cast<uint8_t>(word >> (j * 8));
            }
        }
        bytes[6] = static_cast<uint8_t>((bytes[6] & 0x0f) | 0x40);
        bytes[8] = static_cast<uint8_t>((bytes[8] & 0x3f) | 0x80);

        std::string out{};
        out.reserve(36);
        for (size_t i = 0; i < bytes.size(); ++i) {
            if (i == 4 || i == 6 || i == 8 || i == 10) {
                out.push_back('-');
            }
            out += "{:02x}"_format(bytes[i]);
        }
        return out;
    }

}  // namespace hostmux
