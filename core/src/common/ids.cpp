#include <common/ids.hpp>

#include <cstdint>
#include <mutex>
#include <random>

namespace pc {
    std::string make_uuid() {
        static std::mutex mtx;
        static std::mt19937_64 rng{std::random_device{}()};

        uint64_t hi = 0;
        uint64_t lo = 0;
        {
            std::lock_guard lk(mtx);
            hi = rng();
            lo = rng();
        }

        hi = (hi & 0xFFFFFFFFFFFF0FFFULL) | 0x0000000000004000ULL; // version 4
        lo = (lo & 0x3FFFFFFFFFFFFFFFULL) | 0x8000000000000000ULL; // variant 1

        static constexpr char kHex[] = "0123456789abcdef";
        std::string out;
        out.reserve(36);
        for (int i = 0; i < 32; ++i) {
            const uint64_t word = i < 16 ? hi : lo;
            const int shift = 60 - 4 * (i % 16);
            out.push_back(kHex[(word >> shift) & 0xF]);
            if (i == 7 || i == 11 || i == 15 || i == 19) out.push_back('-');
        }
        return out;
    }

    std::string short_id(const std::string& uuid) {
        return uuid.substr(0, 8);
    }
}
