#pragma once

// Header-only incremental SHA-256 (FIPS 180-4).
// Used for revision digests; internal header, not installed.

#include <algorithm>
#include <array>
#include <cstddef>
#include <cstdint>
#include <cstring>
#include <span>
#include <string>
#include <string_view>

namespace docpatch_cpp::crypto {

namespace detail {

inline constexpr std::uint32_t k[64] = {
    0x428a2f98, 0x71374491, 0xb5c0fbcf, 0xe9b5dba5,
    0x3956c25b, 0x59f111f1, 0x923f82a4, 0xab1c5ed5,
    0xd807aa98, 0x12835b01, 0x243185be, 0x550c7dc3,
    0x72be5d74, 0x80deb1fe, 0x9bdc06a7, 0xc19bf174,
    0xe49b69c1, 0xefbe4786, 0x0fc19dc6, 0x240ca1cc,
    0x2de92c6f, 0x4a7484aa, 0x5cb0a9dc, 0x76f988da,
    0x983e5152, 0xa831c66d, 0xb00327c8, 0xbf597fc7,
    0xc6e00bf3, 0xd5a79147, 0x06ca6351, 0x14292967,
    0x27b70a85, 0x2e1b2138, 0x4d2c6dfc, 0x53380d13,
    0x650a7354, 0x766a0abb, 0x81c2c92e, 0x92722c85,
    0xa2bfe8a1, 0xa81a664b, 0xc24b8b70, 0xc76c51a3,
    0xd192e819, 0xd6990624, 0xf40e3585, 0x106aa070,
    0x19a4c116, 0x1e376c08, 0x2748774c, 0x34b0bcb5,
    0x391c0cb3, 0x4ed8aa4a, 0x5b9cca4f, 0x682e6ff3,
    0x748f82ee, 0x78a5636f, 0x84c87814, 0x8cc70208,
    0x90befffa, 0xa4506ceb, 0xbef9a3f7, 0xc67178f2,
};

inline constexpr auto rotr(std::uint32_t x, unsigned n) -> std::uint32_t {
    return (x >> n) | (x << (32 - n));
}

inline constexpr auto ch(std::uint32_t x, std::uint32_t y, std::uint32_t z) -> std::uint32_t {
    return (x & y) ^ (~x & z);
}

inline constexpr auto maj(std::uint32_t x, std::uint32_t y, std::uint32_t z) -> std::uint32_t {
    return (x & y) ^ (x & z) ^ (y & z);
}

inline constexpr auto sigma0(std::uint32_t x) -> std::uint32_t {
    return rotr(x, 2) ^ rotr(x, 13) ^ rotr(x, 22);
}

inline constexpr auto sigma1(std::uint32_t x) -> std::uint32_t {
    return rotr(x, 6) ^ rotr(x, 11) ^ rotr(x, 25);
}

inline constexpr auto gamma0(std::uint32_t x) -> std::uint32_t {
    return rotr(x, 7) ^ rotr(x, 18) ^ (x >> 3);
}

inline constexpr auto gamma1(std::uint32_t x) -> std::uint32_t {
    return rotr(x, 17) ^ rotr(x, 19) ^ (x >> 10);
}

inline auto read_be32(const std::byte* p) -> std::uint32_t {
    return (static_cast<std::uint32_t>(p[0]) << 24) |
           (static_cast<std::uint32_t>(p[1]) << 16) |
           (static_cast<std::uint32_t>(p[2]) << 8) |
           (static_cast<std::uint32_t>(p[3]));
}

inline void write_be32(std::byte* p, std::uint32_t v) {
    p[0] = static_cast<std::byte>(v >> 24);
    p[1] = static_cast<std::byte>(v >> 16);
    p[2] = static_cast<std::byte>(v >> 8);
    p[3] = static_cast<std::byte>(v);
}

inline void write_be64(std::byte* p, std::uint64_t v) {
    p[0] = static_cast<std::byte>(v >> 56);
    p[1] = static_cast<std::byte>(v >> 48);
    p[2] = static_cast<std::byte>(v >> 40);
    p[3] = static_cast<std::byte>(v >> 32);
    p[4] = static_cast<std::byte>(v >> 24);
    p[5] = static_cast<std::byte>(v >> 16);
    p[6] = static_cast<std::byte>(v >> 8);
    p[7] = static_cast<std::byte>(v);
}

}  // namespace detail

/// Streaming SHA-256: feed bytes with update(), then call finish() once.
class Sha256 {
public:
    static constexpr std::size_t digest_size = 32;
    using Digest = std::array<std::byte, digest_size>;

    void update(std::span<const std::byte> input) {
        total_len_ += input.size();
        auto data = input.data();
        auto remaining = input.size();

        if (buffered_ > 0) {
            auto take = std::min(remaining, block_.size() - buffered_);
            std::memcpy(block_.data() + buffered_, data, take);
            buffered_ += take;
            data += take;
            remaining -= take;
            if (buffered_ < block_.size()) return;
            compress(block_.data());
            buffered_ = 0;
        }
        while (remaining >= block_.size()) {
            compress(data);
            data += block_.size();
            remaining -= block_.size();
        }
        if (remaining > 0) {
            std::memcpy(block_.data(), data, remaining);
            buffered_ = remaining;
        }
    }

    void update(std::string_view input) {
        update(std::as_bytes(std::span<const char>{input.data(), input.size()}));
    }

    auto finish() -> Digest {
        // Padding: 0x80, zeros, then the 64-bit big-endian message length
        const auto bit_len = static_cast<std::uint64_t>(total_len_) * 8;
        block_[buffered_++] = std::byte{0x80};
        if (buffered_ > block_.size() - 8) {
            std::memset(block_.data() + buffered_, 0, block_.size() - buffered_);
            compress(block_.data());
            buffered_ = 0;
        }
        std::memset(block_.data() + buffered_, 0, block_.size() - 8 - buffered_);
        detail::write_be64(block_.data() + block_.size() - 8, bit_len);
        compress(block_.data());
        buffered_ = 0;

        auto result = Digest{};
        for (int i = 0; i < 8; ++i) {
            detail::write_be32(result.data() + static_cast<std::ptrdiff_t>(i) * 4, h_[i]);
        }
        return result;
    }

private:
    void compress(const std::byte* bp) {
        auto w = std::array<std::uint32_t, 64>{};
        for (int i = 0; i < 16; ++i) {
            w[i] = detail::read_be32(bp + static_cast<std::ptrdiff_t>(i) * 4);
        }
        for (int i = 16; i < 64; ++i) {
            w[i] = detail::gamma1(w[i - 2]) + w[i - 7] +
                   detail::gamma0(w[i - 15]) + w[i - 16];
        }

        auto a = h_[0], b = h_[1], c = h_[2], d = h_[3];
        auto e = h_[4], f = h_[5], g = h_[6], hh = h_[7];

        for (int i = 0; i < 64; ++i) {
            auto t1 = hh + detail::sigma1(e) + detail::ch(e, f, g) + detail::k[i] + w[i];
            auto t2 = detail::sigma0(a) + detail::maj(a, b, c);
            hh = g;
            g = f;
            f = e;
            e = d + t1;
            d = c;
            c = b;
            b = a;
            a = t1 + t2;
        }

        h_[0] += a; h_[1] += b; h_[2] += c; h_[3] += d;
        h_[4] += e; h_[5] += f; h_[6] += g; h_[7] += hh;
    }

    std::array<std::uint32_t, 8> h_{
        0x6a09e667, 0xbb67ae85, 0x3c6ef372, 0xa54ff53a,
        0x510e527f, 0x9b05688c, 0x1f83d9ab, 0x5be0cd19,
    };
    std::array<std::byte, 64> block_{};
    std::size_t buffered_{0};
    std::uint64_t total_len_{0};
};

/// One-shot digest of a byte string.
inline auto sha256(std::string_view input) -> Sha256::Digest {
    auto hasher = Sha256{};
    hasher.update(input);
    return hasher.finish();
}

/// Lowercase hex rendering of a digest.
inline auto to_hex(const Sha256::Digest& digest) -> std::string {
    static constexpr char hex_chars[] = "0123456789abcdef";
    auto result = std::string{};
    result.reserve(digest.size() * 2);
    for (auto b : digest) {
        auto v = static_cast<unsigned char>(b);
        result.push_back(hex_chars[v >> 4]);
        result.push_back(hex_chars[v & 0x0F]);
    }
    return result;
}

}  // namespace docpatch_cpp::crypto
