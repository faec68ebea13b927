#include "crypto/sha256.hpp"

#include <docpatch-cpp/store.hpp>

#include <gtest/gtest.h>

#include <cstddef>
#include <span>
#include <string>
#include <string_view>
#include <vector>

using namespace docpatch_cpp::crypto;

static auto sha256_string(std::string_view s) -> std::string {
    return to_hex(sha256(s));
}

// NIST test vectors

TEST(Sha256, empty_string) {
    EXPECT_EQ(sha256_string(""),
              "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855");
}

TEST(Sha256, abc) {
    EXPECT_EQ(sha256_string("abc"),
              "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
}

TEST(Sha256, two_block_message) {
    EXPECT_EQ(sha256_string("abcdbcdecdefdefgefghfghighijhijkijkljklmklmnlmnomnopnopq"),
              "248d6a61d20638b8e5c026930c3e6039a33ce45964ff2167f6ecedd419db06c1");
}

TEST(Sha256, long_message) {
    auto digest = sha256_string(
        "abcdefghbcdefghicdefghijdefghijkefghijklfghijklmghijklmn"
        "hijklmnoijklmnopjklmnopqklmnopqrlmnopqrsmnopqrstnopqrstu");
    EXPECT_EQ(digest, "cf5b16a778af8380036ce59e7b0492370b249b11e8f07a51afac45037afee9d1");
}

TEST(Sha256, single_zero_byte) {
    EXPECT_EQ(sha256_string(std::string_view{"\0", 1}),
              "6e340b9cffb37a989ca544e6bb780a2c78901d3fb33738768511a30617afa01d");
}

TEST(Sha256, million_a) {
    EXPECT_EQ(sha256_string(std::string(1'000'000, 'a')),
              "cdc76e5c9914fb9281a1c7e284d73e67f1809a48a497200e046d39ccc7112cd0");
}

// Streaming

TEST(Sha256, chunked_updates_match_one_shot) {
    const auto text = std::string(200, 'x') + "tail";
    const auto expected = sha256(text);

    // Chunk sizes straddle the 64-byte block boundary
    for (auto chunk : {std::size_t{1}, std::size_t{7}, std::size_t{55}, std::size_t{63},
                       std::size_t{64}, std::size_t{65}}) {
        auto hasher = Sha256{};
        for (std::size_t pos = 0; pos < text.size(); pos += chunk) {
            hasher.update(std::string_view{text}.substr(pos, chunk));
        }
        EXPECT_EQ(hasher.finish(), expected) << "chunk size " << chunk;
    }
}

TEST(Sha256, byte_span_and_string_view_agree) {
    auto bytes = std::vector<std::byte>{std::byte{0x48}, std::byte{0x65},
                                        std::byte{0x6c}, std::byte{0x6c}, std::byte{0x6f}};
    auto hasher = Sha256{};
    hasher.update(std::span<const std::byte>{bytes});
    EXPECT_EQ(hasher.finish(), sha256("Hello"));
}

TEST(Sha256, padding_boundary_lengths) {
    // 55 bytes fit the length in one block, 56 need a second
    EXPECT_EQ(sha256_string(std::string(55, 'a')),
              "9f4390f8d30c2dd92ec9f095b65e2b9ae9b0a925a5258e241c9f1e910f734318");
    EXPECT_EQ(sha256_string(std::string(56, 'a')),
              "b35439a4ac6f0948b6d6f9e3c6af0f5f590ce20f1bde7090ef7970686ec6738a");
}

TEST(Sha256, hex_is_lowercase_and_full_length) {
    auto hex = docpatch_cpp::sha256_hex("abc");
    EXPECT_EQ(hex.size(), 64u);
    EXPECT_EQ(hex.find_first_not_of("0123456789abcdef"), std::string::npos);
}
