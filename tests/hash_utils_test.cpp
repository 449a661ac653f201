#include "stockade/utils/hash_utils.hpp"

#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>

using stockade::utils::HashUtils;

TEST(HashUtilsTest, KnownVectors) {
    EXPECT_EQ(HashUtils::ComputeSHA256(""),
              "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855");
    EXPECT_EQ(HashUtils::ComputeSHA256("abc"),
              "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
}

TEST(HashUtilsTest, FileDigestMatchesContent) {
    auto path = std::filesystem::temp_directory_path() / "stockade_hash_test.bin";
    std::string content(20000, 'q');
    {
        std::ofstream out(path, std::ios::binary);
        out << content;
    }

    EXPECT_EQ(HashUtils::ComputeFileSHA256(path), HashUtils::ComputeSHA256(content));

    std::filesystem::remove(path);
    EXPECT_THROW(HashUtils::ComputeFileSHA256(path), std::runtime_error);
}

TEST(HashUtilsTest, DigestComparison) {
    auto digest = HashUtils::ComputeSHA256(std::string("abc"));
    EXPECT_TRUE(HashUtils::DigestEquals(digest, digest));
    EXPECT_FALSE(HashUtils::DigestEquals(digest, HashUtils::ComputeSHA256(std::string("abd"))));
    EXPECT_FALSE(HashUtils::DigestEquals(digest, digest.substr(1)));

    EXPECT_TRUE(HashUtils::IsSHA256Hex(digest));
    EXPECT_FALSE(HashUtils::IsSHA256Hex("abc"));
    EXPECT_FALSE(HashUtils::IsSHA256Hex(std::string(64, 'g')));
}
