#include <gtest/gtest.h>

#include "tmauth/foundation/error_code.hpp"
#include "tmauth/service/password_hasher.hpp"

#include <set>
#include <string>
#include <thread>
#include <vector>

using namespace tmauth::service;
using tmauth::foundation::ErrorCode;

// Low cost keeps the suite fast; the algorithm is identical at any N.
class PasswordHasherTest : public ::testing::Test {
protected:
    PasswordHasher hasher{ScryptParams{10, 8, 1}};

    Salt salt() {
        auto s = PasswordHasher::generateSalt();
        EXPECT_TRUE(s.hasValue());
        return s.value();
    }
};

TEST(PasswordHasherDefaultsTest, DefaultCost) {
    PasswordHasher hasher;
    EXPECT_EQ(hasher.params().log2N, 14u);
    EXPECT_EQ(hasher.params().r, 8u);
    EXPECT_EQ(hasher.params().p, 1u);
}

TEST_F(PasswordHasherTest, SaltIsSixteenRandomBytes) {
    std::set<Salt> salts;
    for (int i = 0; i < 100; ++i) {
        auto s = salt();
        EXPECT_EQ(s.size(), kSaltLength);
        salts.insert(s);
    }
    EXPECT_EQ(salts.size(), 100u);
}

TEST_F(PasswordHasherTest, HashIsPhcEncoded) {
    auto hash = hasher.hashPassword("secret123", salt());
    ASSERT_TRUE(hash.hasValue());
    EXPECT_EQ(hash.value().rfind("$scrypt$ln=10,r=8,p=1$", 0), 0u);
    EXPECT_EQ(hash.value().find("secret123"), std::string::npos);
}

TEST_F(PasswordHasherTest, DifferentSaltsDifferentHashes) {
    auto h1 = hasher.hashPassword("secret123", salt());
    auto h2 = hasher.hashPassword("secret123", salt());
    ASSERT_TRUE(h1.hasValue());
    ASSERT_TRUE(h2.hasValue());
    EXPECT_NE(h1.value(), h2.value());
}

TEST_F(PasswordHasherTest, VerifyCorrectPassword) {
    auto s = salt();
    auto hash = hasher.hashPassword("secret123", s);
    ASSERT_TRUE(hash.hasValue());
    EXPECT_TRUE(hasher.verifyPassword("secret123", s, hash.value()));
}

TEST_F(PasswordHasherTest, VerifyWrongPassword) {
    auto s = salt();
    auto hash = hasher.hashPassword("secret123", s);
    ASSERT_TRUE(hash.hasValue());
    EXPECT_FALSE(hasher.verifyPassword("secret124", s, hash.value()));
    EXPECT_FALSE(hasher.verifyPassword("", s, hash.value()));
    EXPECT_FALSE(hasher.verifyPassword("secret1234", s, hash.value()));
}

TEST_F(PasswordHasherTest, VerifyWrongSalt) {
    auto hash = hasher.hashPassword("secret123", salt());
    ASSERT_TRUE(hash.hasValue());
    EXPECT_FALSE(hasher.verifyPassword("secret123", salt(), hash.value()));
}

TEST_F(PasswordHasherTest, LongAndBinaryPasswords) {
    auto s = salt();
    std::string longPassword(200, 'p');
    std::string withNul("pass\0word", 9);

    auto longHash = hasher.hashPassword(longPassword, s);
    auto nulHash = hasher.hashPassword(withNul, s);
    ASSERT_TRUE(longHash.hasValue());
    ASSERT_TRUE(nulHash.hasValue());

    EXPECT_TRUE(hasher.verifyPassword(longPassword, s, longHash.value()));
    // Bytes after position 72 still matter.
    EXPECT_FALSE(hasher.verifyPassword(std::string(199, 'p') + "q", s, longHash.value()));
    EXPECT_TRUE(hasher.verifyPassword(withNul, s, nulHash.value()));
    EXPECT_FALSE(hasher.verifyPassword("pass", s, nulHash.value()));
}

TEST_F(PasswordHasherTest, VerifyUsesStoredCost) {
    auto s = salt();
    PasswordHasher cheaper{ScryptParams{8, 4, 1}};
    auto hash = cheaper.hashPassword("secret123", s);
    ASSERT_TRUE(hash.hasValue());
    // A hasher with different defaults still verifies old hashes.
    EXPECT_TRUE(hasher.verifyPassword("secret123", s, hash.value()));
}

TEST_F(PasswordHasherTest, MalformedHashFailsClosed) {
    auto s = salt();
    EXPECT_FALSE(hasher.verifyPassword("secret123", s, ""));
    EXPECT_FALSE(hasher.verifyPassword("secret123", s, "plaintext"));
    EXPECT_FALSE(hasher.verifyPassword("secret123", s, "$scrypt$ln=10,r=8$AAAA$AAAA"));
    EXPECT_FALSE(hasher.verifyPassword("secret123", s, "$scrypt$ln=0,r=8,p=1$AAAA$AAAA"));
    EXPECT_FALSE(hasher.verifyPassword("secret123", s, "$scrypt$ln=40,r=8,p=1$AAAA$AAAA"));
    EXPECT_FALSE(hasher.verifyPassword("secret123", s, "$scrypt$ln=10,r=8,p=1$!!$AAAA"));
    EXPECT_FALSE(hasher.verifyPassword("secret123", s, "$scrypt$ln=10,r=8,p=1$AAAA$AAAA$x"));
}

TEST_F(PasswordHasherTest, StoredHashWithOversizedCostIsRejected) {
    auto s = salt();
    // 128 * 64 * 2^20 bytes = 8 GiB.
    EXPECT_FALSE(hasher.verifyPassword("secret123", s, "$scrypt$ln=20,r=64,p=1$AAAA$AAAA"));
    EXPECT_FALSE(hasher.verifyPassword("secret123", s, "$scrypt$ln=10,r=65,p=1$AAAA$AAAA"));
    EXPECT_FALSE(hasher.verifyPassword("secret123", s, "$scrypt$ln=10,r=8,p=1000$AAAA$AAAA"));
    EXPECT_FALSE(hasher.verifyPassword("secret123", s, "$scrypt$ln=10,r=0,p=1$AAAA$AAAA"));
}

TEST(ScryptLimitsTest, MemoryCap) {
    EXPECT_EQ(scryptMemoryBytes(ScryptParams{14, 8, 1}), uint64_t{16} << 20);
    EXPECT_TRUE(scryptParamsWithinLimits(ScryptParams{14, 8, 1}));
    EXPECT_TRUE(scryptParamsWithinLimits(ScryptParams{20, 2, 1}));   // exactly 256 MiB
    EXPECT_FALSE(scryptParamsWithinLimits(ScryptParams{20, 4, 1}));  // 512 MiB
    EXPECT_FALSE(scryptParamsWithinLimits(ScryptParams{20, 64, 1}));
    EXPECT_FALSE(scryptParamsWithinLimits(ScryptParams{21, 1, 1}));
    EXPECT_FALSE(scryptParamsWithinLimits(ScryptParams{14, 8, 0}));
}

TEST_F(PasswordHasherTest, HashGeneratesSalt) {
    auto hashed = hasher.hash("secret123");
    ASSERT_TRUE(hashed.hasValue());
    EXPECT_EQ(hashed.value().salt.size(), kSaltLength);
    EXPECT_TRUE(hasher.verifyPassword("secret123", hashed.value().salt, hashed.value().hash));
}

TEST_F(PasswordHasherTest, InvalidCostIsHashFailed) {
    PasswordHasher broken{ScryptParams{0, 8, 1}};
    auto hash = broken.hashPassword("secret123", salt());
    ASSERT_TRUE(hash.hasError());
    EXPECT_EQ(hash.error().code(), ErrorCode::HashFailed);
}

TEST_F(PasswordHasherTest, OversizedCostIsHashFailedWithoutAllocating) {
    PasswordHasher huge{ScryptParams{20, 64, 1}};
    auto hash = huge.hashPassword("secret123", salt());
    ASSERT_TRUE(hash.hasError());
    EXPECT_EQ(hash.error().code(), ErrorCode::HashFailed);
}

TEST_F(PasswordHasherTest, ConcurrentHashing) {
    constexpr int kThreads = 4;
    std::vector<std::thread> threads;
    std::vector<int> verified(kThreads, 0);
    for (int t = 0; t < kThreads; ++t) {
        threads.emplace_back([this, t, &verified]() {
            auto pw = "password-" + std::to_string(t);
            auto hashed = hasher.hash(pw);
            if (hashed && hasher.verifyPassword(pw, hashed.value().salt, hashed.value().hash)) {
                verified[t] = 1;
            }
        });
    }
    for (auto& th : threads) {
        th.join();
    }
    for (int v : verified) {
        EXPECT_EQ(v, 1);
    }
}
