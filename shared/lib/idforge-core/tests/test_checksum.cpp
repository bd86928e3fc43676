/**
 * @file test_checksum.cpp
 * @brief Unit tests for the checksum algorithm library
 */

#include <gtest/gtest.h>
#include <algorithm>
#include <random>
#include "idforge/core/checksum.h"
#include "exception/exceptions.h"
#include "test_helpers.h"

using namespace idforge::core;
using namespace test_helpers;

class ChecksumTest : public ::testing::Test {
protected:
    ChecksumLibrary library_ = ChecksumLibrary::standard();

    const ChecksumAlgorithm& algo(const std::string& name) {
        const ChecksumAlgorithm* a = library_.find(name);
        EXPECT_NE(a, nullptr) << name;
        return *a;
    }
};

// ============================================================================
// Scheme functions
// ============================================================================

TEST_F(ChecksumTest, Luhn_KnownDigits) {
    EXPECT_EQ(luhnCheckDigit("411111111111111"), 1);
    EXPECT_EQ(luhnCheckDigit("37828224631000"), 5);
    EXPECT_EQ(luhnCheckDigit("555555555555444"), 4);
}

TEST_F(ChecksumTest, Mod97_RearrangedIban) {
    EXPECT_EQ(mod97Remainder("370400440532013000DE89"), 1);
    EXPECT_EQ(mod97Remainder("370400440532013000DE88"), 0);
}

TEST_F(ChecksumTest, Mod97_RejectsForeignCharacters) {
    EXPECT_EQ(mod97Remainder("1234-5678"), -1);
}

TEST_F(ChecksumTest, Verhoeff_KnownDigits) {
    EXPECT_EQ(verhoeffCheckDigit("236"), 3);
    EXPECT_EQ(verhoeffCheckDigit("23412341234"), 6);
}

TEST_F(ChecksumTest, Iso7064Mod11_10_KnownDigits) {
    EXPECT_EQ(iso7064Mod11_10("8609574271"), 9);
    EXPECT_EQ(iso7064Mod11_10("6943515153"), 0);
}

// ============================================================================
// Named algorithms
// ============================================================================

TEST_F(ChecksumTest, IbanMod97_ComputesCheckPair) {
    auto check = algo("iban-mod97").compute("DE370400440532013000");
    ASSERT_TRUE(check.has_value());
    EXPECT_EQ(*check, "89");
    EXPECT_TRUE(algo("iban-mod97").verify("DE370400440532013000", "89"));
    EXPECT_FALSE(algo("iban-mod97").verify("DE370400440532013000", "98"));
}

TEST_F(ChecksumTest, IbanMod97_LettersInBban) {
    auto check = algo("iban-mod97").compute("GBWEST12345698765432");
    ASSERT_TRUE(check.has_value());
    EXPECT_EQ(*check, "82");
}

TEST_F(ChecksumTest, Lei_Iso7064Mod97_10) {
    auto check = algo("iso7064-mod97-10").compute("5493001KJTIIGC8Y1R");
    ASSERT_TRUE(check.has_value());
    EXPECT_EQ(*check, "12");
}

TEST_F(ChecksumTest, Luhn_RejectsNonDigitPayload) {
    EXPECT_FALSE(algo("luhn").compute("41111A").has_value());
}

TEST_F(ChecksumTest, Mod11_2_UsesX) {
    auto check = algo("iso7064-mod11-2").compute("11010519491231002");
    ASSERT_TRUE(check.has_value());
    EXPECT_EQ(*check, "X");
}

TEST_F(ChecksumTest, ItalianFiscalCode) {
    auto check = algo("italian-fiscal-code").compute("RSSMRA85T10A562");
    ASSERT_TRUE(check.has_value());
    EXPECT_EQ(*check, "S");
}

TEST_F(ChecksumTest, Widths) {
    EXPECT_EQ(algo("iban-mod97").width(), 2);
    EXPECT_EQ(algo("luhn").width(), 1);
    EXPECT_EQ(algo("none").width(), 0);
}

// ============================================================================
// Catalog
// ============================================================================

TEST_F(ChecksumTest, Library_FindUnknownReturnsNull) {
    EXPECT_EQ(library_.find("no-such-scheme"), nullptr);
}

TEST_F(ChecksumTest, Library_DuplicateNameThrows) {
    ChecksumLibrary lib;
    lib.add(ChecksumAlgorithm("dup", ChecksumKind::LUHN));
    EXPECT_THROW(lib.add(ChecksumAlgorithm("dup", ChecksumKind::VERHOEFF)),
                 common::RegistryException);
}

TEST_F(ChecksumTest, Library_NamesSorted) {
    auto names = library_.names();
    ASSERT_EQ(names.size(), library_.size());
    EXPECT_TRUE(std::is_sorted(names.begin(), names.end()));
}

// ============================================================================
// compute/verify law
// ============================================================================

TEST_F(ChecksumTest, EveryAlgorithm_VerifiesItsOwnCheck) {
    std::mt19937_64 rng(20240611);
    const std::string alphabets[] = {layout::kDigitChars, layout::kAlnumChars};

    for (const auto& name : library_.names()) {
        const ChecksumAlgorithm& a = algo(name);
        for (const auto& alphabet : alphabets) {
            for (int round = 0; round < 40; ++round) {
                const size_t length = 6 + rng() % 12;
                std::string payload;
                for (size_t i = 0; i < length; ++i) {
                    payload += alphabet[rng() % alphabet.size()];
                }
                auto check = a.compute(payload);
                if (!check) continue;
                EXPECT_TRUE(a.verify(payload, *check))
                    << name << " payload=" << payload << " check=" << *check;
            }
        }
    }
}
