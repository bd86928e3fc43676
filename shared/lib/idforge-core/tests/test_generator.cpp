/**
 * @file test_generator.cpp
 * @brief Unit tests for Generator: constraints, reproducibility, failures
 */

#include <gtest/gtest.h>
#include <algorithm>
#include <set>
#include <stdexcept>
#include <string>
#include "idforge/core/generator.h"
#include "config/config_manager.h"
#include "test_helpers.h"

using namespace idforge::core;
using namespace test_helpers;

class GeneratorTest : public ::testing::Test {
protected:
    std::shared_ptr<const FormatRegistry> registry_ = defaultRegistry();
    Generator generator_{registry_};
    Validator validator_{registry_};
};

// ============================================================================
// Output shape
// ============================================================================

TEST_F(GeneratorTest, Iban_Germany) {
    auto r = generator_.generate(Category::IBAN, "DE", seeded(7));
    ASSERT_TRUE(r.success) << r.message;
    EXPECT_EQ(r.record.raw.size(), 22u);
    EXPECT_EQ(r.record.raw.substr(0, 2), "DE");
    EXPECT_EQ(r.record.category, Category::IBAN);
    EXPECT_EQ(r.record.code, "DE");
    EXPECT_EQ(r.record.formatted.size(), 27u);  // five group spaces
    EXPECT_TRUE(validator_.validate(r.record.raw, Category::IBAN, std::string("DE")).valid);
}

TEST_F(GeneratorTest, CreditCard_Visa) {
    for (uint64_t seed = 1; seed <= 20; ++seed) {
        auto r = generator_.generate(Category::CREDIT_CARD, "visa", seeded(seed));
        ASSERT_TRUE(r.success) << r.message;
        EXPECT_TRUE(isDigits(r.record.raw)) << r.record.raw;
        EXPECT_EQ(r.record.raw[0], '4');
        EXPECT_TRUE(luhnValid(r.record.raw)) << r.record.raw;
    }
}

TEST_F(GeneratorTest, Vat_FranceKeyCoversSiren) {
    for (uint64_t seed = 1; seed <= 10; ++seed) {
        auto r = generator_.generate(Category::VAT, "FR", seeded(seed));
        ASSERT_TRUE(r.success) << r.message;
        ASSERT_EQ(r.record.raw.size(), 13u);
        const std::string siren = r.record.raw.substr(4);
        EXPECT_TRUE(luhnValid(siren)) << r.record.raw;
        const long long key = (12 + 3 * (std::stoll(siren) % 97)) % 97;
        EXPECT_EQ(std::stoi(r.record.raw.substr(2, 2)), key) << r.record.raw;
    }
}

TEST_F(GeneratorTest, Record_CarriesSpecMetadata) {
    auto r = generator_.generate(Category::PERSONAL_ID, "PL", seeded(3));
    ASSERT_TRUE(r.success) << r.message;
    EXPECT_EQ(r.record.name, "PESEL");
    EXPECT_EQ(r.record.holder, HolderType::INDIVIDUAL);
    ASSERT_TRUE(r.record.seed.has_value());
    EXPECT_EQ(*r.record.seed, 3u);
    EXPECT_TRUE(r.record.birthDate.has_value());
    EXPECT_TRUE(r.record.sex.has_value());
}

TEST_F(GeneratorTest, Record_NoPersonDataForAccounts) {
    auto r = generator_.generate(Category::IBAN, "FR", seeded(3));
    ASSERT_TRUE(r.success) << r.message;
    EXPECT_FALSE(r.record.birthDate.has_value());
    EXPECT_FALSE(r.record.sex.has_value());
}

// ============================================================================
// Constraints
// ============================================================================

TEST_F(GeneratorTest, YearRange_Honored) {
    for (uint64_t seed = 1; seed <= 30; ++seed) {
        auto r = generator_.generate(Category::PERSONAL_ID, "PL", yearRange(1980, 1990, seed));
        ASSERT_TRUE(r.success) << r.message;
        ASSERT_TRUE(r.record.birthDate.has_value());
        EXPECT_GE(r.record.birthDate->year, 1980);
        EXPECT_LE(r.record.birthDate->year, 1990);
    }
}

TEST_F(GeneratorTest, YearRange_SingleYear) {
    auto r = generator_.generate(Category::PERSONAL_ID, "EE", yearRange(2001, 2001, 11));
    ASSERT_TRUE(r.success) << r.message;
    EXPECT_EQ(r.record.birthDate->year, 2001);
}

TEST_F(GeneratorTest, YearRange_OneSidedUsesRepresentableBound) {
    Constraints c = seeded(5);
    c.yearFrom = 2050;
    auto r = generator_.generate(Category::PERSONAL_ID, "PL", c);
    ASSERT_TRUE(r.success) << r.message;
    EXPECT_GE(r.record.birthDate->year, 2050);
    EXPECT_LE(r.record.birthDate->year, 2099);
}

TEST_F(GeneratorTest, YearRange_Inverted) {
    auto r = generator_.generate(Category::PERSONAL_ID, "PL", yearRange(1990, 1980, 1));
    EXPECT_FALSE(r.success);
    EXPECT_EQ(r.error, ErrorKind::UNSATISFIABLE_CONSTRAINT);
    EXPECT_FALSE(r.message.empty());
}

TEST_F(GeneratorTest, YearRange_NotRepresentable) {
    // Singapore century letters start at 1900
    auto r = generator_.generate(Category::PERSONAL_ID, "SG", yearRange(1850, 1890, 1));
    EXPECT_FALSE(r.success);
    EXPECT_EQ(r.error, ErrorKind::UNSATISFIABLE_CONSTRAINT);
}

TEST_F(GeneratorTest, YearRange_IgnoredWithoutPersonData) {
    auto r = generator_.generate(Category::IBAN, "DE", yearRange(1850, 1890, 1));
    EXPECT_TRUE(r.success) << r.message;
}

TEST_F(GeneratorTest, Sex_Honored) {
    for (uint64_t seed = 1; seed <= 20; ++seed) {
        Constraints c = seeded(seed);
        c.sex = Sex::FEMALE;
        auto r = generator_.generate(Category::PERSONAL_ID, "PL", c);
        ASSERT_TRUE(r.success) << r.message;
        EXPECT_EQ(r.record.sex, Sex::FEMALE);
        // PESEL sex digit is the tenth, even for women
        EXPECT_EQ((r.record.raw[9] - '0') % 2, 0) << r.record.raw;
    }
}

// ============================================================================
// Reproducibility
// ============================================================================

TEST_F(GeneratorTest, SameSeedSameRecord) {
    auto a = generator_.generate(Category::PERSONAL_ID, "IT", seeded(424242));
    auto b = generator_.generate(Category::PERSONAL_ID, "IT", seeded(424242));
    ASSERT_TRUE(a.success) << a.message;
    ASSERT_TRUE(b.success) << b.message;
    EXPECT_EQ(a.record.raw, b.record.raw);
    EXPECT_EQ(a.record.birthDate, b.record.birthDate);
    EXPECT_EQ(a.record.sex, b.record.sex);
}

TEST_F(GeneratorTest, DifferentSeedsDiffer) {
    auto a = generator_.generate(Category::IBAN, "GB", seeded(1));
    auto b = generator_.generate(Category::IBAN, "GB", seeded(2));
    ASSERT_TRUE(a.success && b.success);
    EXPECT_NE(a.record.raw, b.record.raw);
}

TEST_F(GeneratorTest, UnseededRecordsReportSeed) {
    auto r = generator_.generate(Category::LEI, "LEI");
    ASSERT_TRUE(r.success) << r.message;
    ASSERT_TRUE(r.record.seed.has_value());

    auto again = generator_.generate(Category::LEI, "LEI", seeded(*r.record.seed));
    EXPECT_EQ(again.record.raw, r.record.raw);
}

// ============================================================================
// Code selection
// ============================================================================

TEST_F(GeneratorTest, UnknownCode) {
    auto r = generator_.generate(Category::IBAN, "XX", seeded(1));
    EXPECT_FALSE(r.success);
    EXPECT_EQ(r.error, ErrorKind::UNKNOWN_FORMAT);
}

TEST_F(GeneratorTest, WildcardPicksRegisteredCode) {
    auto codes = registry_->list(Category::VAT).toVector();
    for (uint64_t seed = 1; seed <= 10; ++seed) {
        auto r = generator_.generate(Category::VAT, "*", seeded(seed));
        ASSERT_TRUE(r.success) << r.message;
        EXPECT_NE(std::find(codes.begin(), codes.end(), r.record.code), codes.end());
    }

    auto empty = generator_.generate(Category::CREDIT_CARD, "", seeded(1));
    EXPECT_TRUE(empty.success) << empty.message;
}

TEST_F(GeneratorTest, Holder_CompanyPicksEin) {
    for (uint64_t seed = 1; seed <= 10; ++seed) {
        Constraints c = seeded(seed);
        c.holder = HolderType::COMPANY;
        auto r = generator_.generate(Category::TAX_ID, "US", c);
        ASSERT_TRUE(r.success) << r.message;
        EXPECT_EQ(r.record.code, "US-EIN");
        EXPECT_EQ(r.record.holder, HolderType::COMPANY);
        EXPECT_TRUE(validator_.validate(r.record.raw, Category::TAX_ID,
                                        std::string("US-EIN")).valid);
    }
}

TEST_F(GeneratorTest, Holder_IndividualStaysWithPersonalNumbers) {
    std::set<std::string> seen;
    for (uint64_t seed = 1; seed <= 30; ++seed) {
        Constraints c = seeded(seed);
        c.holder = HolderType::INDIVIDUAL;
        auto r = generator_.generate(Category::TAX_ID, "US", c);
        ASSERT_TRUE(r.success) << r.message;
        EXPECT_TRUE(r.record.code == "US" || r.record.code == "US-SSN") << r.record.code;
        seen.insert(r.record.code);
    }
    EXPECT_EQ(seen.size(), 2u);
}

TEST_F(GeneratorTest, Holder_AnyKeepsExactCode) {
    Constraints c = seeded(4);
    c.holder = HolderType::ANY;
    auto r = generator_.generate(Category::TAX_ID, "US", c);
    ASSERT_TRUE(r.success) << r.message;
    EXPECT_EQ(r.record.code, "US");
}

TEST_F(GeneratorTest, Holder_Unsatisfiable) {
    Constraints c = seeded(1);
    c.holder = HolderType::COMPANY;
    auto r = generator_.generate(Category::PERSONAL_ID, "PL", c);
    EXPECT_FALSE(r.success);
    EXPECT_EQ(r.error, ErrorKind::UNSATISFIABLE_CONSTRAINT);

    auto wildcard = generator_.generate(Category::PERSONAL_ID, "*", c);
    EXPECT_EQ(wildcard.error, ErrorKind::UNSATISFIABLE_CONSTRAINT);

    auto unknown = generator_.generate(Category::TAX_ID, "XX", c);
    EXPECT_EQ(unknown.error, ErrorKind::UNKNOWN_FORMAT);
}

TEST_F(GeneratorTest, Holder_WildcardFiltersCategory) {
    for (uint64_t seed = 1; seed <= 20; ++seed) {
        Constraints c = seeded(seed);
        c.holder = HolderType::COMPANY;
        auto r = generator_.generate(Category::TAX_ID, "*", c);
        ASSERT_TRUE(r.success) << r.message;
        EXPECT_NE(r.record.holder, HolderType::INDIVIDUAL) << r.record.code;
    }
}

// ============================================================================
// Settings and serialization
// ============================================================================

TEST_F(GeneratorTest, SettingsDefaults) {
    GeneratorSettings s;
    EXPECT_EQ(s.maxAttempts, 256);
    EXPECT_EQ(s.minBirthYear, 1940);
    EXPECT_EQ(s.maxBirthYear, 2005);
    EXPECT_EQ(generator_.settings().maxAttempts, 256);
}

TEST_F(GeneratorTest, SettingsFromConfig) {
    auto& config = common::ConfigManager::getInstance();
    config.set(common::ConfigManager::MAX_ATTEMPTS, "32");
    config.set(common::ConfigManager::MIN_BIRTH_YEAR, "1960");
    config.set(common::ConfigManager::MAX_BIRTH_YEAR, "1965");
    GeneratorSettings s = GeneratorSettings::fromConfig();
    EXPECT_EQ(s.maxAttempts, 32);
    EXPECT_EQ(s.minBirthYear, 1960);
    EXPECT_EQ(s.maxBirthYear, 1965);

    // Invalid values fall back to the defaults
    config.set(common::ConfigManager::MAX_ATTEMPTS, "0");
    config.set(common::ConfigManager::MIN_BIRTH_YEAR, "2000");
    config.set(common::ConfigManager::MAX_BIRTH_YEAR, "1990");
    s = GeneratorSettings::fromConfig();
    EXPECT_EQ(s.maxAttempts, 256);
    EXPECT_EQ(s.minBirthYear, 1940);
    EXPECT_EQ(s.maxBirthYear, 2005);

    config.remove(common::ConfigManager::MAX_ATTEMPTS);
    config.remove(common::ConfigManager::MIN_BIRTH_YEAR);
    config.remove(common::ConfigManager::MAX_BIRTH_YEAR);
}

TEST_F(GeneratorTest, DefaultBirthWindow) {
    GeneratorSettings narrow;
    narrow.minBirthYear = 1970;
    narrow.maxBirthYear = 1971;
    Generator g(registry_, narrow);
    for (uint64_t seed = 1; seed <= 10; ++seed) {
        auto r = g.generate(Category::PERSONAL_ID, "SE", seeded(seed));
        ASSERT_TRUE(r.success) << r.message;
        EXPECT_GE(r.record.birthDate->year, 1970);
        EXPECT_LE(r.record.birthDate->year, 1971);
    }
}

TEST_F(GeneratorTest, NullRegistryThrows) {
    EXPECT_THROW(Generator(nullptr), std::invalid_argument);
}

TEST_F(GeneratorTest, ToJson) {
    auto r = generator_.generate(Category::PERSONAL_ID, "PL", seeded(9));
    ASSERT_TRUE(r.success) << r.message;
    Json::Value json = r.record.toJson();
    EXPECT_EQ(json["category"].asString(), "personal_id");
    EXPECT_EQ(json["code"].asString(), "PL");
    EXPECT_EQ(json["name"].asString(), "PESEL");
    EXPECT_EQ(json["raw"].asString(), r.record.raw);
    EXPECT_EQ(json["formatted"].asString(), r.record.formatted);
    EXPECT_EQ(json["holder"].asString(), "individual");
    EXPECT_EQ(json["birthDate"].asString(), r.record.birthDate->toIsoString());
    EXPECT_EQ(json["seed"].asUInt64(), 9u);
}
