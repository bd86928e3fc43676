/**
 * @file test_registry.cpp
 * @brief Unit tests for FormatRegistry construction, verification and lookup
 */

#include <gtest/gtest.h>
#include <algorithm>
#include <set>
#include "idforge/core/registry.h"
#include "exception/exceptions.h"
#include "test_helpers.h"

using namespace idforge::core;
using namespace idforge::core::layout;
using namespace test_helpers;

class RegistryTest : public ::testing::Test {
protected:
    std::shared_ptr<const FormatRegistry> registry_ = defaultRegistry();

    static FormatRegistry build(std::vector<FormatSpec> specs) {
        return FormatRegistry(ChecksumLibrary::standard(), std::move(specs));
    }
};

// ============================================================================
// Built-in catalog
// ============================================================================

TEST_F(RegistryTest, Default_EveryCategoryPopulated) {
    for (Category c : kAllCategories) {
        EXPECT_FALSE(registry_->list(c).empty()) << categoryToString(c);
    }
}

TEST_F(RegistryTest, Default_IsShared) {
    EXPECT_EQ(registry_.get(), FormatRegistry::createDefault().get());
}

TEST_F(RegistryTest, Default_AllInRegistryOrder) {
    const auto& all = registry_->all();
    ASSERT_EQ(all.size(), registry_->size());
    for (size_t i = 1; i < all.size(); ++i) {
        const bool ordered = all[i - 1]->category < all[i]->category ||
            (all[i - 1]->category == all[i]->category && all[i - 1]->code < all[i]->code);
        EXPECT_TRUE(ordered) << all[i - 1]->key() << " before " << all[i]->key();
    }
}

TEST_F(RegistryTest, Default_DerivedLengths) {
    const FormatSpec& iban = registry_->lookup(Category::IBAN, "DE");
    EXPECT_EQ(iban.minLength, 22);
    EXPECT_EQ(iban.maxLength, 22);

    const FormatSpec& bic = registry_->lookup(Category::SWIFT_BIC, "DE");
    EXPECT_EQ(bic.minLength, 8);
    EXPECT_EQ(bic.maxLength, 11);
}

TEST_F(RegistryTest, Default_ChecksumWidthResolved) {
    const FormatSpec& iban = registry_->lookup(Category::IBAN, "FR");
    ASSERT_EQ(iban.layout[1].kind, TokenKind::CHECKSUM);
    EXPECT_EQ(iban.layout[1].checkWidth, 2);
    EXPECT_EQ(iban.layout[1].checkAlphabet, kDigitChars);
}

TEST_F(RegistryTest, Default_DependentChecksOrdered) {
    // The second CPF digit covers the first
    const FormatSpec& cpf = registry_->lookup(Category::PERSONAL_ID, "BR");
    ASSERT_EQ(cpf.checksumOrder.size(), 2u);
    EXPECT_EQ(cpf.checksumOrder[0], 1u);
    EXPECT_EQ(cpf.checksumOrder[1], 2u);
}

TEST_F(RegistryTest, Default_EveryFormatNamesItsCheck) {
    for (const FormatSpec* spec : registry_->all()) {
        EXPECT_FALSE(spec->checksumOrder.empty()) << spec->key();
    }

    // National Insurance numbers have no check character
    const FormatSpec& nino = registry_->lookup(Category::PERSONAL_ID, "GB");
    ASSERT_EQ(nino.checksumOrder.size(), 1u);
    const Token& slot = nino.layout[nino.checksumOrder[0]];
    EXPECT_EQ(slot.algorithm, "none");
    EXPECT_EQ(slot.checkWidth, 0);
    EXPECT_EQ(nino.minLength, 9);
}

TEST_F(RegistryTest, Default_DomesticAccountReplacesBban) {
    ASSERT_NO_THROW(FormatRegistry::createDefault());
    EXPECT_EQ(registry_->lookup(Category::BANK_ACCOUNT, "BR").name, "Agencia e conta");
    EXPECT_EQ(registry_->lookup(Category::BANK_ACCOUNT, "DE").name,
              "Bankleitzahl und Kontonummer");
    EXPECT_EQ(registry_->lookup(Category::BANK_ACCOUNT, "FR").name, "BBAN");
    // Brazil still has its IBAN
    EXPECT_NE(registry_->find(Category::IBAN, "BR"), nullptr);
}

TEST_F(RegistryTest, Default_FrenchVatKeyAfterSiren) {
    // FR + key(2) + SIREN(8 digits + Luhn); the key covers the full SIREN
    const FormatSpec& vat = registry_->lookup(Category::VAT, "FR");
    ASSERT_EQ(vat.layout.size(), 4u);
    EXPECT_EQ(vat.layout[3].scopeStart, 2);
    ASSERT_EQ(vat.checksumOrder.size(), 2u);
    EXPECT_EQ(vat.checksumOrder[0], 3u);
    EXPECT_EQ(vat.checksumOrder[1], 1u);
}

TEST_F(RegistryTest, Default_CoverageFloor) {
    EXPECT_GE(registry_->list(Category::IBAN).size(), 124u);
    EXPECT_GE(registry_->list(Category::PERSONAL_ID).size(), 97u);
    EXPECT_GE(registry_->list(Category::BANK_ACCOUNT).size(), 159u);
    EXPECT_GE(registry_->list(Category::DRIVERS_LICENSE).size() +
              registry_->list(Category::PASSPORT).size(), 79u);
    EXPECT_GE(registry_->list(Category::TAX_ID).size(), 80u);
    EXPECT_GE(registry_->list(Category::VAT).size(), 28u);
}

TEST_F(RegistryTest, Default_TaxHolderVariants) {
    EXPECT_EQ(registry_->lookup(Category::TAX_ID, "US").holder, HolderType::INDIVIDUAL);
    EXPECT_EQ(registry_->lookup(Category::TAX_ID, "US-SSN").holder, HolderType::INDIVIDUAL);
    EXPECT_EQ(registry_->lookup(Category::TAX_ID, "US-EIN").holder, HolderType::COMPANY);
    EXPECT_EQ(registry_->lookup(Category::TAX_ID, "IT").name, "Codice fiscale");
    EXPECT_EQ(registry_->lookup(Category::TAX_ID, "IT-PIVA").holder, HolderType::COMPANY);
}

// ============================================================================
// Listing and lookup
// ============================================================================

TEST_F(RegistryTest, List_SortedAndRestartable) {
    CodeRange codes = registry_->list(Category::IBAN);
    std::vector<std::string> first(codes.begin(), codes.end());
    std::vector<std::string> second = codes.toVector();

    EXPECT_EQ(first, second);
    EXPECT_EQ(first.size(), codes.size());
    EXPECT_TRUE(std::is_sorted(first.begin(), first.end()));
    EXPECT_NE(std::find(first.begin(), first.end(), "DE"), first.end());
}

TEST_F(RegistryTest, List_OnlyOneCategory) {
    auto codes = registry_->list(Category::LEI).toVector();
    ASSERT_EQ(codes.size(), 1u);
    EXPECT_EQ(codes[0], "LEI");
    EXPECT_EQ(registry_->ofCategory(Category::LEI).size(), 1u);
}

TEST_F(RegistryTest, List_CodesUnique) {
    for (Category c : kAllCategories) {
        auto codes = registry_->list(c).toVector();
        std::set<std::string> unique(codes.begin(), codes.end());
        EXPECT_EQ(unique.size(), codes.size()) << categoryToString(c);
    }
}

TEST_F(RegistryTest, Lookup_Known) {
    const FormatSpec& pesel = registry_->lookup(Category::PERSONAL_ID, "PL");
    EXPECT_EQ(pesel.name, "PESEL");
    EXPECT_EQ(pesel.holder, HolderType::INDIVIDUAL);
}

TEST_F(RegistryTest, Family_CodeAndVariants) {
    std::vector<std::string> codes;
    for (const FormatSpec* spec : registry_->family(Category::TAX_ID, "US")) {
        codes.push_back(spec->code);
    }
    EXPECT_EQ(codes, (std::vector<std::string>{"US", "US-EIN", "US-SSN"}));

    // Only whole code stems match
    EXPECT_TRUE(registry_->family(Category::TAX_ID, "U").empty());
    EXPECT_TRUE(registry_->family(Category::TAX_ID, "XX").empty());
    EXPECT_EQ(registry_->family(Category::IBAN, "DE").size(), 1u);
}

TEST_F(RegistryTest, Family_VariantWithoutPrimary) {
    FormatRegistry r = build({makeTestSpec(Category::TAX_ID, "ZZ-A", {digits(4)}),
                              makeTestSpec(Category::TAX_ID, "ZZ-B", {digits(5)}),
                              makeTestSpec(Category::TAX_ID, "ZZZ", {digits(6)})});
    auto family = r.family(Category::TAX_ID, "ZZ");
    ASSERT_EQ(family.size(), 2u);
    EXPECT_EQ(family[0]->code, "ZZ-A");
    EXPECT_EQ(family[1]->code, "ZZ-B");
}

TEST_F(RegistryTest, Lookup_UnknownThrows) {
    EXPECT_THROW(registry_->lookup(Category::IBAN, "XX"), common::UnknownFormatException);
    EXPECT_EQ(registry_->find(Category::IBAN, "XX"), nullptr);
}

TEST_F(RegistryTest, Lookup_CodeIsCategoryScoped) {
    EXPECT_NE(registry_->find(Category::CREDIT_CARD, "visa"), nullptr);
    EXPECT_EQ(registry_->find(Category::IBAN, "visa"), nullptr);
}

// ============================================================================
// Verification failures
// ============================================================================

TEST_F(RegistryTest, Verify_DuplicateKey) {
    EXPECT_THROW(build({makeTestSpec(Category::TAX_ID, "ZZ", {digits(4)}),
                        makeTestSpec(Category::TAX_ID, "ZZ", {digits(5)})}),
                 common::RegistryException);
}

TEST_F(RegistryTest, Verify_SameCodeDifferentCategories) {
    FormatRegistry r = build({makeTestSpec(Category::TAX_ID, "ZZ", {digits(4)}),
                              makeTestSpec(Category::VAT, "ZZ", {digits(5)})});
    EXPECT_EQ(r.size(), 2u);
}

TEST_F(RegistryTest, Verify_DanglingAlgorithm) {
    EXPECT_THROW(build({makeTestSpec(Category::TAX_ID, "ZZ", {digits(4), check("no-such-scheme")})}),
                 common::RegistryException);
}

TEST_F(RegistryTest, Verify_ScopeOutOfRange) {
    EXPECT_THROW(build({makeTestSpec(Category::TAX_ID, "ZZ",
                                     {digits(4), checkSpan("luhn", 0, 5)})}),
                 common::RegistryException);
}

TEST_F(RegistryTest, Verify_ScopeCoversSlot) {
    EXPECT_THROW(build({makeTestSpec(Category::TAX_ID, "ZZ",
                                     {digits(4), checkSpan("luhn", 0, 2)})}),
                 common::RegistryException);
}

TEST_F(RegistryTest, Verify_CyclicChecksums) {
    EXPECT_THROW(build({makeTestSpec(Category::TAX_ID, "ZZ",
                                     {digits(4), checkAll("luhn"), checkAll("verhoeff")})}),
                 common::RegistryException);
}

TEST_F(RegistryTest, Verify_TwoVariableTokens) {
    EXPECT_THROW(build({makeTestSpec(Category::TAX_ID, "ZZ", {digits(1, 3), digits(2, 4)})}),
                 common::RegistryException);
}

TEST_F(RegistryTest, Verify_InvalidValueRange) {
    EXPECT_THROW(build({makeTestSpec(Category::TAX_ID, "ZZ", {digitRange(2, 50, 10)})}),
                 common::RegistryException);
    EXPECT_THROW(build({makeTestSpec(Category::TAX_ID, "ZZ", {digitRange(2, 1, 100)})}),
                 common::RegistryException);
}

TEST_F(RegistryTest, Verify_SeparatorCollidesWithToken) {
    EXPECT_THROW(build({makeTestSpec(Category::TAX_ID, "ZZ", {digits(6)}, groupsOf(3, "0"))}),
                 common::RegistryException);
}

TEST_F(RegistryTest, Verify_BadDatePattern) {
    EXPECT_THROW(build({makeTestSpec(Category::PERSONAL_ID, "ZZ", {date("YYMMD")})}),
                 common::RegistryException);
}

TEST_F(RegistryTest, Verify_EmptyCode) {
    EXPECT_THROW(build({makeTestSpec(Category::TAX_ID, "", {digits(4)})}),
                 common::RegistryException);
}

TEST_F(RegistryTest, Verify_ChecksumDependencyOrder) {
    // Slot 1 covers slot 3, so slot 3 is computed first
    FormatRegistry r = build({makeTestSpec(Category::TAX_ID, "ZZ",
        {digits(4), checkSpan("luhn", 2, 4), digits(2), checkSpan("verhoeff", 2, 3)})});
    const FormatSpec& s = r.lookup(Category::TAX_ID, "ZZ");
    ASSERT_EQ(s.checksumOrder.size(), 2u);
    EXPECT_EQ(s.checksumOrder[0], 3u);
    EXPECT_EQ(s.checksumOrder[1], 1u);
    EXPECT_EQ(s.minLength, 8);
}
