/**
 * @file test_person_codec.cpp
 * @brief Unit tests for birth date, century and sex token encoding
 */

#include <gtest/gtest.h>
#include "person_codec.h"
#include "test_helpers.h"

using namespace idforge::core;
using namespace idforge::core::layout;
using namespace idforge::core::detail;
using namespace test_helpers;

class PersonCodecTest : public ::testing::Test {
protected:
    RandomSource rng_{42};

    static Person person(int year, int month, int day, Sex sex) {
        Person p;
        p.date = BirthDate{year, month, day};
        p.sex = sex;
        return p;
    }

    std::string render(const Token& token, const Person& p) {
        auto text = renderPersonToken(token, p, rng_);
        EXPECT_TRUE(text.has_value());
        return text.value_or("");
    }

    /// Feed (token, text) pairs and resolve; returns the resolve outcome
    static bool decode(PersonDecoder& decoder,
                       const std::vector<std::pair<Token, std::string>>& parts,
                       std::string& error) {
        for (const auto& part : parts) {
            if (!decoder.feed(part.first, part.second, error)) return false;
        }
        return decoder.resolve(error);
    }
};

// ============================================================================
// Calendar
// ============================================================================

TEST_F(PersonCodecTest, DaysInMonth) {
    EXPECT_EQ(daysInMonth(2023, 1), 31);
    EXPECT_EQ(daysInMonth(2023, 4), 30);
    EXPECT_EQ(daysInMonth(2024, 2), 29);
    EXPECT_EQ(daysInMonth(1900, 2), 28);
    EXPECT_EQ(daysInMonth(2000, 2), 29);
    EXPECT_EQ(daysInMonth(2023, 13), 0);
}

TEST_F(PersonCodecTest, RepresentableYears) {
    auto registry = defaultRegistry();
    auto years = [&registry](const std::string& code) {
        return representableYears(registry->lookup(Category::PERSONAL_ID, code));
    };

    EXPECT_EQ(years("SE").from, 1920);  // two-digit year, default pivot
    EXPECT_EQ(years("SE").to, 2019);
    EXPECT_EQ(years("CZ").from, 1954);
    EXPECT_EQ(years("NO").from, 1855);
    EXPECT_EQ(years("NO").to, 2039);
    EXPECT_EQ(years("PL").from, 1800);  // century carried by the month
    EXPECT_EQ(years("PL").to, 2099);
    EXPECT_EQ(years("SG").from, 1900);
}

// ============================================================================
// Rendering
// ============================================================================

TEST_F(PersonCodecTest, Render_PeselMonthOffset) {
    Token t = date("YYMMDD", MonthCoding::PESEL);
    EXPECT_EQ(render(t, person(2005, 3, 15, Sex::MALE)), "052315");
    EXPECT_EQ(render(t, person(1944, 5, 14, Sex::MALE)), "440514");
    EXPECT_EQ(render(t, person(1850, 1, 2, Sex::FEMALE)), "508102");
}

TEST_F(PersonCodecTest, Render_BulgarianMonthOffset) {
    Token t = date("YYMMDD", MonthCoding::BULGARIAN);
    EXPECT_EQ(render(t, person(2001, 7, 4, Sex::MALE)), "014704");
}

TEST_F(PersonCodecTest, Render_CzechFemaleMonth) {
    Token t = date("YYMMDD", MonthCoding::CZECH_FEMALE);
    EXPECT_EQ(render(t, person(1978, 1, 1, Sex::FEMALE)), "785101");
    EXPECT_EQ(render(t, person(1978, 1, 1, Sex::MALE)), "780101");
}

TEST_F(PersonCodecTest, Render_ItalianMonthLetterAndFemaleDay) {
    Token t = date("YYMDD", MonthCoding::ITALIAN_LETTER, DayCoding::FEMALE_PLUS_40);
    EXPECT_EQ(render(t, person(1985, 12, 10, Sex::MALE)), "85T10");
    EXPECT_EQ(render(t, person(1985, 12, 10, Sex::FEMALE)), "85T50");
}

TEST_F(PersonCodecTest, Render_JmbgThreeDigitYear) {
    EXPECT_EQ(render(date("DDMMYYY"), person(2003, 6, 9, Sex::MALE)), "0906003");
    EXPECT_EQ(render(date("DDMMYYY"), person(1987, 6, 9, Sex::MALE)), "0906987");
}

TEST_F(PersonCodecTest, Render_CenturyCodes) {
    EXPECT_EQ(render(century(CenturyCode::ESTONIAN), person(1976, 5, 3, Sex::MALE)), "3");
    EXPECT_EQ(render(century(CenturyCode::ESTONIAN), person(2001, 5, 3, Sex::FEMALE)), "6");
    EXPECT_EQ(render(century(CenturyCode::ROMANIAN), person(2001, 5, 3, Sex::FEMALE)), "6");
    EXPECT_EQ(render(century(CenturyCode::KOREAN), person(1850, 5, 3, Sex::MALE)), "9");
    EXPECT_EQ(render(century(CenturyCode::FINNISH_SIGN), person(2003, 5, 3, Sex::MALE)), "A");
    EXPECT_EQ(render(century(CenturyCode::SINGAPORE), person(1999, 5, 3, Sex::MALE)), "S");
}

TEST_F(PersonCodecTest, Render_CenturyOutOfRange) {
    auto text = renderPersonToken(century(CenturyCode::SINGAPORE), person(1899, 1, 1, Sex::MALE), rng_);
    EXPECT_FALSE(text.has_value());
}

TEST_F(PersonCodecTest, Render_SexCodes) {
    Token odd = sex(SexCoding::PARITY_ODD_MALE);
    for (int i = 0; i < 20; ++i) {
        int digit = render(odd, person(1990, 1, 1, Sex::FEMALE))[0] - '0';
        EXPECT_EQ(digit % 2, 0);
    }

    Token za = sex(SexCoding::LOW_FEMALE, 4);
    for (int i = 0; i < 20; ++i) {
        EXPECT_LT(std::stoi(render(za, person(1990, 1, 1, Sex::FEMALE))), 5000);
        EXPECT_GE(std::stoi(render(za, person(1990, 1, 1, Sex::MALE))), 5000);
    }

    EXPECT_EQ(render(sex(SexCoding::LETTER_HM), person(1990, 1, 1, Sex::FEMALE)), "M");
    EXPECT_EQ(render(sex(SexCoding::ONE_TWO), person(1990, 1, 1, Sex::MALE)), "1");
}

TEST_F(PersonCodecTest, Render_NorwegianIndividualFitsCentury) {
    Token t = century(CenturyCode::NORWEGIAN_INDIVIDUAL);
    for (int i = 0; i < 20; ++i) {
        int n = std::stoi(render(t, person(2010, 1, 1, Sex::MALE)));
        EXPECT_GE(n, 500);
        EXPECT_EQ(n % 2, 1);
    }
}

// ============================================================================
// Decoding
// ============================================================================

TEST_F(PersonCodecTest, Decode_Pesel) {
    PersonDecoder decoder;
    std::string error;
    ASSERT_TRUE(decode(decoder, {{date("YYMMDD", MonthCoding::PESEL), "052315"},
                                 {sex(SexCoding::PARITY_ODD_MALE), "3"}}, error)) << error;
    ASSERT_TRUE(decoder.birthDate().has_value());
    EXPECT_EQ(*decoder.birthDate(), (BirthDate{2005, 3, 15}));
    EXPECT_EQ(decoder.sex(), Sex::MALE);
}

TEST_F(PersonCodecTest, Decode_PeselInvalidMonth) {
    PersonDecoder decoder;
    std::string error;
    EXPECT_FALSE(decoder.feed(date("YYMMDD", MonthCoding::PESEL), "441314", error));
    EXPECT_FALSE(error.empty());
}

TEST_F(PersonCodecTest, Decode_EstonianCenturyAndSex) {
    PersonDecoder decoder;
    std::string error;
    ASSERT_TRUE(decode(decoder, {{century(CenturyCode::ESTONIAN), "4"},
                                 {date("YYMMDD"), "760503"}}, error)) << error;
    EXPECT_EQ(*decoder.birthDate(), (BirthDate{1976, 5, 3}));
    EXPECT_EQ(decoder.sex(), Sex::FEMALE);
}

TEST_F(PersonCodecTest, Decode_NonLeapFebruary29) {
    PersonDecoder decoder;
    std::string error;
    EXPECT_FALSE(decode(decoder, {{century(CenturyCode::ESTONIAN), "4"},
                                  {date("YYMMDD"), "000229"}}, error));
    EXPECT_NE(error.find("1900"), std::string::npos);
}

TEST_F(PersonCodecTest, Decode_TwoDigitYearPivot) {
    std::string error;

    PersonDecoder late;
    ASSERT_TRUE(decode(late, {{date("YYMMDD"), "811218"}}, error)) << error;
    EXPECT_EQ(late.birthDate()->year, 1981);

    PersonDecoder early;
    ASSERT_TRUE(decode(early, {{date("YYMMDD"), "191218"}}, error)) << error;
    EXPECT_EQ(early.birthDate()->year, 2019);

    PersonDecoder shifted;
    ASSERT_TRUE(decode(shifted, {{pivot(date("YYMMDD"), 1954), "530101"}}, error)) << error;
    EXPECT_EQ(shifted.birthDate()->year, 2053);
}

TEST_F(PersonCodecTest, Decode_NorwegianIndividualNumber) {
    Token ind = century(CenturyCode::NORWEGIAN_INDIVIDUAL);
    std::string error;

    PersonDecoder a;
    ASSERT_TRUE(decode(a, {{date("DDMMYY"), "150765"}, {ind, "005"}}, error)) << error;
    EXPECT_EQ(a.birthDate()->year, 1965);
    EXPECT_EQ(a.sex(), Sex::MALE);

    PersonDecoder b;
    ASSERT_TRUE(decode(b, {{date("DDMMYY"), "150720"}, {ind, "600"}}, error)) << error;
    EXPECT_EQ(b.birthDate()->year, 2020);
    EXPECT_EQ(b.sex(), Sex::FEMALE);

    PersonDecoder c;
    EXPECT_FALSE(decode(c, {{date("DDMMYY"), "150745"}, {ind, "600"}}, error));
}

TEST_F(PersonCodecTest, Decode_ItalianFemaleDay) {
    PersonDecoder decoder;
    std::string error;
    ASSERT_TRUE(decode(decoder, {{date("YYMDD", MonthCoding::ITALIAN_LETTER, DayCoding::FEMALE_PLUS_40),
                                  "85T50"}}, error)) << error;
    EXPECT_EQ(*decoder.birthDate(), (BirthDate{1985, 12, 10}));
    EXPECT_EQ(decoder.sex(), Sex::FEMALE);
}

TEST_F(PersonCodecTest, Decode_YearOnlyHasNoBirthDate) {
    PersonDecoder decoder;
    std::string error;
    ASSERT_TRUE(decode(decoder, {{date("YYYY"), "1990"}}, error)) << error;
    EXPECT_FALSE(decoder.birthDate().has_value());
    EXPECT_EQ(decoder.birthYear(), 1990);
    EXPECT_FALSE(decoder.birthMonth().has_value());
}

TEST_F(PersonCodecTest, Decode_YearAndMonthWithoutDay) {
    PersonDecoder decoder;
    std::string error;
    ASSERT_TRUE(decode(decoder, {{date("YYMM"), "8507"}}, error)) << error;
    EXPECT_FALSE(decoder.birthDate().has_value());
    EXPECT_EQ(decoder.birthYear(), 1985);
    EXPECT_EQ(decoder.birthMonth(), 7);

    // Vietnamese century digit plus two-digit year
    PersonDecoder vn;
    ASSERT_TRUE(decode(vn, {{century(CenturyCode::VIETNAMESE), "3"}, {date("YY"), "04"}}, error))
        << error;
    EXPECT_EQ(vn.birthYear(), 2004);
    EXPECT_EQ(vn.sex(), Sex::FEMALE);
}

TEST_F(PersonCodecTest, Decode_SexCodeOutOfRange) {
    PersonDecoder decoder;
    std::string error;
    EXPECT_FALSE(decoder.feed(sex(SexCoding::PARITY_ODD_MALE, 3, 2, 899), "900", error));
}
