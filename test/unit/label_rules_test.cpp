// SPDX-FileCopyrightText: 2026 Intel Corporation
// SPDX-License-Identifier: Apache-2.0

#include <gtest/gtest.h>

#include "label_rules.hpp"

#include <string>

namespace labelguard {
namespace {

//
// Parameterized tests for well-formed labels
//
struct LabelTestCase {
    std::string name;
    std::string label;
};

void PrintTo(const LabelTestCase& tc, std::ostream* os) {
    *os << tc.name;
}

class WellFormedLabelTest : public ::testing::TestWithParam<LabelTestCase> {};

TEST_P(WellFormedLabelTest, AcceptsWellFormedLabel) {
    const auto& tc = GetParam();
    EXPECT_TRUE(isWellFormedLabel(tc.label)) << "Expected '" << tc.label << "' to be valid";
}

INSTANTIATE_TEST_SUITE_P(
    WellFormedLabels, WellFormedLabelTest,
    ::testing::Values(LabelTestCase{"Lowercase", "lowercase"},
                      LabelTestCase{"KebabCase", "kebab-case"},
                      LabelTestCase{"LeadingDigits", "50-name"},
                      LabelTestCase{"NumericOnly", "235235"}, LabelTestCase{"SingleChar", "x"},
                      LabelTestCase{"SingleDigit", "7"},
                      LabelTestCase{"DoubleHyphen", "a--b"},
                      LabelTestCase{"MaxLength", std::string(MAX_LABEL_LENGTH, 'a')}),
    [](const ::testing::TestParamInfo<LabelTestCase>& info) { return info.param.name; });

//
// Parameterized tests for malformed labels
//
class MalformedLabelTest : public ::testing::TestWithParam<LabelTestCase> {};

TEST_P(MalformedLabelTest, RejectsMalformedLabel) {
    const auto& tc = GetParam();
    EXPECT_FALSE(isWellFormedLabel(tc.label)) << "Expected '" << tc.label << "' to be rejected";
}

INSTANTIATE_TEST_SUITE_P(
    MalformedLabels, MalformedLabelTest,
    ::testing::Values(
        LabelTestCase{"Empty", ""}, LabelTestCase{"Uppercase", "UPPERCASE"},
        LabelTestCase{"CamelCase", "CamelCase"}, LabelTestCase{"LeadingHyphen", "-name"},
        LabelTestCase{"TrailingHyphen", "name-"}, LabelTestCase{"OnlyHyphen", "-"},
        LabelTestCase{"Underscore", "snake_case"}, LabelTestCase{"Dot", "invalid.name"},
        LabelTestCase{"AtSign", "asdf@fasd"}, LabelTestCase{"Space", "asd f"},
        LabelTestCase{"Tab", "a\tb"}, LabelTestCase{"NullByte", std::string("ab\0cd", 5)},
        LabelTestCase{"NonAscii", "caf\xc3\xa9"},
        LabelTestCase{"TooLong", std::string(MAX_LABEL_LENGTH + 1, 'a')}),
    [](const ::testing::TestParamInfo<LabelTestCase>& info) { return info.param.name; });

TEST(LabelCharTest, AllowedCharacterSet) {
    for (int c = 0; c < 256; ++c) {
        const char ch = static_cast<char>(c);
        const bool expected = (ch >= 'a' && ch <= 'z') || (ch >= '0' && ch <= '9') || ch == '-';
        EXPECT_EQ(isLabelChar(ch), expected) << "byte " << c;
    }
}

} // namespace
} // namespace labelguard
