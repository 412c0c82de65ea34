#include <gtest/gtest.h>
#include "natkey.hpp"

#include <sstream>
#include <string>
#include <vector>

namespace {

natural_number number(const std::string& text, unsigned long value) {
	return natural_number{ .value = value, .text = text };
}

natural_order compare(const std::string& x, const std::string& y) {
	return natural_compare(natural_key(x), natural_key(y));
}

std::string show(const natural_key_type& key) {
	std::ostringstream out;
	out << key;
	return out.str();
}

}

TEST(NaturalKey, Empty) {
	EXPECT_TRUE(natural_key("").empty());
}

TEST(NaturalKey, SingleRuns) {
	EXPECT_EQ(natural_key("123"), natural_key_type{number("123", 123)});
	EXPECT_EQ(natural_key("abc"), natural_key_type{std::string("abc")});
}

TEST(NaturalKey, Alternating) {
	natural_key_type expected
		{ std::string("abc"), number("123", 123)
		, std::string("xyz"), number("456", 456)
		};
	EXPECT_EQ(natural_key("abc123xyz456"), expected);
	EXPECT_EQ(show(natural_key("abc123xyz456")),
		"[Letters(\"abc\"), Number(123), Letters(\"xyz\"), Number(456)]");
}

TEST(NaturalKey, KeepsWhitespaceAndPunctuation) {
	natural_key_type expected
		{ std::string(" file-"), number("2", 2), std::string(". txt ") };
	EXPECT_EQ(natural_key(" file-2. txt "), expected);
}

TEST(NaturalKey, NoSignParsing) {
	natural_key_type expected { std::string("-"), number("5", 5) };
	EXPECT_EQ(natural_key("-5"), expected);
}

TEST(NaturalKey, LeadingZeros) {
	auto key = natural_key("007");
	ASSERT_EQ(key.size(), 1u);
	EXPECT_EQ(std::get<natural_number>(key[0]).value, 7);
	EXPECT_EQ(natural_key("000"), natural_key_type{number("000", 0)});
	EXPECT_NE(natural_key("007"), natural_key("7"));
	EXPECT_EQ(compare("007", "7"), natural_order::equal);
}

TEST(NaturalKey, HugeNumbers) {
	std::string digits(200, '9');
	auto key = natural_key(digits);
	ASSERT_EQ(key.size(), 1u);
	boost::multiprecision::cpp_int expected = 1;
	for(int i = 0; i < 200; ++i) expected *= 10;
	expected -= 1;
	EXPECT_EQ(std::get<natural_number>(key[0]).value, expected);
	EXPECT_EQ(compare(digits, "1" + std::string(200, '0')), natural_order::less);
}

TEST(NaturalKey, UnicodeDigits) {
	// arabic-indic "١٢" and fullwidth "３"
	auto key = natural_key("v\xD9\xA1\xD9\xA2x\xEF\xBC\x93");
	ASSERT_EQ(key.size(), 4u);
	EXPECT_EQ(std::get<natural_number>(key[1]).value, 12);
	EXPECT_EQ(std::get<natural_number>(key[1]).text, "\xD9\xA1\xD9\xA2");
	EXPECT_EQ(std::get<natural_number>(key[3]).value, 3);
	EXPECT_EQ(compare("v\xD9\xA1\xD9\xA2", "v3"), natural_order::greater);
	EXPECT_EQ(compare("\xEF\xBC\x93", "3"), natural_order::equal);
}

TEST(NaturalKey, TangsaDigit) {
	natural_key_type expected
		{ std::string("x"), number("\xF0\x96\xAB\x81", 1) };
	EXPECT_EQ(natural_key("x\xF0\x96\xAB\x81"), expected);
	EXPECT_EQ(compare("\xF0\x96\xAB\x81", "a"), natural_order::incomparable);
	EXPECT_EQ(compare("v\xF0\x96\xAB\x81", "v2"), natural_order::less);
}

TEST(NaturalKey, NonDecimalNumericsAreLetters) {
	// "1½"
	natural_key_type expected { number("1", 1), std::string("\xC2\xBD") };
	EXPECT_EQ(natural_key("1\xC2\xBD"), expected);
}

TEST(NaturalKey, MalformedBytesAreLetters) {
	natural_key_type expected
		{ std::string("a\xFF"), number("1", 1), std::string("\xE2\x82") };
	EXPECT_EQ(natural_key("a\xFF" "1\xE2\x82"), expected);
}

TEST(NaturalKeyText, RoundTrip) {
	for(const std::string& str : std::vector<std::string>
			{ "", "abc", "0042", "file11.txt", " 1 2 3 ", "a\xFF" "9"
			, "v\xD9\xA1\xD9\xA2", "12abc" + std::string(50, '0') })
		EXPECT_EQ(natural_key_text(natural_key(str)), str) << str;
}

TEST(NaturalCompare, Letters) {
	EXPECT_EQ(compare("aaa", "aaa"), natural_order::equal);
	EXPECT_EQ(compare("aaa", "aab"), natural_order::less);
	EXPECT_EQ(compare("aab", "aaa"), natural_order::greater);
	EXPECT_EQ(compare("aaa", "aa"), natural_order::greater);
	EXPECT_EQ(compare("B", "a"), natural_order::less);
}

TEST(NaturalCompare, Numbers) {
	EXPECT_EQ(compare("111", "111"), natural_order::equal);
	EXPECT_EQ(compare("111", "112"), natural_order::less);
	EXPECT_EQ(compare("112", "111"), natural_order::greater);
	EXPECT_EQ(compare("9", "10"), natural_order::less);
}

TEST(NaturalCompare, Mixed) {
	EXPECT_EQ(compare("a1", "a1"), natural_order::equal);
	EXPECT_EQ(compare("a1", "a2"), natural_order::less);
	EXPECT_EQ(compare("a2", "a1"), natural_order::greater);
	EXPECT_EQ(compare("a2", "a10"), natural_order::less);
	EXPECT_EQ(compare("1a2", "1b1"), natural_order::less);
	EXPECT_EQ(compare("file2.txt", "file11.txt"), natural_order::less);
}

TEST(NaturalCompare, SharedAffixes) {
	for(std::string prefix : { "", "x", "img_" })
		for(std::string suffix : { "", ".png" })
			EXPECT_EQ(compare(prefix + "99" + suffix, prefix + "100" + suffix),
				natural_order::less) << prefix << suffix;
}

TEST(NaturalCompare, PrefixIsLess) {
	EXPECT_EQ(compare("a", "a1"), natural_order::less);
	EXPECT_EQ(compare("a1", "a"), natural_order::greater);
	EXPECT_EQ(compare("", "a"), natural_order::less);
	EXPECT_EQ(compare("", ""), natural_order::equal);
}

TEST(NaturalCompare, KindMismatchIsIncomparable) {
	EXPECT_EQ(compare("1", "a"), natural_order::incomparable);
	EXPECT_EQ(compare("a", "1"), natural_order::incomparable);
	EXPECT_EQ(compare("12abc", "abc12"), natural_order::incomparable);
	EXPECT_EQ(compare("1", "a1"), natural_order::incomparable);
	// no pairs, so length decides
	EXPECT_EQ(compare("", "1"), natural_order::less);
}

TEST(NaturalCompare, StringOverload) {
	EXPECT_EQ(natural_compare("file2", "file11"), natural_order::less);
	EXPECT_EQ(natural_compare(std::string("1"), std::string("a")),
		natural_order::incomparable);
}

TEST(NaturalOrder, Printing) {
	std::ostringstream out;
	out << natural_order::less << ' ' << natural_order::incomparable;
	EXPECT_EQ(out.str(), "less incomparable");
}
