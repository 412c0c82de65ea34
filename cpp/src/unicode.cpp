#include "unicode.hpp"

#include <unicode/uchar.h>
#include <unicode/utf8.h>

std::optional<unsigned> digit_value(char32_t cp) {
	auto c = static_cast<UChar32>(cp);
	if(u_charType(c) != U_DECIMAL_DIGIT_NUMBER) return std::nullopt;
	auto value = u_charDigitValue(c);
	if(value < 0) return std::nullopt;
	return static_cast<unsigned>(value);
}

code_point decode_utf8(std::string_view str, std::size_t offset) {
	auto bytes = reinterpret_cast<const uint8_t*>(str.data());
	auto length = static_cast<int32_t>(str.size());
	auto start = static_cast<int32_t>(offset), next = start;
	UChar32 c;
	U8_NEXT(bytes, next, length, c);
	auto consumed = static_cast<std::size_t>(next - start);
	if(c < 0)
		return { static_cast<unsigned char>(str[offset]), consumed, false };
	return { static_cast<char32_t>(c), consumed, true };
}
