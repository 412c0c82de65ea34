#pragma once

#include <cstddef>
#include <optional>
#include <string_view>

struct code_point {
	char32_t value;
	std::size_t length;
	bool valid;
};

// decode the utf-8 sequence starting at offset; a malformed sequence
// decodes as one invalid unit spanning its maximal ill-formed subpart
code_point decode_utf8(std::string_view str, std::size_t offset);

// decimal value of a unicode Nd code point
std::optional<unsigned> digit_value(char32_t cp);

inline bool is_digit(const code_point& cp) {
	return cp.valid && digit_value(cp.value).has_value();
}
