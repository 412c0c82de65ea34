#pragma once

#include <iosfwd>
#include <string>
#include <string_view>
#include <variant>
#include <vector>
#include <boost/multiprecision/cpp_int.hpp>

// a run of decimal digits; text is kept verbatim so that the source
// string can be rebuilt and "5" stays distinct from "05"
struct natural_number {
	boost::multiprecision::cpp_int value;
	std::string text;
};

bool operator ==(const natural_number& x, const natural_number& y);
bool operator !=(const natural_number& x, const natural_number& y);

typedef std::variant<std::string, natural_number> natural_key_bit;
typedef std::vector<natural_key_bit> natural_key_type;

enum struct natural_order {
	less,
	equal,
	greater,
	incomparable,
};

std::ostream& operator <<(std::ostream& out, natural_order order);
std::ostream& operator <<(std::ostream& out, const natural_key_bit& bit);
std::ostream& operator <<(std::ostream& out, const natural_key_type& key);

natural_key_type natural_key(std::string_view str);

std::string natural_key_text(const natural_key_type& key);

natural_order natural_compare(const natural_key_type& x, const natural_key_type& y);
natural_order natural_compare(std::string_view x, std::string_view y);
