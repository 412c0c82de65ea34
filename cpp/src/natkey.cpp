#include "natkey.hpp"
#include "unicode.hpp"

#include <algorithm>
#include <ostream>

bool operator ==(const natural_number& x, const natural_number& y) {
	return x.text == y.text;
}

bool operator !=(const natural_number& x, const natural_number& y) {
	return !(x == y);
}

std::ostream& operator <<(std::ostream& out, natural_order order) {
	switch(order) {
		case natural_order::less:         out << "less";         break;
		case natural_order::equal:        out << "equal";        break;
		case natural_order::greater:      out << "greater";      break;
		case natural_order::incomparable: out << "incomparable"; break;
	}
	return out;
}

std::ostream& operator <<(std::ostream& out, const natural_key_bit& bit) {
	if(auto number = std::get_if<natural_number>(&bit))
		return out << "Number(" << number->value << ")";
	return out << "Letters(\"" << std::get<std::string>(bit) << "\")";
}

std::ostream& operator <<(std::ostream& out, const natural_key_type& key) {
	out << '[';
	for(std::size_t i = 0; i < key.size(); ++i)
		out << (i ? ", " : "") << key[i];
	return out << ']';
}

natural_key_type natural_key(std::string_view str) {
	natural_key_type keys;
	std::size_t left = 0, mid = 0, right = str.size();
	while((left = mid) != right) {
		bool digits = is_digit(decode_utf8(str, mid));
		std::string ascii;
		while(mid != right) {
			auto cp = decode_utf8(str, mid);
			if(is_digit(cp) != digits) break;
			if(digits) ascii.push_back(static_cast<char>('0' + *digit_value(cp.value)));
			mid += cp.length;
		}
		std::string text(str.substr(left, mid - left));
		if(!digits) {
			keys.push_back(std::move(text));
			continue;
		}
		// cpp_int reads a leading 0 as an octal prefix
		auto nonzero = std::min(ascii.find_first_not_of('0'), ascii.size() - 1);
		keys.push_back(natural_number
			{ .value = boost::multiprecision::cpp_int(ascii.substr(nonzero))
			, .text = std::move(text)
			});
	}
	return keys;
}

std::string natural_key_text(const natural_key_type& key) {
	std::string text;
	for(const auto& bit : key) {
		if(auto number = std::get_if<natural_number>(&bit))
			text += number->text;
		else
			text += std::get<std::string>(bit);
	}
	return text;
}

template<typename T>
static natural_order order_of(const T& x, const T& y) {
	if(x < y) return natural_order::less;
	if(y < x) return natural_order::greater;
	return natural_order::equal;
}

static natural_order compare_bits(const natural_key_bit& x, const natural_key_bit& y) {
	if(x.index() != y.index())
		return natural_order::incomparable;
	if(auto number = std::get_if<natural_number>(&x))
		return order_of(number->value, std::get<natural_number>(y).value);
	return order_of(std::get<std::string>(x), std::get<std::string>(y));
}

natural_order natural_compare(const natural_key_type& x, const natural_key_type& y) {
	auto pairs = std::min(x.size(), y.size());
	for(std::size_t i = 0; i < pairs; ++i) {
		auto order = compare_bits(x[i], y[i]);
		if(order != natural_order::equal)
			return order;
	}
	return order_of(x.size(), y.size());
}

natural_order natural_compare(std::string_view x, std::string_view y) {
	return natural_compare(natural_key(x), natural_key(y));
}
