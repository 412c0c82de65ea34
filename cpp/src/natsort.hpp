#pragma once

#include "natkey.hpp"

#include <span>
#include <stdexcept>
#include <string>

// thrown when a sort has to order two strings whose keys are incomparable
struct unorderable_pair : public std::runtime_error {
	unorderable_pair(const std::string& left, const std::string& right);

	std::string left;
	std::string right;
};

// sorts strs in natural order, tokenizing every string once;
// strs is left untouched if an unorderable_pair is thrown
void natural_sort(std::span<std::string> strs);

// whether strs is already in natural order; strict also rejects equal neighbours
bool natural_sorted(std::span<const std::string> strs, bool strict = false);
