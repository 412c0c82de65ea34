#include "natsort.hpp"
#include "trace.hpp"

#include <algorithm>
#include <utility>
#include <vector>

static std::string quoted(const std::string& str) {
	return "'" + str + "'";
}

unorderable_pair::unorderable_pair(const std::string& left, const std::string& right)
	: std::runtime_error("cannot order " + quoted(left) + " and " + quoted(right))
	, left(left), right(right) { }

typedef std::pair<natural_key_type, std::size_t> keyed_index;

void natural_sort(std::span<std::string> strs) {
	trace(now, "natural_sort:", strs.size(), "strings");
	std::vector<keyed_index> keys;
	keys.reserve(strs.size());
	for(std::size_t i = 0; i < strs.size(); ++i)
		keys.emplace_back(natural_key(strs[i]), i);
	std::stable_sort(keys.begin(), keys.end(),
		[&] (const keyed_index& x, const keyed_index& y) {
			switch(natural_compare(x.first, y.first)) {
				case natural_order::less:
					return true;
				case natural_order::incomparable:
					trace(now, "natural_sort: incomparable", x.first, y.first);
					throw unorderable_pair(strs[x.second], strs[y.second]);
				default:
					return false;
			}
		});
	std::vector<std::string> sorted;
	sorted.reserve(strs.size());
	for(const auto& key : keys)
		sorted.push_back(std::move(strs[key.second]));
	std::move(sorted.begin(), sorted.end(), strs.begin());
}

bool natural_sorted(std::span<const std::string> strs, bool strict) {
	for(std::size_t i = 1; i < strs.size(); ++i) {
		switch(natural_compare(strs[i - 1], strs[i])) {
			case natural_order::greater:
				trace(now, "natural_sorted: out of order at", i);
				return false;
			case natural_order::equal:
				if(!strict) break;
				trace(now, "natural_sorted: duplicate at", i);
				return false;
			case natural_order::incomparable:
				throw unorderable_pair(strs[i - 1], strs[i]);
			default:
				break;
		}
	}
	return true;
}
