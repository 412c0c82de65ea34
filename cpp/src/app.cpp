#include "app.hpp"
#include "trace.hpp"
#include "natkey.hpp"
#include "natsort.hpp"

#include <algorithm>
#include <fstream>
#include <iostream>
#include <iterator>
#include <sstream>
#include <stdexcept>

#include <boost/algorithm/string.hpp>

static std::string read_input(const std::string& name, std::istream& in) {
	if(name == "-")
		return std::string(std::istreambuf_iterator<char>(in), {});
	std::ifstream file(name, std::ios::binary);
	if(!file)
		throw std::runtime_error("cannot open " + name);
	std::ostringstream content;
	content << file.rdbuf();
	return content.str();
}

std::vector<std::string> read_records(const app_options& opts, std::istream& in) {
	const char separator = opts.zero_terminated ? '\0' : '\n';
	std::vector<std::string> records;
	for(const auto& name : opts.inputs) {
		std::string content = read_input(name, in);
		if(content.empty()) continue;
		if(content.back() == separator) content.pop_back();
		std::vector<std::string> bits;
		boost::split(bits, content,
			[separator] (char c) { return c == separator; });
		records.insert(records.end(),
			std::make_move_iterator(bits.begin()),
			std::make_move_iterator(bits.end()));
	}
	return records;
}

static int sort_records(const app_options& opts, std::istream& in,
		std::ostream& out, std::ostream& err) {
	const char separator = opts.zero_terminated ? '\0' : '\n';
	auto records = read_records(opts, in);
	trace(now, "records", records.size());

	if(opts.check) {
		if(opts.reverse) std::reverse(records.begin(), records.end());
		if(natural_sorted(records, opts.unique)) return 0;
		err << "natsort: input is not in natural order\n";
		return 2;
	}

	natural_sort(records);
	if(opts.unique) {
		auto end = std::unique(records.begin(), records.end(),
			[] (const std::string& x, const std::string& y) {
				return natural_compare(x, y) == natural_order::equal;
			});
		records.erase(end, records.end());
	}
	if(opts.reverse)
		std::reverse(records.begin(), records.end());

	for(const auto& record : records) {
		if(opts.keys) out << natural_key(record);
		else out << record;
		out << separator;
	}
	out << std::flush;
	if(!out) {
		trace(now, "write failed");
		err << "natsort: write error\n";
		return 1;
	}
	return 0;
}

int run(const app_options& opts, std::istream& in, std::ostream& out, std::ostream& err) {
	try {
		return sort_records(opts, in, out, err);
	} catch(const unorderable_pair& exc) {
		trace(now, "unorderable", exc.left, exc.right);
		err << "natsort: " << exc.what() << '\n';
		return 2;
	} catch(const std::runtime_error& exc) {
		trace(now, "error", exc.what());
		err << "natsort: " << exc.what() << '\n';
		return 1;
	}
}
