#pragma once

#include <string>
#include <variant>
#include <vector>

struct app_options {
	std::vector<std::string> inputs = {};
	bool reverse = false;
	bool unique = false;
	bool check = false;
	bool zero_terminated = false;
	bool keys = false;
};

std::variant<int,app_options> get_opts(int argc, const char* argv[]);
