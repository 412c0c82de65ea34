#include "trace.hpp"
#include "opts.hpp"
#include "app.hpp"

#include <iostream>
#include <unistd.h>

int main(int argc, const char* argv[]) {
	auto opts = get_opts(argc, argv);
	if(opts.index() == 0)
		return std::get<int>(opts);

	trace("------------------------------------------------------------");
	trace(now, "pid", getpid());

	return run(std::get<app_options>(opts), std::cin, std::cout, std::cerr);
}
