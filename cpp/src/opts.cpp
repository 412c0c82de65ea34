#include "opts.hpp"

#include <iostream>

#include <boost/program_options.hpp>

namespace opt = boost::program_options;

std::variant<int,app_options> get_opts(int argc, const char* argv[]) {
	opt::options_description opts_desc(
		"usage: natsort [options] [INPUT...]\noptions");
	opts_desc.add_options()
		( "help,h"
		, "show this help message" )
		( "reverse,r"
		, opt::bool_switch()
		, "print in descending order" )
		( "unique,u"
		, opt::bool_switch()
		, "print only the first of lines that compare equal" )
		( "check,c"
		, opt::bool_switch()
		, "check whether input is sorted, do not sort" )
		( "zero-terminated,z"
		, opt::bool_switch()
		, "records are separated by NUL, not newline" )
		( "keys,k"
		, opt::bool_switch()
		, "print the sort key of each record" )
		( "input"
		, opt::value<std::vector<std::string>>()->composing()
		, "files to read, - for standard input" )
		;
	opt::positional_options_description posn_desc;
	posn_desc.add("input", -1);

	opt::variables_map args;
	try {
		opt::store(opt::command_line_parser(argc, argv)
			.options(opts_desc).positional(posn_desc).run(), args);
		opt::notify(args);
	} catch(opt::error& err) {
		std::cerr << err.what() << '\n' << opts_desc << std::flush;
		return 1;
	}
	auto help = args.find("help");
	if(help != args.end()) {
		std::cout << opts_desc << std::flush;
		return 0;
	}

	app_options opts
		{ .reverse = args["reverse"].as<bool>()
		, .unique = args["unique"].as<bool>()
		, .check = args["check"].as<bool>()
		, .zero_terminated = args["zero-terminated"].as<bool>()
		, .keys = args["keys"].as<bool>()
		};
	auto input = args.find("input");
	if(input != args.end())
		opts.inputs = input->second.as<std::vector<std::string>>();
	if(opts.inputs.empty())
		opts.inputs.push_back("-");
	if(opts.check && opts.keys) {
		std::cerr << "--check and --keys cannot be combined\n"
			<< opts_desc << std::flush;
		return 1;
	}

	return opts;
}
