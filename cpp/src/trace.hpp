#pragma once

#include <iostream>
#include <fstream>
#include <filesystem>
#include <utility>

struct time { };
extern struct time now;

std::ostream& operator <<(
	std::ostream& output,
	const struct time& _
);

extern const std::filesystem::path trace_path;

void tracef(std::ostream& out);

template<typename X, typename ...Xs>
void tracef(std::ostream& out, X&& x, Xs&& ...xs) {
	out << x << ' ';
	return tracef(out, xs...);
}

template<typename T>
decltype(auto) identity(T&& t) { return std::forward<T>(t); }

// appends a line to natsort.log, only when that file already exists,
// and hands back the last argument
template<typename ...Xs>
decltype(auto) trace(Xs&& ...xs) {
	if(std::filesystem::exists(trace_path)) {
		std::ofstream file(trace_path, std::ios::app);
		tracef(file, xs...);
	}
	return (identity(std::forward<Xs>(xs)), ...);
}
