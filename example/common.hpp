#pragma once

// some common utils for the examples

#include <limits>
#include <string>
#include <utility>
#include <iostream>
#include <string_view>

#include "fmt/core.h"

#include "brex/format.hpp"
#include "brex/regular_expression.hpp"

template <typename... Args>
void println(fmt::format_string<Args...> format, Args&&... args) {
	fmt::print(format, std::forward<Args>(args)...);
	fmt::print("\n");
}

// reads a whole line, returns false at the end of input
inline bool read_line(std::string& line) {
	return static_cast<bool>(std::getline(std::cin, line));
}
