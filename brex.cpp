#include <iostream>
#include <string_view>
#include <vector>

#include "brex/grep.hpp"

// Usage: echo <input_text> | brex -E <pattern>
int main(int argc, const char** argv) {
	std::vector<std::string_view> args(argv, argv + argc);
	return brex::run_grep(args, std::cin, brex::config_from_environment(), stderr);
}
