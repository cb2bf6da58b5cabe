#pragma once

/*
	grep-like driver:

	<prog> -E <pattern>

	reads one line from the input and searches the pattern in it.
	exit codes: 0 matched, 1 no match or bad usage, 2 bad pattern or bad input

	environment:
	BREX_CAPTURES=shared|scoped  capture policy (default scoped)
	BREX_LOG=1                   log the compiled pattern and the match result
*/

#include <span>
#include <string>
#include <cstdio>
#include <cstdlib>
#include <istream>
#include <string_view>

#include "fmt/core.h"

#include "brex/utf8.hpp"
#include "brex/format.hpp"
#include "brex/regular_expression.hpp"

namespace brex {

struct grep_config {
	match_options options;
	bool log = false;
};

enum grep_status: int {
	grep_matched   = 0,
	grep_unmatched = 1,
	grep_usage     = 1,
	grep_error     = 2
};

inline grep_config config_from_environment() {
	grep_config config;
	if(const char* captures = std::getenv("BREX_CAPTURES"); captures != nullptr) {
		if(std::string_view{captures} == "shared") config.options.captures = capture_policy::shared;
		else if(std::string_view{captures} == "scoped") config.options.captures = capture_policy::scoped;
		else fmt::print(stderr, "warning: unknown BREX_CAPTURES value \"{}\", using scoped\n", captures);
	}
	if(const char* log = std::getenv("BREX_LOG"); log != nullptr) {
		config.log = *log != '\0' && std::string_view{log} != "0";
	}
	return config;
}

// strip the line terminator read from a text stream: "\n" or "\r\n"
inline std::string_view chomp(std::string_view line) noexcept{
	if(!line.empty() && line.back() == '\n') line.remove_suffix(1);
	if(!line.empty() && line.back() == '\r') line.remove_suffix(1);
	return line;
}

inline int run_grep(std::span<const std::string_view> args, std::istream& in, const grep_config& config, std::FILE* log) {
	const std::string_view program = args.empty() ? "brex" : args.front();

	if(args.size() < 3 || args[1] != "-E") {
		fmt::print(log, "usage: {} -E <pattern>\n", program);
		return grep_usage;
	}

	auto pattern = utf8::decode(args[2]);
	if(!pattern) {
		fmt::print(log, "error: the pattern is not valid UTF-8\n");
		return grep_error;
	}

	std::string raw_line;
	std::getline(in, raw_line);
	auto line = utf8::decode(chomp(raw_line));
	if(!line) {
		fmt::print(log, "error: the input line is not valid UTF-8\n");
		return grep_error;
	}

	pattern_compiler<char32_t> compiler{*pattern};
	if(auto errc = compiler.get_result(); errc != error_category::success) {
		fmt::print(log, "error: {} at offset {} of pattern \"{}\"\n", errc, compiler.get_error_offset(), args[2]);
		return grep_error;
	}

	regular_expression_engine<char32_t> engine{compiler.generate(), config.options};
	if(config.log) fmt::print(log, "pattern: {}\n", engine.get_pattern());

	auto result = engine.search(*line);
	if(config.log) fmt::print(log, "line: \"{}\", {}\n", utf8::encode(*line), result);

	return result ? grep_matched : grep_unmatched;
}

} // namespace brex
