#pragma once

/*
	Backtracking regular expressions.

	compile:             pattern -> compiled pattern
	search:              does any start offset of a line match?
	match_with_captures: the first match of a line with its capture groups

	the engine is templated on the character type:
	char for byte strings, char32_t for decoded code points (see brex/utf8.hpp)
*/

#include <map>
#include <tuple>
#include <cstddef>
#include <utility>
#include <optional>
#include <string_view>
#include <type_traits>

#include "brex/error.hpp"
#include "brex/pattern.hpp"
#include "brex/matcher.hpp"

namespace brex {

namespace impl {

using std::map;
using std::optional;

template <typename CharT>
struct match_result {

	using char_t = CharT;
	using string_view_t = basic_string_view<char_t>;
	using group_id_t = typename compiled_pattern<char_t>::group_id_t;

	bool matched = false;

	// whole match range: [begin, end)
	size_t begin = 0, end = 0;

	// group_id -> captured substring, viewing into the searched line
	map<group_id_t, string_view_t> groups;

	explicit operator bool() const noexcept{
		return matched;
	}

	optional<string_view_t> group(group_id_t group_id) const{
		if(auto it = groups.find(group_id); it != groups.cend()) return it->second;
		return std::nullopt;
	}

	size_t length() const noexcept{
		return end - begin;
	}
};

template <typename CharT>
struct regular_expression_engine {
	// search driver: runs the backtracking matcher at increasing start offsets

	using char_t = CharT;

	using string_view_t = basic_string_view<char_t>;

	using pattern_t = compiled_pattern<char_t>;
	using matcher_t = backtracking_matcher<char_t>;
	using capture_state_t = capture_state<char_t>;
	using result_t = match_result<char_t>;

	regular_expression_engine(pattern_t pattern, match_options options = {}):
		pattern{std::move(pattern)}, options{options} {}

	// a single match attempt at text[offset], the capture table is not cleared
	result_t match_at(string_view_t text, size_t offset) {
		matcher_t matcher{pattern, options};
		auto [matched, end] = matcher.match_at(text, offset, state);
		if(!matched) return {};
		return make_result(offset, end);
	}

	// the first start offset whose attempt matches
	result_t search(string_view_t text) {
		matcher_t matcher{pattern, options};
		const bool scoped = options.captures == capture_policy::scoped;

		size_t last_offset = options.anchored_shortcut && pattern.anchored() ? 0 : text.size();

		state.reset();
		for(size_t offset = 0; offset <= last_offset; ++offset) {
			if(scoped) state.reset();
			if(auto [matched, end] = matcher.match_at(text, offset, state); matched) {
				return make_result(offset, end);
			}
		}
		return {};
	}

	bool test(string_view_t text) {
		return static_cast<bool>(search(text));
	}

	const pattern_t& get_pattern() const noexcept{
		return pattern;
	}

	const capture_state_t& get_captures() const noexcept{
		return state;
	}

protected:

	pattern_t pattern;
	match_options options;
	capture_state_t state;

	result_t make_result(size_t begin, size_t end) const{
		result_t result;
		result.matched = true;
		result.begin = begin;
		result.end = end;
		for(const auto& [group_id, captured]: state.captures) result.groups.emplace(group_id, captured);
		return result;
	}

}; // struct regular_expression_engine

} // namespace impl

template <typename CharT>
using match_result = impl::match_result<CharT>;

template <typename CharT>
using regular_expression_engine = impl::regular_expression_engine<CharT>;

// free functions

// on error the returned pattern is empty and matches every line,
// check the error category before using it
template <typename CharT>
std::tuple<error_category, compiled_pattern<CharT>> compile(std::basic_string_view<CharT> pattern) {
	pattern_compiler<CharT> compiler{pattern};
	return {compiler.get_result(), compiler.generate()};
}

template <typename CharT>
bool search(const compiled_pattern<CharT>& compiled, std::type_identity_t<std::basic_string_view<CharT>> line, match_options options = {}) {
	return regular_expression_engine<CharT>{compiled, options}.test(line);
}

template <typename CharT>
match_result<CharT> match_with_captures(const compiled_pattern<CharT>& compiled, std::type_identity_t<std::basic_string_view<CharT>> line, match_options options = {}) {
	return regular_expression_engine<CharT>{compiled, options}.search(line);
}

template <typename CharT>
std::tuple<error_category, match_result<CharT>> search(std::basic_string_view<CharT> pattern, std::basic_string_view<CharT> line, match_options options = {}) {
	pattern_compiler<CharT> compiler{pattern};
	if(auto errc = compiler.get_result(); errc != error_category::success)
		return {errc, {}};
	else return {
		errc,
		regular_expression_engine<CharT>{compiler.generate(), options}.search(line)
	};
}

} // namespace brex
