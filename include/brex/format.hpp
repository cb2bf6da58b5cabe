#pragma once

// fmt formatters for diagnostics: error categories, compiled patterns and match results

#include <string>
#include <iterator>
#include <string_view>

#include "fmt/core.h"
#include "fmt/format.h"

#include "brex/error.hpp"
#include "brex/utf8.hpp"
#include "brex/pattern.hpp"
#include "brex/regular_expression.hpp"

namespace brex {

namespace impl {

template <typename CharT>
bool is_meta_char(CharT c) noexcept{
	switch(c) {
	case '\\': case '(': case ')': case '[': case ']': case '|':
	case '.':  case '^': case '$': case '+': case '?':
		return true;
	default:
		return false;
	}
}

template <typename CharT>
void describe_chain(const compiled_pattern<CharT>& pattern, typename compiled_pattern<CharT>::node_id_t id, std::string& out);

template <typename CharT>
void describe_node(const compiled_pattern<CharT>& pattern, const typename compiled_pattern<CharT>::node& n, std::string& out) {
	auto it = std::back_inserter(out);
	switch(n.category) {
	case atom_category::digit:        out += "\\d"; break;
	case atom_category::alnum:        out += "\\w"; break;
	case atom_category::wildcard:     out += '.'; break;
	case atom_category::start_anchor: out += '^'; break;
	case atom_category::end_anchor:   out += '$'; break;
	case atom_category::char_set:
		if(n.chars.size() == 1) {
			// literal
			if(is_meta_char(n.chars.front())) out += '\\';
			utf8::encode(n.chars.front(), out);
			break;
		}
		[[fallthrough]];
	case atom_category::negated_char_set:
		out += n.category == atom_category::negated_char_set ? "[^" : "[";
		for(auto c: n.chars) utf8::encode(c, out);
		out += ']';
		break;
	case atom_category::group: {
		fmt::format_to(it, "#{}(", n.group_id);
		bool first = true;
		for(auto alternative: n.alternatives) {
			if(!first) out += '|';
			first = false;
			describe_chain(pattern, alternative, out);
		}
		out += ')';
		break;
	}
	case atom_category::backreference:
		fmt::format_to(it, "\\{}", n.group_id);
		break;
	}

	switch(n.repeat) {
	case quantifier::optional:    out += '?'; break;
	case quantifier::one_or_more: out += '+'; break;
	default: break;
	}
}

// nodes of a chain are separated by spaces, groups are prefixed by their capture id
template <typename CharT>
void describe_chain(const compiled_pattern<CharT>& pattern, typename compiled_pattern<CharT>::node_id_t id, std::string& out) {
	bool first = true;
	for(; id != compiled_pattern<CharT>::npos; id = pattern[id].next) {
		if(!first) out += ' ';
		first = false;
		describe_node(pattern, pattern[id], out);
	}
}

} // namespace impl

template <typename CharT>
std::string describe(const compiled_pattern<CharT>& pattern) {
	if(pattern.empty()) return "<empty>";
	std::string out;
	impl::describe_chain(pattern, pattern.head, out);
	return out;
}

template <typename CharT>
std::string describe(const match_result<CharT>& result) {
	if(!result) return "no match";

	std::string out;
	auto it = std::back_inserter(out);
	fmt::format_to(it, "matched [{},{})", result.begin, result.end);
	if(result.groups.empty()) return out;

	out += " groups: {";
	bool first = true;
	for(const auto& [group_id, captured]: result.groups) {
		if(!first) out += ", ";
		first = false;
		fmt::format_to(it, "{}: \"{}\"", group_id, utf8::encode(captured));
	}
	out += '}';
	return out;
}

} // namespace brex

template <>
struct fmt::formatter<brex::error_category>: fmt::formatter<fmt::string_view> {
	template <typename FormatContext>
	auto format(brex::error_category category, FormatContext& ctx) const {
		return fmt::formatter<fmt::string_view>::format(brex::error_message(category), ctx);
	}
};

template <typename CharT>
struct fmt::formatter<brex::impl::compiled_pattern<CharT>>: fmt::formatter<fmt::string_view> {
	template <typename FormatContext>
	auto format(const brex::impl::compiled_pattern<CharT>& pattern, FormatContext& ctx) const {
		return fmt::formatter<fmt::string_view>::format(brex::describe(pattern), ctx);
	}
};

template <typename CharT>
struct fmt::formatter<brex::impl::match_result<CharT>>: fmt::formatter<fmt::string_view> {
	template <typename FormatContext>
	auto format(const brex::impl::match_result<CharT>& result, FormatContext& ctx) const {
		return fmt::formatter<fmt::string_view>::format(brex::describe(result), ctx);
	}
};
