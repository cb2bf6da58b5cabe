#pragma once

/*
	Pattern compiler of the backtracking engine.

	Supported grammar:
	concat
	marking grouping     (R1|R2|...)
	positive closure     +
	optional             ?
	wildcard             .
	brackets             [...], [^...]
	anchors              ^ $
	class escapes        \d \w
	backreferences       \1 \2 ...
	identity escapes     \. \\ \( ...

	Anything else, including '*' and '{', is a literal character.
*/

#include <tuple>
#include <limits>
#include <vector>
#include <cstddef>
#include <cstdint>
#include <utility>
#include <algorithm>
#include <string_view>

#include <unicode/uchar.h>

#include "brex/error.hpp"

namespace brex {

namespace impl {

using std::tuple;
using std::size_t;
using std::vector;
using std::basic_string_view;
using std::numeric_limits;

template <typename CharT>
constexpr bool in_range(CharT a, CharT b, CharT x) noexcept{ return a <= x && x <= b; }

// code points above ASCII are classified by ICU with the Unicode
// general categories; byte patterns stay ASCII only
inline bool is_unicode_numeric(UChar32 c) noexcept{
	switch(u_charType(c)) {
	case U_DECIMAL_DIGIT_NUMBER:
	case U_LETTER_NUMBER:
	case U_OTHER_NUMBER:
		return true;
	default:
		return false;
	}
}

template <typename CharT>
bool is_numeric(CharT c) noexcept{
	if(in_range(CharT('0'), CharT('9'), c)) return true;
	if constexpr(sizeof(CharT) > 1) {
		if(static_cast<std::uint32_t>(c) > 0x7f) return is_unicode_numeric(static_cast<UChar32>(c));
	}
	return false;
}

template <typename CharT>
bool is_alphanumeric(CharT c) noexcept{
	if(
		in_range(CharT('0'), CharT('9'), c) ||
		in_range(CharT('a'), CharT('z'), c) ||
		in_range(CharT('A'), CharT('Z'), c)
	) return true;
	if constexpr(sizeof(CharT) > 1) {
		if(static_cast<std::uint32_t>(c) > 0x7f) {
			auto u = static_cast<UChar32>(c);
			return u_isUAlphabetic(u) || is_unicode_numeric(u);
		}
	}
	return false;
}

enum class atom_category: unsigned char {
	digit,            // \d
	alnum,            // \w
	wildcard,         // .
	start_anchor,     // ^
	end_anchor,       // $
	char_set,         // c, [chars...]
	negated_char_set, // [^chars...]
	group,            // (R1|R2|...)
	backreference     // \n
};

enum class quantifier: unsigned char {
	optional,     // ?
	exactly_once,
	one_or_more   // +
};

template <typename CharT>
struct compiled_pattern {
	// output of pattern_compiler,
	// every chain of the pattern tree is a singly linked list of nodes stored in one arena

	using char_t = CharT;

	using node_id_t = size_t;
	using group_id_t = size_t;

	// "no node": the end of a chain
	static constexpr node_id_t npos = numeric_limits<node_id_t>::max();

	struct node {
		atom_category category = atom_category::wildcard;
		quantifier repeat = quantifier::exactly_once;

		// the following node of the same chain
		node_id_t next = npos;

		// group: the capture slot it writes
		// backreference: the capture slot it reads
		group_id_t group_id = 0;

		// active when category == char_set or negated_char_set, sorted and unique
		vector<char_t> chars;

		// active when category == group, the head node of each alternative
		vector<node_id_t> alternatives;

		// does the atom consume exactly one character?
		bool is_single_char() const noexcept{
			switch(category) {
			case atom_category::digit:
			case atom_category::alnum:
			case atom_category::wildcard:
			case atom_category::char_set:
			case atom_category::negated_char_set:
				return true;
			default:
				return false;
			}
		}

		bool accept(char_t c) const noexcept{
			switch(category) {
			case atom_category::digit:
				return is_numeric(c);
			case atom_category::alnum:
				return is_alphanumeric(c);
			case atom_category::wildcard:
				return true;
			case atom_category::char_set:
				return std::binary_search(chars.cbegin(), chars.cend(), c);
			case atom_category::negated_char_set:
				return !std::binary_search(chars.cbegin(), chars.cend(), c);
			default:
				// not a single-char atom
				return false;
			}
		}
	}; // struct node

	vector<node> nodes;
	node_id_t head = npos;
	group_id_t max_group_id = 0;

	node& operator[](node_id_t id) {
		return nodes[id];
	}

	const node& operator[](node_id_t id) const{
		return nodes[id];
	}

	// the empty pattern matches at the start of every line
	bool empty() const noexcept{
		return head == npos;
	}

	// only offset 0 of a line can match a pattern beginning with '^' or '^+'
	bool anchored() const noexcept{
		if(empty()) return false;
		const auto& first = nodes[head];
		return first.category == atom_category::start_anchor && first.repeat != quantifier::optional;
	}

	compiled_pattern() noexcept = default;

}; // struct compiled_pattern


template <typename CharT>
struct pattern_compiler {
	// a recursive descent parser with one character of lookahead

	using char_t = CharT;

	using pattern_view_t = basic_string_view<char_t>;
	using pattern_iterator_t = typename pattern_view_t::iterator;

	using pattern_t = compiled_pattern<char_t>;
	using node_t = typename pattern_t::node;
	using node_id_t = typename pattern_t::node_id_t;
	using group_id_t = typename pattern_t::group_id_t;

	static constexpr node_id_t npos = pattern_t::npos;

	constexpr pattern_compiler() = default;

	pattern_compiler(pattern_view_t s) {
		parse(s);
	}

protected:

	vector<node_t> nodes;
	node_id_t head = npos;

	// group ids are assigned in the order of '(' in the pattern, starting from 1
	group_id_t max_group_id = 0;

	error_category build_result = error_category::ready;
	size_t error_offset = 0;

	pattern_iterator_t pattern_begin{};

public:

	void reset() {
		nodes.clear();
		head = npos;
		max_group_id = 0;
		build_result = error_category::ready;
		error_offset = 0;
	}

	tuple<error_category, pattern_iterator_t> parse(pattern_view_t s) {
		reset();
		pattern_begin = s.begin();

		auto pos = s.begin();
		auto end = s.end();

		auto [result, chain] = parse_chain(pos, end);
		if(result != error_category::success) return fail(result, pos);

		if(pos != end) {
			// the top level chain stops at ')' or '|' without an open group
			return fail(*pos == ')' ? error_category::missing_paren : error_category::bad_alternation, pos);
		}

		head = chain;
		return {build_result = error_category::success, end};
	}

	error_category get_result() const noexcept{
		return build_result;
	}

	// offset into the pattern where parsing failed
	size_t get_error_offset() const noexcept{
		return error_offset;
	}

	// generate a compiled pattern as our result
	pattern_t generate() const{
		if(build_result != error_category::success) {
			return {}; // return an empty pattern
		}
		pattern_t pattern;
		pattern.nodes = nodes;
		pattern.head = head;
		pattern.max_group_id = max_group_id;
		return pattern;
	}

protected:

	tuple<error_category, pattern_iterator_t> fail(error_category category, pattern_iterator_t pos) {
		error_offset = static_cast<size_t>(pos - pattern_begin);
		return {build_result = category, pos};
	}

	template <typename... Args>
	node_id_t new_node(Args&&... args) {
		nodes.emplace_back(std::forward<Args>(args)...);
		return nodes.size() - 1;
	}

	// parse a concatenation until the end of the pattern, '|' or ')'.
	// the chain is linked by a loop, nested chains only come from groups
	tuple<error_category, node_id_t> parse_chain(pattern_iterator_t& pos, const pattern_iterator_t& end) {
		node_id_t chain_head = npos, chain_tail = npos;

		while(pos != end && *pos != '|' && *pos != ')') {
			auto id = new_node();
			if(auto result = parse_atom(id, pos, end); result != error_category::success)
				return {result, npos};

			if(pos != end) {
				switch(*pos) {
				case '+':
					nodes[id].repeat = quantifier::one_or_more;
					++pos;
					break;
				case '?':
					nodes[id].repeat = quantifier::optional;
					++pos;
					break;
				}
			}

			if(chain_tail == npos) chain_head = id;
			else nodes[chain_tail].next = id;
			chain_tail = id;
		}
		return {error_category::success, chain_head};
	}

	error_category parse_atom(node_id_t id, pattern_iterator_t& pos, const pattern_iterator_t& end) {
		// assume pos != end
		switch(char_t c = *pos++) {
		case '\\':
			return lex_escape(id, pos, end);
		case '(':
			return parse_group(id, pos, end);
		case '[': {
			bool negated = false;
			if(pos != end && *pos == '^') {
				negated = true;
				++pos;
			}
			if(!parse_brackets(nodes[id].chars, pos, end)) return error_category::bad_bracket_expression;
			nodes[id].category = negated ? atom_category::negated_char_set : atom_category::char_set;
			break;
		}
		case '.':
			nodes[id].category = atom_category::wildcard;
			break;
		case '^':
			nodes[id].category = atom_category::start_anchor;
			break;
		case '$':
			nodes[id].category = atom_category::end_anchor;
			break;
		default:
			// literal
			nodes[id].category = atom_category::char_set;
			nodes[id].chars.push_back(c);
		}
		return error_category::success;
	}

	error_category lex_escape(node_id_t id, pattern_iterator_t& pos, const pattern_iterator_t& end) {
		/*
			d: digit
			w: letter or digit
			[0-9]+: backreference to a capture group
			others: identity escape, such as \\, \., \(
		*/
		if(pos == end) return error_category::bad_escape; // trailing '\'

		auto& n = nodes[id];
		char_t c = *pos++;
		switch(c) {
		case 'd':
			n.category = atom_category::digit;
			return error_category::success;
		case 'w':
			n.category = atom_category::alnum;
			return error_category::success;
		}

		if(in_range(char_t('0'), char_t('9'), c)) {
			group_id_t group_id = static_cast<group_id_t>(c - '0');
			while(pos != end && in_range(char_t('0'), char_t('9'), *pos)) {
				auto digit = static_cast<group_id_t>(*pos++ - '0');
				if(group_id > (numeric_limits<group_id_t>::max() - digit) / 10) return error_category::bad_escape;
				group_id = group_id * 10 + digit;
			}
			n.category = atom_category::backreference;
			n.group_id = group_id;
			return error_category::success;
		}

		n.category = atom_category::char_set;
		n.chars.push_back(c);
		return error_category::success;
	}

	error_category parse_group(node_id_t id, pattern_iterator_t& pos, const pattern_iterator_t& end) {
		// assume '(' is consumed.
		// nodes may be reallocated by the nested parse, so only access this node by id
		nodes[id].category = atom_category::group;
		nodes[id].group_id = ++max_group_id;

		while(true) {
			auto [result, alternative] = parse_chain(pos, end);
			if(result != error_category::success) return result;
			if(alternative == npos) return error_category::empty_operand; // (), (|R), (R|)
			nodes[id].alternatives.push_back(alternative);

			if(pos == end) return error_category::missing_paren;
			if(*pos++ == ')') return error_category::success;
			// otherwise it is '|', parse the next alternative
		}
	}

	bool parse_brackets(vector<char_t>& chars, pattern_iterator_t& pos, const pattern_iterator_t& end) {
		// assume pos is pointing at the first char after '[' and the possible invert char '^'
		while(pos != end && *pos != ']') chars.push_back(*pos++);

		if(pos == end) return false; // '[...', broken bracket
		++pos; // skip ']'

		std::sort(chars.begin(), chars.end());
		chars.erase(std::unique(chars.begin(), chars.end()), chars.end());
		return true;
	}

}; // struct pattern_compiler

} // namespace impl

using impl::atom_category;
using impl::quantifier;

template <typename CharT>
using compiled_pattern = impl::compiled_pattern<CharT>;

template <typename CharT>
using pattern_compiler = impl::pattern_compiler<CharT>;

} // namespace brex
