#pragma once

#include <stack>
#include <tuple>
#include <vector>
#include <cstddef>
#include <utility>
#include <optional>
#include <string_view>
#include <unordered_map>

#include "brex/pattern.hpp"

namespace brex {

enum class capture_policy {
	// captures are cleared before every start offset,
	// and restored when a group alternative fails downstream
	scoped,
	// captures survive failed alternatives and failed start offsets
	shared
};

struct match_options {
	capture_policy captures = capture_policy::scoped;

	// try only offset 0 if the pattern begins with '^'
	bool anchored_shortcut = true;
};

namespace impl {

using std::stack;
using std::tuple;
using std::optional;
using std::unordered_map;

template <typename CharT>
struct capture_state {
	// the capture table of one search, shared by every recursive step

	using char_t = CharT;
	using string_view_t = basic_string_view<char_t>;
	using group_id_t = typename compiled_pattern<char_t>::group_id_t;

	// group_id -> the substring of the text the group matched last
	unordered_map<group_id_t, string_view_t> captures;

	capture_state& reset() noexcept{
		captures.clear();
		return *this;
	}

	optional<string_view_t> find(group_id_t group_id) const{
		if(auto it = captures.find(group_id); it != captures.cend()) return it->second;
		return std::nullopt;
	}

	capture_state& record(group_id_t group_id, string_view_t captured) {
		captures[group_id] = captured;
		return *this;
	}

	bool empty() const noexcept{
		return captures.empty();
	}
};

template <typename CharT>
struct backtracking_matcher {

	using char_t = CharT;
	using string_view_t = basic_string_view<char_t>;

	using pattern_t = compiled_pattern<char_t>;
	using node_t = typename pattern_t::node;
	using node_id_t = typename pattern_t::node_id_t;

	using capture_state_t = capture_state<char_t>;

	// (matched, end offset)
	using result_t = tuple<bool, size_t>;

	static constexpr node_id_t npos = pattern_t::npos;

	const pattern_t& pattern;
	match_options options;

	backtracking_matcher(const pattern_t& pattern, match_options options = {}): pattern{pattern}, options{options} {}

	// match the chain beginning at the pattern head from text[index]
	result_t match_at(string_view_t text, size_t index, capture_state_t& state) const{
		return match_continuation(pattern.head, text, index, state);
	}

	// match the chain beginning at node id from text[index]
	result_t try_match(node_id_t id, string_view_t text, size_t index, capture_state_t& state) const{
		// only consuming atoms are bounded by the text length, an optional atom
		// can still be skipped at the end of the text
		if(index > text.size()) return {false, index};

		const auto& n = pattern[id];

		if(n.repeat == quantifier::optional) {
			// try to skip the atom first
			if(auto [matched, end] = match_continuation(n.next, text, index, state); matched) return {true, end};
		}

		if(n.category == atom_category::group) return match_group(n, text, index, state);

		auto consumed = consume(n, text, index, state);
		if(!consumed) return {false, index};

		if(n.repeat == quantifier::one_or_more) return match_repetition(n, text, *consumed, state);

		return match_continuation(n.next, text, *consumed, state);
	}

protected:

	// a chain without nodes matches the empty string
	result_t match_continuation(node_id_t next, string_view_t text, size_t index, capture_state_t& state) const{
		if(next == npos) return {true, index};
		return try_match(next, text, index, state);
	}

	// consume the atom of a non-group node once, returns the new index
	optional<size_t> consume(const node_t& n, string_view_t text, size_t index, const capture_state_t& state) const{
		if(n.is_single_char()) {
			if(index >= text.size() || !n.accept(text[index])) return std::nullopt;
			return index + 1;
		}

		switch(n.category) {
		case atom_category::start_anchor:
			if(index != 0) return std::nullopt;
			return index;
		case atom_category::end_anchor:
			if(index != text.size()) return std::nullopt;
			return index;
		case atom_category::backreference: {
			auto captured = state.find(n.group_id);
			if(!captured) return std::nullopt; // the group has not been captured yet
			if(text.substr(index, captured->size()) != *captured) return std::nullopt;
			return index + captured->size();
		}
		default:
			return std::nullopt;
		}
	}

	// greedy R+: the first R is consumed, consume R as many times as possible,
	// then try the continuation from the longest run back to the shortest
	result_t match_repetition(const node_t& n, string_view_t text, size_t first_end, capture_state_t& state) const{
		stack<size_t, std::vector<size_t>> ends;
		ends.push(first_end);

		while(true) {
			auto next_end = consume(n, text, ends.top(), state);
			// a zero-width consumption would repeat forever
			if(!next_end || *next_end == ends.top()) break;
			ends.push(*next_end);
		}

		while(!ends.empty()) {
			if(auto [matched, end] = match_continuation(n.next, text, ends.top(), state); matched) return {true, end};
			ends.pop();
		}
		return {false, first_end};
	}

	// the alternatives are tried in order, an alternative whose body matches records the capture
	// and then the continuation of the group is tried.
	// the body of an alternative is never re-matched to a shorter length.
	// (R)+ tries one more repetition of the group before the continuation,
	// the capture holds the last repetition
	result_t match_group(const node_t& n, string_view_t text, size_t index, capture_state_t& state) const{
		const bool scoped = options.captures == capture_policy::scoped;

		for(auto alternative: n.alternatives) {
			optional<decltype(state.captures)> saved;
			if(scoped) saved = state.captures;

			auto [matched, end] = try_match(alternative, text, index, state);
			if(matched) {
				state.record(n.group_id, text.substr(index, end - index));
				// a zero-width repetition would repeat forever
				if(n.repeat == quantifier::one_or_more && end != index) {
					if(auto [repeated, final_end] = match_group(n, text, end, state); repeated)
						return {true, final_end};
				}
				if(auto [continued, final_end] = match_continuation(n.next, text, end, state); continued)
					return {true, final_end};
			}

			if(scoped) state.captures = std::move(*saved);
		}
		return {false, index};
	}

}; // struct backtracking_matcher

} // namespace impl

template <typename CharT>
using capture_state = impl::capture_state<CharT>;

template <typename CharT>
using backtracking_matcher = impl::backtracking_matcher<CharT>;

} // namespace brex
