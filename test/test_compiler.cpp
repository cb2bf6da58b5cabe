#include <string>
#include <vector>
#include <string_view>

#include "gtest/gtest.h"

#include "brex/pattern.hpp"
#include "brex/regular_expression.hpp"

namespace {

using brex::atom_category;
using brex::error_category;
using brex::quantifier;

using pattern_t = brex::compiled_pattern<char>;

// categories of the top level chain in order
std::vector<atom_category> chain_categories(const pattern_t& pattern, pattern_t::node_id_t id) {
	std::vector<atom_category> categories;
	for(; id != pattern_t::npos; id = pattern[id].next) categories.push_back(pattern[id].category);
	return categories;
}

struct compile_error {
	std::string_view pattern;
	error_category category;
	std::size_t offset;
};

class CompileErrorTest: public testing::TestWithParam<compile_error> {};

} // namespace

TEST(PatternCompilerTest, LiteralsFormOneChain) {
	auto [errc, pattern] = brex::compile<char>("ca*t");
	ASSERT_EQ(errc, error_category::success);
	ASSERT_EQ(pattern.nodes.size(), 4u);

	std::string literals;
	for(auto id = pattern.head; id != pattern_t::npos; id = pattern[id].next) {
		const auto& n = pattern[id];
		EXPECT_EQ(n.category, atom_category::char_set);
		EXPECT_EQ(n.repeat, quantifier::exactly_once);
		ASSERT_EQ(n.chars.size(), 1u);
		literals += n.chars.front();
	}
	// '*' is not an operator
	EXPECT_EQ(literals, "ca*t");
}

TEST(PatternCompilerTest, EscapesAndSpecialAtoms) {
	auto [errc, pattern] = brex::compile<char>("^\\d\\w.\\.\\12$");
	ASSERT_EQ(errc, error_category::success);
	EXPECT_EQ(chain_categories(pattern, pattern.head), (std::vector<atom_category>{
		atom_category::start_anchor,
		atom_category::digit,
		atom_category::alnum,
		atom_category::wildcard,
		atom_category::char_set,
		atom_category::backreference,
		atom_category::end_anchor
	}));

	auto id = pattern.head;
	for(int i = 0; i < 4; ++i) id = pattern[id].next;
	EXPECT_EQ(pattern[id].chars, std::vector<char>{'.'});

	id = pattern[id].next;
	EXPECT_EQ(pattern[id].group_id, 12u);
}

TEST(PatternCompilerTest, QuantifierSuffixes) {
	auto [errc, pattern] = brex::compile<char>("ab+c?d");
	ASSERT_EQ(errc, error_category::success);

	std::vector<quantifier> repeats;
	for(auto id = pattern.head; id != pattern_t::npos; id = pattern[id].next) repeats.push_back(pattern[id].repeat);
	EXPECT_EQ(repeats, (std::vector<quantifier>{
		quantifier::exactly_once,
		quantifier::one_or_more,
		quantifier::optional,
		quantifier::exactly_once
	}));
}

TEST(PatternCompilerTest, OnlyOneQuantifierPerAtom) {
	// no lazy quantifiers: the '?' after '+' is a literal
	auto [errc, pattern] = brex::compile<char>("a+?");
	ASSERT_EQ(errc, error_category::success);
	ASSERT_EQ(pattern.nodes.size(), 2u);

	const auto& a = pattern[pattern.head];
	EXPECT_EQ(a.repeat, quantifier::one_or_more);

	const auto& question = pattern[a.next];
	EXPECT_EQ(question.category, atom_category::char_set);
	EXPECT_EQ(question.chars, std::vector<char>{'?'});
}

TEST(PatternCompilerTest, BracketExpressions) {
	auto [errc, pattern] = brex::compile<char>("[cbab][^xy][a^-]");
	ASSERT_EQ(errc, error_category::success);

	const auto& first = pattern[pattern.head];
	EXPECT_EQ(first.category, atom_category::char_set);
	EXPECT_EQ(first.chars, (std::vector<char>{'a', 'b', 'c'}));

	const auto& second = pattern[first.next];
	EXPECT_EQ(second.category, atom_category::negated_char_set);
	EXPECT_EQ(second.chars, (std::vector<char>{'x', 'y'}));

	// only a leading '^' negates, and there are no ranges
	const auto& third = pattern[second.next];
	EXPECT_EQ(third.category, atom_category::char_set);
	EXPECT_EQ(third.chars, (std::vector<char>{'-', '^', 'a'}));
}

TEST(PatternCompilerTest, GroupAlternatives) {
	auto [errc, pattern] = brex::compile<char>("(cat|dog)s");
	ASSERT_EQ(errc, error_category::success);
	EXPECT_EQ(pattern.max_group_id, 1u);

	const auto& group = pattern[pattern.head];
	ASSERT_EQ(group.category, atom_category::group);
	EXPECT_EQ(group.group_id, 1u);
	ASSERT_EQ(group.alternatives.size(), 2u);

	for(auto alternative: group.alternatives) {
		EXPECT_EQ(chain_categories(pattern, alternative).size(), 3u);
	}
	EXPECT_EQ(pattern[group.alternatives[1]].chars, std::vector<char>{'d'});

	// the alternatives end at '|' and ')', the group continues with 's'
	ASSERT_NE(group.next, pattern_t::npos);
	EXPECT_EQ(pattern[group.next].chars, std::vector<char>{'s'});
}

TEST(PatternCompilerTest, GroupsAreNumberedByOpeningParenthesis) {
	auto [errc, pattern] = brex::compile<char>("((a)(b))c(d)");
	ASSERT_EQ(errc, error_category::success);
	EXPECT_EQ(pattern.max_group_id, 4u);

	const auto& outer = pattern[pattern.head];
	EXPECT_EQ(outer.group_id, 1u);

	const auto& first_inner = pattern[outer.alternatives.front()];
	EXPECT_EQ(first_inner.group_id, 2u);
	EXPECT_EQ(pattern[first_inner.next].group_id, 3u);

	const auto& last = pattern[pattern[outer.next].next];
	EXPECT_EQ(last.category, atom_category::group);
	EXPECT_EQ(last.group_id, 4u);
}

TEST(PatternCompilerTest, OptionalGroup) {
	auto [errc, pattern] = brex::compile<char>("(ab)?c");
	ASSERT_EQ(errc, error_category::success);
	EXPECT_EQ(pattern[pattern.head].repeat, quantifier::optional);
}

TEST(PatternCompilerTest, RepeatedGroup) {
	auto [errc, pattern] = brex::compile<char>("(ab|c)+d");
	ASSERT_EQ(errc, error_category::success);
	const auto& group = pattern[pattern.head];
	EXPECT_EQ(group.category, atom_category::group);
	EXPECT_EQ(group.repeat, quantifier::one_or_more);
	EXPECT_EQ(group.alternatives.size(), 2u);
}

TEST(PatternCompilerTest, EmptyPattern) {
	auto [errc, pattern] = brex::compile<char>("");
	ASSERT_EQ(errc, error_category::success);
	EXPECT_TRUE(pattern.empty());
	EXPECT_FALSE(pattern.anchored());
}

TEST(PatternCompilerTest, Anchored) {
	EXPECT_TRUE(std::get<1>(brex::compile<char>("^abc")).anchored());
	EXPECT_TRUE(std::get<1>(brex::compile<char>("^+abc")).anchored());
	EXPECT_FALSE(std::get<1>(brex::compile<char>("^?abc")).anchored());
	EXPECT_FALSE(std::get<1>(brex::compile<char>("a^bc")).anchored());
}

TEST(PatternCompilerTest, ReusedCompilerStartsOver) {
	brex::pattern_compiler<char> compiler;
	EXPECT_EQ(compiler.get_result(), error_category::ready);

	compiler.parse("(a");
	EXPECT_EQ(compiler.get_result(), error_category::missing_paren);
	EXPECT_TRUE(compiler.generate().empty());

	compiler.parse("(a)(b)");
	EXPECT_EQ(compiler.get_result(), error_category::success);
	EXPECT_EQ(compiler.get_error_offset(), 0u);

	auto pattern = compiler.generate();
	EXPECT_EQ(pattern.max_group_id, 2u);
	EXPECT_EQ(pattern.nodes.size(), 4u);
}

TEST(PatternCompilerTest, WideCharacters) {
	auto [errc, pattern] = brex::compile<char32_t>(U"[äö]ü");
	ASSERT_EQ(errc, error_category::success);
	EXPECT_EQ(pattern[pattern.head].chars, (std::vector<char32_t>{U'ä', U'ö'}));
	EXPECT_EQ(pattern[pattern[pattern.head].next].chars, std::vector<char32_t>{U'ü'});
}

TEST_P(CompileErrorTest, ReportsCategoryAndOffset) {
	const auto& [pattern, category, offset] = GetParam();
	brex::pattern_compiler<char> compiler{pattern};
	EXPECT_EQ(compiler.get_result(), category) << pattern;
	EXPECT_EQ(compiler.get_error_offset(), offset) << pattern;
}

INSTANTIATE_TEST_SUITE_P(MalformedPatterns, CompileErrorTest, testing::Values(
	compile_error{"(ab",    error_category::missing_paren,          3},
	compile_error{"ab)",    error_category::missing_paren,          2},
	compile_error{"(a(b)",  error_category::missing_paren,          5},
	compile_error{"[ab",    error_category::bad_bracket_expression, 3},
	compile_error{"[^",     error_category::bad_bracket_expression, 2},
	compile_error{"a\\",    error_category::bad_escape,             2},
	compile_error{"()",     error_category::empty_operand,          1},
	compile_error{"(|a)",   error_category::empty_operand,          1},
	compile_error{"(a|)",   error_category::empty_operand,          3},
	compile_error{"a|b",    error_category::bad_alternation,        1}
));
