#pragma once

#include <string_view>

namespace brex {

enum class error_category {
	success = 0,
	ready,
	empty_operand,
	bad_escape,
	missing_paren,
	bad_bracket_expression,
	bad_alternation
};


constexpr std::string_view error_message(error_category category) noexcept{
	switch(category) {
	case error_category::success:                return "successed";
	case error_category::ready:                  return "ready to build";
	case error_category::empty_operand:          return "empty operand";
	case error_category::bad_escape:             return "bad escape";
	case error_category::missing_paren:          return "missing parentheses";
	case error_category::bad_bracket_expression: return "bad bracket expression";
	case error_category::bad_alternation:        return "alternation outside of a group";
	}
	return "";
}

} // namespace brex
