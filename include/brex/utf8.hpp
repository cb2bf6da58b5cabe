#pragma once

// UTF-8 <-> code points, so that the engine matches one code point per character

#include <string>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string_view>

namespace brex {

namespace utf8 {

// returns std::nullopt on malformed input:
// bad lead/continuation bytes, truncated sequences, overlong forms and surrogates
inline std::optional<std::u32string> decode(std::string_view s) {
	std::u32string result;
	result.reserve(s.size());

	auto byte = [&s](std::size_t i) { return static_cast<std::uint8_t>(s[i]); };

	for(std::size_t i = 0; i < s.size();) {
		std::uint8_t lead = byte(i);
		std::size_t length;
		char32_t c;
		if(lead < 0x80) {
			result.push_back(lead);
			++i;
			continue;
		}else if((lead & 0xe0) == 0xc0) {
			length = 2;
			c = lead & 0x1f;
		}else if((lead & 0xf0) == 0xe0) {
			length = 3;
			c = lead & 0x0f;
		}else if((lead & 0xf8) == 0xf0) {
			length = 4;
			c = lead & 0x07;
		}else return std::nullopt;

		if(i + length > s.size()) return std::nullopt;
		for(std::size_t k = 1; k < length; ++k) {
			if((byte(i + k) & 0xc0) != 0x80) return std::nullopt;
			c = (c << 6) | (byte(i + k) & 0x3f);
		}

		// shortest form only
		constexpr char32_t min_value[] = {0, 0, 0x80, 0x800, 0x10000};
		if(c < min_value[length] || c > 0x10ffff) return std::nullopt;
		if(0xd800 <= c && c <= 0xdfff) return std::nullopt;

		result.push_back(c);
		i += length;
	}
	return result;
}

inline std::string& encode(char32_t c, std::string& out) {
	if(c < 0x80) {
		out.push_back(static_cast<char>(c));
	}else if(c < 0x800) {
		out.push_back(static_cast<char>(0xc0 | (c >> 6)));
		out.push_back(static_cast<char>(0x80 | (c & 0x3f)));
	}else if(c < 0x10000) {
		out.push_back(static_cast<char>(0xe0 | (c >> 12)));
		out.push_back(static_cast<char>(0x80 | ((c >> 6) & 0x3f)));
		out.push_back(static_cast<char>(0x80 | (c & 0x3f)));
	}else {
		out.push_back(static_cast<char>(0xf0 | (c >> 18)));
		out.push_back(static_cast<char>(0x80 | ((c >> 12) & 0x3f)));
		out.push_back(static_cast<char>(0x80 | ((c >> 6) & 0x3f)));
		out.push_back(static_cast<char>(0x80 | (c & 0x3f)));
	}
	return out;
}

inline std::string encode(std::u32string_view s) {
	std::string result;
	result.reserve(s.size());
	for(auto c: s) encode(c, result);
	return result;
}

// bytes are passed through, so that output code is shared by both engines
inline std::string& encode(char c, std::string& out) {
	out.push_back(c);
	return out;
}

inline std::string encode(std::string_view s) {
	return std::string{s};
}

} // namespace utf8

} // namespace brex
