#pragma once

#include <gtest/gtest.h>

#include <string>
#include <vector>

// Source comparison utilities
inline std::string trim_source(const std::string &A)
{
	static constexpr const char ws[] = " \t\n\r\f\v";
	std::string s = A;
	s.erase(s.find_last_not_of(ws) + 1);
	s.erase(0, s.find_first_not_of(ws));
	return s;
}

inline void check_sources(const std::string &A, const std::string &B)
{
	auto tA = trim_source(A);
	auto tB = trim_source(B);
	ASSERT_EQ(tA, tB);
}

inline std::vector <std::string> split_lines(const std::string &source)
{
	std::vector <std::string> lines;

	size_t start = 0;
	while (start < source.size()) {
		size_t end = source.find('\n', start);
		if (end == std::string::npos)
			end = source.size();

		lines.push_back(source.substr(start, end - start));
		start = end + 1;
	}

	return lines;
}

// Extracts the concatenated swizzle code from an invocation line,
// i.e. the token between the ": " and " => " markers
inline std::string swizzle_code(const std::string &line)
{
	size_t begin = line.find(": ");
	size_t end = line.find(" => ");
	if (begin == std::string::npos || end == std::string::npos || end < begin)
		return "";

	return line.substr(begin + 2, end - begin - 2);
}
