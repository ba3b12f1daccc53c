#pragma once

#include <string>

namespace swz {

// Ordered set of single character component names
struct Alphabet {
	std::string symbols;

	Alphabet() = default;
	Alphabet(const std::string &);

	size_t size() const;
	bool contains(char) const;
	bool subset_of(const Alphabet &) const;

	// Non-empty and free of duplicate symbols
	bool validate() const;

	auto begin() const {
		return symbols.begin();
	}

	auto end() const {
		return symbols.end();
	}

	bool operator==(const Alphabet &) const = default;

	// Component names of the standard vector types
	static Alphabet xy();
	static Alphabet xyz();
	static Alphabet xyzw();
};

} // namespace swz
