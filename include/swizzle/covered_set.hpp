#pragma once

#include <string>
#include <unordered_set>

#include "alphabet.hpp"

namespace swz {

// Tuples already provided by a smaller vector type; membership only
class CoveredSet {
	std::unordered_set <std::string> codes;
public:
	CoveredSet(const Alphabet &, size_t);

	bool contains(const std::string &) const;

	size_t size() const;
};

} // namespace swz
