#pragma once

#include <functional>
#include <string>
#include <vector>

#include "config.hpp"
#include "covered_set.hpp"

namespace swz {

// Emits one macro invocation per swizzle of the domain alphabet which is
// not already covered, in lexicographic order of the full enumeration
class PermutationEmitter {
	EmitterConfig config;
	CoveredSet covered_set;
public:
	using sink_t = std::function <void (const std::string &)>;

	PermutationEmitter(const EmitterConfig & = EmitterConfig::vec4_over_vec3());

	bool covered(const std::string &) const;

	// Invocation line for a single tuple, without the trailing newline
	std::string format(const std::string &) const;

	void emit(const sink_t &) const;

	std::vector <std::string> lines() const;

	// Writes every line to stdout
	void run() const;
};

} // namespace swz
