#pragma once

#include <string>

#include "alphabet.hpp"

namespace swz {

// Immutable inputs of a permutation emitter
struct EmitterConfig {
	// Alphabet whose Cartesian power is enumerated
	Alphabet domain = Alphabet::xyzw();

	// Tuples drawn only from this alphabet are skipped
	Alphabet covered = Alphabet::xyz();

	size_t arity = 3;

	// Invoked macro and its leading argument token
	std::string macro = "impl_swizzle_for_vec!";
	std::string placeholder = "$n";

	bool validate() const;

	// Swizzles of the 4-component vector not already on the 3-component one
	static EmitterConfig vec4_over_vec3();
};

} // namespace swz
