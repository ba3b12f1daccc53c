#include "swizzle/emitter.hpp"

// Prints the vec4 swizzle invocations which the vec3 ones do not provide
int main()
{
	swz::PermutationEmitter emitter(swz::EmitterConfig::vec4_over_vec3());
	emitter.run();
}
