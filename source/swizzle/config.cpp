#include "common/logging.hpp"
#include "swizzle/config.hpp"

namespace swz {

MODULE(config);

static constexpr size_t max_arity = 4;

bool EmitterConfig::validate() const
{
	if (!domain.validate() || !covered.validate())
		return false;

	if (!covered.subset_of(domain)) {
		SWZ_ERROR("covered alphabet \"{}\" is not a subset of \"{}\"",
			covered.symbols, domain.symbols);
		return false;
	}

	if (arity == 0 || arity > max_arity) {
		SWZ_ERROR("swizzle arity must be between 1 and {} (got {})", max_arity, arity);
		return false;
	}

	if (macro.empty()) {
		SWZ_ERROR("macro name is empty");
		return false;
	}

	return true;
}

EmitterConfig EmitterConfig::vec4_over_vec3()
{
	return EmitterConfig();
}

} // namespace swz
