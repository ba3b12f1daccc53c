#include "swizzle/covered_set.hpp"
#include "swizzle/product.hpp"

namespace swz {

CoveredSet::CoveredSet(const Alphabet &covered, size_t arity)
{
	CartesianPower power(covered, arity);
	codes.reserve(power.size());
	for (const auto &code : power)
		codes.insert(code);
}

bool CoveredSet::contains(const std::string &code) const
{
	return codes.contains(code);
}

size_t CoveredSet::size() const
{
	return codes.size();
}

} // namespace swz
