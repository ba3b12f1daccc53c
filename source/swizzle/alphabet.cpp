#include <set>

#include "common/logging.hpp"
#include "swizzle/alphabet.hpp"

namespace swz {

MODULE(alphabet);

Alphabet::Alphabet(const std::string &symbols_) : symbols(symbols_) {}

size_t Alphabet::size() const
{
	return symbols.size();
}

bool Alphabet::contains(char c) const
{
	return symbols.find(c) != std::string::npos;
}

bool Alphabet::subset_of(const Alphabet &other) const
{
	for (char c : symbols) {
		if (!other.contains(c))
			return false;
	}

	return true;
}

bool Alphabet::validate() const
{
	if (symbols.empty()) {
		SWZ_ERROR("alphabet is empty");
		return false;
	}

	std::set <char> seen;
	for (char c : symbols) {
		if (seen.contains(c)) {
			SWZ_ERROR("symbol '{}' appears more than once in alphabet \"{}\"", c, symbols);
			return false;
		}

		seen.insert(c);
	}

	return true;
}

Alphabet Alphabet::xy()
{
	return Alphabet("xy");
}

Alphabet Alphabet::xyz()
{
	return Alphabet("xyz");
}

Alphabet Alphabet::xyzw()
{
	return Alphabet("xyzw");
}

} // namespace swz
