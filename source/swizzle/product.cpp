#include "common/logging.hpp"
#include "swizzle/product.hpp"

namespace swz {

MODULE(product);

//////////////
// Iterator //
//////////////

CartesianPower::iterator::iterator(const Alphabet &alphabet_, size_t arity)
		: alphabet(&alphabet_),
		digits(arity, 0),
		done(arity > 0 && alphabet_.size() == 0)
{
	if (!done && arity > 0)
		code = std::string(arity, alphabet->symbols.front());
}

CartesianPower::iterator::reference CartesianPower::iterator::operator*() const
{
	SWZ_ASSERT(!done, "dereferencing an exhausted product iterator");
	return code;
}

CartesianPower::iterator::pointer CartesianPower::iterator::operator->() const
{
	return &code;
}

CartesianPower::iterator &CartesianPower::iterator::operator++()
{
	SWZ_ASSERT(!done, "advancing an exhausted product iterator");

	const std::string &symbols = alphabet->symbols;

	// Odometer step, carrying into the left neighbor on wrap around
	for (size_t i = digits.size(); i-- > 0; ) {
		if (++digits[i] < symbols.size()) {
			code[i] = symbols[digits[i]];
			return *this;
		}

		digits[i] = 0;
		code[i] = symbols.front();
	}

	done = true;
	return *this;
}

bool CartesianPower::iterator::operator==(sentinel) const
{
	return done;
}

///////////
// Range //
///////////

CartesianPower::CartesianPower(const Alphabet &alphabet_, size_t arity_)
		: alphabet(alphabet_), arity(arity_) {}

CartesianPower::iterator CartesianPower::begin() const
{
	return iterator(alphabet, arity);
}

CartesianPower::sentinel CartesianPower::end() const
{
	return sentinel();
}

size_t CartesianPower::size() const
{
	size_t count = 1;
	for (size_t i = 0; i < arity; i++)
		count *= alphabet.size();

	return count;
}

} // namespace swz
