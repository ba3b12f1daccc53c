#pragma once

#include <iterator>
#include <string>
#include <vector>

#include "alphabet.hpp"

namespace swz {

// Lazy enumeration of alphabet^arity in odometer order, where the
// rightmost position advances fastest. Tuples are yielded as code strings.
class CartesianPower {
	Alphabet alphabet;
	size_t arity;
public:
	struct sentinel {};

	class iterator {
		const Alphabet *alphabet;
		std::vector <size_t> digits;
		std::string code;
		bool done;
	public:
		using iterator_category = std::input_iterator_tag;
		using value_type = std::string;
		using difference_type = std::ptrdiff_t;
		using pointer = const std::string *;
		using reference = const std::string &;

		iterator(const Alphabet &, size_t);

		reference operator*() const;
		pointer operator->() const;

		iterator &operator++();

		bool operator==(sentinel) const;
	};

	CartesianPower(const Alphabet &, size_t);

	iterator begin() const;
	sentinel end() const;

	size_t size() const;
};

} // namespace swz
