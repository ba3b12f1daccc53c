#include <gtest/gtest.h>

#include "swizzle/covered_set.hpp"
#include "swizzle/product.hpp"

using namespace swz;

TEST(covered_set, vec3_cardinality)
{
	CoveredSet covered(Alphabet::xyz(), 3);
	ASSERT_EQ(covered.size(), 27);
}

TEST(covered_set, membership)
{
	CoveredSet covered(Alphabet::xyz(), 3);

	ASSERT_TRUE(covered.contains("xxx"));
	ASSERT_TRUE(covered.contains("xyz"));
	ASSERT_TRUE(covered.contains("zzz"));
	ASSERT_TRUE(covered.contains("zyx"));

	ASSERT_FALSE(covered.contains("www"));
	ASSERT_FALSE(covered.contains("xyw"));
	ASSERT_FALSE(covered.contains("wxy"));

	// Only tuples of the same arity are members
	ASSERT_FALSE(covered.contains("xy"));
	ASSERT_FALSE(covered.contains("xyzx"));
}

TEST(covered_set, contains_every_tuple_without_w)
{
	CoveredSet covered(Alphabet::xyz(), 3);

	for (const auto &code : CartesianPower(Alphabet::xyzw(), 3)) {
		bool has_w = code.find('w') != std::string::npos;
		ASSERT_EQ(covered.contains(code), !has_w) << "tuple: " << code;
	}
}
