#include <gtest/gtest.h>

#include "swizzle/alphabet.hpp"

using namespace swz;

TEST(alphabet, presets)
{
	ASSERT_EQ(Alphabet::xyzw().symbols, "xyzw");
	ASSERT_EQ(Alphabet::xyz().symbols, "xyz");
	ASSERT_EQ(Alphabet::xy().symbols, "xy");
}

TEST(alphabet, membership)
{
	Alphabet A = Alphabet::xyz();

	ASSERT_TRUE(A.contains('x'));
	ASSERT_TRUE(A.contains('z'));
	ASSERT_FALSE(A.contains('w'));
	ASSERT_EQ(A.size(), 3);
}

TEST(alphabet, subset)
{
	ASSERT_TRUE(Alphabet::xyz().subset_of(Alphabet::xyzw()));
	ASSERT_TRUE(Alphabet::xy().subset_of(Alphabet::xyz()));
	ASSERT_TRUE(Alphabet("zx").subset_of(Alphabet::xyz()));
	ASSERT_FALSE(Alphabet::xyzw().subset_of(Alphabet::xyz()));
	ASSERT_FALSE(Alphabet("rgb").subset_of(Alphabet::xyzw()));
}

TEST(alphabet, validation)
{
	ASSERT_TRUE(Alphabet::xyzw().validate());
	ASSERT_TRUE(Alphabet("rgba").validate());
	ASSERT_FALSE(Alphabet("").validate());
	ASSERT_FALSE(Alphabet("xyx").validate());
}
