#include "infra/Position.hpp"
#include "infra/Type.hpp"
#include <gtest/gtest.h>
//---------------------------------------------------------------------------
// (c) 2023 Thomas Neumann
//---------------------------------------------------------------------------
using namespace aqsema;
//---------------------------------------------------------------------------
TEST(TypeLattice, Names) {
   EXPECT_EQ(Type::getUnit().getName(), "unit");
   EXPECT_EQ(Type::getNumeric().getName(), "numeric");
   EXPECT_EQ(Type::getBool().getName(), "boolean");
   EXPECT_EQ(Type::getString().getName(), "string");
   EXPECT_EQ(Type::getUnknown().getName(), "unknown");
}
//---------------------------------------------------------------------------
TEST(TypeLattice, Equality) {
   EXPECT_EQ(Type::getNumeric(), Type(Type::Numeric));
   EXPECT_NE(Type::getNumeric(), Type::getBool());
   EXPECT_TRUE(Type::getUnknown().isUnknown());
   EXPECT_FALSE(Type::getUnit().isUnknown());
}
//---------------------------------------------------------------------------
TEST(TypeLattice, ExactSets) {
   auto num = TypeSet::getNumeric();
   EXPECT_TRUE(num.matches(Type::getNumeric()));
   EXPECT_FALSE(num.matches(Type::getBool()));
   EXPECT_FALSE(num.matches(Type::getString()));
   EXPECT_FALSE(num.matches(Type::getUnit()));
   EXPECT_EQ(num.getPrimary(), Type::getNumeric());

   auto str = TypeSet::exactly(Type::getString());
   EXPECT_TRUE(str.matches(Type::getString()));
   EXPECT_FALSE(str.matches(Type::getNumeric()));
}
//---------------------------------------------------------------------------
TEST(TypeLattice, UnknownMatchesBothWays) {
   // An unknown actual type satisfies every expectation
   for (auto set : {TypeSet::getBool(), TypeSet::getNumeric(), TypeSet::getNumericOrBool(), TypeSet::getAny(), TypeSet::exactly(Type::getUnit())})
      EXPECT_TRUE(set.matches(Type::getUnknown()));

   // An unknown expectation accepts every type
   auto unknown = TypeSet::exactly(Type::getUnknown());
   for (auto t : {Type::getUnit(), Type::getNumeric(), Type::getBool(), Type::getString(), Type::getUnknown()})
      EXPECT_TRUE(unknown.matches(t));
}
//---------------------------------------------------------------------------
TEST(TypeLattice, MultiTypeSets) {
   auto numAndBool = TypeSet::getNumericOrBool();
   EXPECT_TRUE(numAndBool.matches(Type::getNumeric()));
   EXPECT_TRUE(numAndBool.matches(Type::getBool()));
   EXPECT_FALSE(numAndBool.matches(Type::getString()));
   EXPECT_EQ(numAndBool.getPrimary(), Type::getNumeric());

   auto any = TypeSet::getAny();
   EXPECT_TRUE(any.matches(Type::getNumeric()));
   EXPECT_TRUE(any.matches(Type::getBool()));
   EXPECT_TRUE(any.matches(Type::getString()));
   EXPECT_FALSE(any.matches(Type::getUnit()));

   // The first member is reported on a mismatch
   TypeSet stringFirst{Type::getString(), Type::getNumeric()};
   EXPECT_EQ(stringFirst.getPrimary(), Type::getString());
   EXPECT_TRUE(stringFirst.contains(Type::getNumeric()));
   EXPECT_FALSE(stringFirst.contains(Type::getBool()));
}
//---------------------------------------------------------------------------
TEST(TypeLattice, Positions) {
   EXPECT_EQ((Position{3, 14}).toString(), "3:14");
   EXPECT_EQ((Position{3, 14}), (Position{3, 14}));
   EXPECT_NE((Position{3, 14}), (Position{14, 3}));
}
//---------------------------------------------------------------------------
