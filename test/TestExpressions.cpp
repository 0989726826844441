#include "Builders.hpp"
#include "semana/TypeChecker.hpp"
#include <gtest/gtest.h>
//---------------------------------------------------------------------------
// (c) 2023 Thomas Neumann
//---------------------------------------------------------------------------
using namespace aqsema;
using namespace aqsema::test;
//---------------------------------------------------------------------------
namespace {
//---------------------------------------------------------------------------
class Expressions : public ::testing::Test {
   protected:
   TypeChecker checker{Functions::builtins};
   TypeChecker::Errors errors;

   Type check(const ExpPtr& exp) { return checker.checkExpression(*exp, errors); }
};
//---------------------------------------------------------------------------
AnalysisError mismatch(Type expected, Type found, Position pos) { return AnalysisError::TypeMismatch{expected, found, pos}; }
//---------------------------------------------------------------------------
}
//---------------------------------------------------------------------------
TEST_F(Expressions, Literals) {
   EXPECT_EQ(check(num("42")), Type::getNumeric());
   EXPECT_EQ(check(lit(LiteralType::Float, "4.2")), Type::getNumeric());
   EXPECT_EQ(check(lit(LiteralType::Date, "2023-01-01")), Type::getNumeric());
   EXPECT_EQ(check(lit(LiteralType::Timestamp, "2023-01-01 12:00:00")), Type::getNumeric());
   EXPECT_EQ(check(str("abc")), Type::getString());
   EXPECT_EQ(check(boolean(false)), Type::getBool());
   EXPECT_EQ(check(id("x")), Type::getUnknown());
   EXPECT_EQ(check(col("t", "x")), Type::getUnknown());
   EXPECT_EQ(check(star()), Type::getUnknown());
   EXPECT_EQ(check(rowid()), Type::getNumeric());
   EXPECT_TRUE(errors.empty());
}
//---------------------------------------------------------------------------
TEST_F(Expressions, LogicIsBooleanOnly) {
   EXPECT_EQ(check(bin(Op::And, num("1", at(1, 1)), boolean(true, at(1, 7)))), Type::getBool());
   ASSERT_EQ(errors.size(), 1u);
   EXPECT_EQ(errors[0], mismatch(Type::getBool(), Type::getNumeric(), at(1, 1)));

   errors.clear();
   EXPECT_EQ(check(bin(Op::Or, id("a"), bin(Op::Less, id("b"), num()))), Type::getBool());
   EXPECT_TRUE(errors.empty());
}
//---------------------------------------------------------------------------
TEST_F(Expressions, Comparisons) {
   EXPECT_EQ(check(bin(Op::Less, str("a", at(2, 1)), num())), Type::getBool());
   ASSERT_EQ(errors.size(), 1u);
   EXPECT_EQ(errors[0], mismatch(Type::getNumeric(), Type::getString(), at(2, 1)));

   errors.clear();
   EXPECT_EQ(check(bin(Op::GreaterOrEqual, rowid(), id("x"))), Type::getBool());
   EXPECT_TRUE(errors.empty());
}
//---------------------------------------------------------------------------
TEST_F(Expressions, EqualityFollowsLeftSide) {
   check(bin(Op::Equal, num(), str("a", at(1, 5))));
   ASSERT_EQ(errors.size(), 1u);
   EXPECT_EQ(errors[0], mismatch(Type::getNumeric(), Type::getString(), at(1, 5)));

   // Unknown on either side is accepted
   errors.clear();
   EXPECT_EQ(check(bin(Op::Equal, id("x"), str())), Type::getBool());
   EXPECT_EQ(check(bin(Op::NotEqual, str(), id("x"))), Type::getBool());
   EXPECT_EQ(check(bin(Op::Equal, boolean(), boolean(false))), Type::getBool());
   EXPECT_TRUE(errors.empty());
}
//---------------------------------------------------------------------------
TEST_F(Expressions, Arithmetic) {
   EXPECT_EQ(check(bin(Op::Mul, bin(Op::Less, id("a"), id("b")), id("c"))), Type::getNumeric());
   EXPECT_EQ(check(bin(Op::Power, num(), boolean())), Type::getNumeric());
   EXPECT_TRUE(errors.empty());

   EXPECT_EQ(check(bin(Op::Minus, str("a", at(3, 2)), num())), Type::getNumeric());
   ASSERT_EQ(errors.size(), 1u);
   EXPECT_EQ(errors[0], mismatch(Type::getNumeric(), Type::getString(), at(3, 2)));
}
//---------------------------------------------------------------------------
TEST_F(Expressions, Unary) {
   EXPECT_EQ(check(notE(num("1", at(1, 5)))), Type::getBool());
   EXPECT_EQ(check(negate(boolean(true, at(2, 2)))), Type::getNumeric());
   EXPECT_EQ(check(negate(id("x"))), Type::getNumeric());
   ASSERT_EQ(errors.size(), 2u);
   EXPECT_EQ(errors[0], mismatch(Type::getBool(), Type::getNumeric(), at(1, 5)));
   EXPECT_EQ(errors[1], mismatch(Type::getNumeric(), Type::getBool(), at(2, 2)));
}
//---------------------------------------------------------------------------
TEST_F(Expressions, NestedErrorsComeFirst) {
   // ("a" + 1) AND 2
   check(bin(Op::And, bin(Op::Plus, str("a", at(1, 2)), num(), at(1, 6)), num("2", at(1, 15))));
   ASSERT_EQ(errors.size(), 3u);
   EXPECT_EQ(errors[0], mismatch(Type::getNumeric(), Type::getString(), at(1, 2)));
   EXPECT_EQ(errors[1], mismatch(Type::getBool(), Type::getNumeric(), at(1, 6)));
   EXPECT_EQ(errors[2], mismatch(Type::getBool(), Type::getNumeric(), at(1, 15)));
}
//---------------------------------------------------------------------------
TEST_F(Expressions, UndeclaredCall) {
   EXPECT_EQ(check(call("foo", exprs(num(), str()))), Type::getUnknown());
   EXPECT_TRUE(errors.empty());

   // The arguments are still checked
   check(call("foo", exprs(bin(Op::Less, str("a", at(4, 5)), num()))));
   ASSERT_EQ(errors.size(), 1u);
   EXPECT_EQ(errors[0].getKind(), AnalysisError::Kind::TypeMismatch);
}
//---------------------------------------------------------------------------
TEST_F(Expressions, BuiltinCalls) {
   EXPECT_EQ(check(call("sqrt", exprs(id("x")))), Type::getNumeric());
   EXPECT_EQ(check(call("like", exprs(id("x"), str("a%")))), Type::getBool());
   EXPECT_EQ(check(call("sums", exprs(num("3"), bin(Op::Greater, id("x"), num())))), Type::getNumeric());
   EXPECT_EQ(check(call("prev", exprs(str()))), Type::getUnknown());
   EXPECT_TRUE(errors.empty());

   EXPECT_EQ(check(call("sqrt", exprs(str()), at(2, 1))), Type::getUnknown());
   EXPECT_EQ(check(call("mod", exprs(num()), at(3, 1))), Type::getUnknown());
   ASSERT_EQ(errors.size(), 2u);
   EXPECT_EQ(errors[0], AnalysisError(AnalysisError::BadCall{"sqrt", at(2, 1)}));
   EXPECT_EQ(errors[1], AnalysisError(AnalysisError::BadCall{"mod", at(3, 1)}));
}
//---------------------------------------------------------------------------
TEST_F(Expressions, BadCallPrecedesArgumentErrors) {
   // sqrt("a" < 1): the argument is boolean, which sqrt does not accept
   check(call("sqrt", exprs(bin(Op::Less, str("a", at(1, 6)), num())), at(1, 1)));
   ASSERT_EQ(errors.size(), 2u);
   EXPECT_EQ(errors[0], AnalysisError(AnalysisError::BadCall{"sqrt", at(1, 1)}));
   EXPECT_EQ(errors[1], mismatch(Type::getNumeric(), Type::getString(), at(1, 6)));
}
//---------------------------------------------------------------------------
TEST_F(Expressions, UserDefinedCall) {
   Functions functions(&Functions::builtins);
   functions.registerFunction("f", Functions::Signature::userDefined(2));
   TypeChecker local(functions);

   EXPECT_EQ(local.checkExpression(*call("f", exprs(num(), str())), errors), Type::getUnknown());
   EXPECT_TRUE(errors.empty());

   EXPECT_EQ(local.checkExpression(*call("f", exprs(num(), num(), num()), at(5, 3)), errors), Type::getUnknown());
   ASSERT_EQ(errors.size(), 1u);
   EXPECT_EQ(errors[0], AnalysisError(AnalysisError::BadCall{"f", at(5, 3)}));
}
//---------------------------------------------------------------------------
TEST_F(Expressions, CaseResultsMustAgree) {
   // CASE WHEN a THEN 1 WHEN b THEN 2 WHEN c THEN "x" END
   auto exp = caseE(nullptr, cases(id("a"), num("1"), id("b"), num("2"), id("c"), str("x", at(1, 40))), nullptr);
   EXPECT_EQ(check(exp), Type::getNumeric());
   ASSERT_EQ(errors.size(), 1u);
   EXPECT_EQ(errors[0], mismatch(Type::getNumeric(), Type::getString(), at(1, 40)));
}
//---------------------------------------------------------------------------
TEST_F(Expressions, CaseConditions) {
   // Searched case needs boolean conditions
   check(caseE(nullptr, cases(num("1", at(1, 11)), str()), str()));
   ASSERT_EQ(errors.size(), 1u);
   EXPECT_EQ(errors[0], mismatch(Type::getBool(), Type::getNumeric(), at(1, 11)));

   // Simple case compares with the value
   errors.clear();
   EXPECT_EQ(check(caseE(num(), cases(num("1"), str(), str("b", at(2, 20)), str()), nullptr)), Type::getString());
   ASSERT_EQ(errors.size(), 1u);
   EXPECT_EQ(errors[0], mismatch(Type::getNumeric(), Type::getString(), at(2, 20)));

   // An unknown value accepts everything
   errors.clear();
   check(caseE(id("x"), cases(num(), str(), str(), str()), nullptr));
   EXPECT_TRUE(errors.empty());
}
//---------------------------------------------------------------------------
TEST_F(Expressions, CaseDefault) {
   check(caseE(nullptr, cases(id("a"), num()), str("x", at(3, 30))));
   ASSERT_EQ(errors.size(), 1u);
   EXPECT_EQ(errors[0], mismatch(Type::getNumeric(), Type::getString(), at(3, 30)));

   errors.clear();
   EXPECT_EQ(check(caseE(nullptr, cases(id("a"), id("x")), str())), Type::getUnknown());
   EXPECT_TRUE(errors.empty());
}
//---------------------------------------------------------------------------
TEST_F(Expressions, CaseWithoutBranches) {
   EXPECT_EQ(check(caseE(nullptr, {}, num(), at(7, 1))), Type::getUnknown());
   ASSERT_EQ(errors.size(), 1u);
   EXPECT_EQ(errors[0], mismatch(Type::getBool(), Type::getUnit(), at(7, 1)));
}
//---------------------------------------------------------------------------
TEST_F(Expressions, ArrayIndexIgnoresIndex) {
   EXPECT_EQ(check(subscript(id("x"), str())), Type::getUnknown());
   EXPECT_EQ(check(subscript(id("x"), bin(Op::And, num(), num()))), Type::getUnknown());
   EXPECT_TRUE(errors.empty());

   check(subscript(notE(num("1", at(1, 5))), num()));
   ASSERT_EQ(errors.size(), 1u);
   EXPECT_EQ(errors[0], mismatch(Type::getBool(), Type::getNumeric(), at(1, 5)));
}
//---------------------------------------------------------------------------
TEST_F(Expressions, EachIsTransparent) {
   EXPECT_EQ(check(each(str())), Type::getString());
   EXPECT_EQ(check(each(bin(Op::Less, id("a"), id("b")))), Type::getBool());
   EXPECT_TRUE(errors.empty());
}
//---------------------------------------------------------------------------
TEST_F(Expressions, CheckType) {
   checker.checkType(TypeSet::getBool(), *str("s", at(9, 9)), errors);
   checker.checkType(TypeSet::getNumericOrBool(), *boolean(), errors);
   checker.checkType(TypeSet::getAny(), *id("x"), errors);
   ASSERT_EQ(errors.size(), 1u);
   EXPECT_EQ(errors[0], mismatch(Type::getBool(), Type::getString(), at(9, 9)));
}
//---------------------------------------------------------------------------
TEST_F(Expressions, Prohibited) {
   // t.a + ROWID * sqrt(*)
   auto exp = bin(Op::Plus, col("t", "a", at(1, 1)), bin(Op::Mul, rowid(at(1, 7)), call("sqrt", exprs(star(at(1, 20))))));
   checker.checkProhibited(*exp, errors);
   ASSERT_EQ(errors.size(), 3u);
   EXPECT_EQ(errors[0], AnalysisError(AnalysisError::IllegalExpression{"t.a", at(1, 1)}));
   EXPECT_EQ(errors[1], AnalysisError(AnalysisError::IllegalExpression{"ROWID", at(1, 7)}));
   EXPECT_EQ(errors[2], AnalysisError(AnalysisError::IllegalExpression{"*", at(1, 20)}));

   errors.clear();
   checker.checkProhibited(*bin(Op::Plus, id("a"), call("f", exprs(num()))), errors);
   EXPECT_TRUE(errors.empty());
}
//---------------------------------------------------------------------------
TEST_F(Expressions, CheckingIsRepeatable) {
   auto exp = bin(Op::And, call("sqrt", exprs(str())), caseE(nullptr, {}, nullptr));
   check(exp);
   auto first = errors;
   errors.clear();
   check(exp);
   EXPECT_FALSE(first.empty());
   EXPECT_EQ(errors, first);
}
//---------------------------------------------------------------------------
TEST_F(Expressions, Rendering) {
   EXPECT_EQ(bin(Op::Mul, bin(Op::Plus, id("a"), num("1")), num("2"))->toString(), "(a + 1) * 2");
   EXPECT_EQ(bin(Op::NotEqual, col("t", "a"), str("x\"y"))->toString(), "t.a != \"x\\\"y\"");
   EXPECT_EQ(notE(bin(Op::Or, boolean(), boolean(false)))->toString(), "NOT (TRUE OR FALSE)");
   EXPECT_EQ(lit(LiteralType::Boolean, "True")->toString(), "TRUE");
   EXPECT_EQ(lit(LiteralType::Boolean, "fAlSe")->toString(), "FALSE");
   EXPECT_EQ(lit(LiteralType::Boolean, "1")->toString(), "1");
   EXPECT_EQ(call("f", exprs(star(), rowid()))->toString(), "f(*, ROWID)");
   EXPECT_EQ(subscript(id("x"), num("3"))->toString(), "x[3]");
   EXPECT_EQ(each(negate(id("x")))->toString(), "EACH(-x)");
   EXPECT_EQ(caseE(id("v"), cases(num("1"), str("one")), str("other"))->toString(), "CASE v WHEN 1 THEN \"one\" ELSE \"other\" END");
}
//---------------------------------------------------------------------------
