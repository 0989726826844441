#include "Builders.hpp"
#include "semana/AnalysisError.hpp"
#include "semana/TypeChecker.hpp"
#include <sstream>
#include <gtest/gtest.h>
//---------------------------------------------------------------------------
// (c) 2023 Thomas Neumann
//---------------------------------------------------------------------------
using namespace aqsema;
using namespace aqsema::test;
//---------------------------------------------------------------------------
TEST(ErrorReporting, Messages) {
   EXPECT_EQ(AnalysisError(AnalysisError::TypeMismatch{Type::getBool(), Type::getNumeric(), at(3, 7)}).getMessage(), "3:7: type mismatch: expected boolean, found numeric");
   EXPECT_EQ(AnalysisError(AnalysisError::BadCall{"sqrt", at(1, 2)}).getMessage(), "1:2: bad call to 'sqrt'");
   EXPECT_EQ(AnalysisError(AnalysisError::IllegalExpression{"a + b", at(4, 1)}).getMessage(), "4:1: illegal expression 'a + b' in this context");
   EXPECT_EQ(AnalysisError(AnalysisError::AmbiguousColumnAccess{"T.x", at(2, 2)}).getMessage(), "2:2: ambiguous column access 'T.x'");
   EXPECT_EQ(AnalysisError(AnalysisError::UnknownCorrelationName{"U.x", at(5, 9)}).getMessage(), "5:9: unknown correlation name in 'U.x'");
   EXPECT_EQ(AnalysisError(AnalysisError::DuplicateTableName{"T as A", "U as A", at(1, 6), at(1, 17)}).getMessage(), "1:6: duplicate table name 'T as A' (also at 1:17 as 'U as A')");
}
//---------------------------------------------------------------------------
TEST(ErrorReporting, Accessors) {
   AnalysisError error = AnalysisError::DuplicateTableName{"T", "T", at(1, 1), at(2, 2)};
   EXPECT_EQ(error.getKind(), AnalysisError::Kind::DuplicateTableName);
   EXPECT_EQ(error.getPosition(), at(1, 1));
   EXPECT_EQ(error.duplicateTableName().secondPos, at(2, 2));

   AnalysisError call = AnalysisError::BadCall{"f", at(3, 3)};
   EXPECT_EQ(call.getKind(), AnalysisError::Kind::BadCall);
   EXPECT_EQ(call.badCall().function, "f");
   EXPECT_NE(call, error);
   EXPECT_NE(call, AnalysisError(AnalysisError::BadCall{"f", at(3, 4)}));
   EXPECT_EQ(call, AnalysisError(AnalysisError::BadCall{"f", at(3, 3)}));
}
//---------------------------------------------------------------------------
TEST(ErrorReporting, Printing) {
   std::ostringstream single;
   single << AnalysisError(AnalysisError::BadCall{"mod", at(1, 1)});
   EXPECT_EQ(single.str(), "1:1: bad call to 'mod'");

   auto p = program(query(filter(scan("T"), exprs(num("1", at(1, 10)), col("U", "x", at(1, 20))))));
   std::ostringstream out;
   printErrors(out, TypeChecker::analyze(p));
   EXPECT_EQ(out.str(), "1:10: type mismatch: expected boolean, found numeric\n1:20: unknown correlation name in 'U.x'\n");

   std::ostringstream empty;
   printErrors(empty, {});
   EXPECT_EQ(empty.str(), "");
}
//---------------------------------------------------------------------------
