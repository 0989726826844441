#include "semana/AnalysisError.hpp"
#include <ostream>
//---------------------------------------------------------------------------
// (c) 2023 Thomas Neumann
//---------------------------------------------------------------------------
using namespace std;
//---------------------------------------------------------------------------
namespace aqsema {
//---------------------------------------------------------------------------
Position AnalysisError::getPosition() const
// Get the (first) position
{
   switch (getKind()) {
      case Kind::TypeMismatch: return typeMismatch().pos;
      case Kind::BadCall: return badCall().pos;
      case Kind::IllegalExpression: return illegalExpression().pos;
      case Kind::AmbiguousColumnAccess: return ambiguousColumnAccess().pos;
      case Kind::UnknownCorrelationName: return unknownCorrelationName().pos;
      case Kind::DuplicateTableName: return duplicateTableName().firstPos;
   }
   __builtin_unreachable();
}
//---------------------------------------------------------------------------
string AnalysisError::getMessage() const
// Get a human readable message
{
   string prefix = getPosition().toString() + ": ";
   switch (getKind()) {
      case Kind::TypeMismatch: {
         auto& e = typeMismatch();
         return prefix + "type mismatch: expected " + e.expected.getName() + ", found " + e.found.getName();
      }
      case Kind::BadCall: return prefix + "bad call to '" + badCall().function + "'";
      case Kind::IllegalExpression: return prefix + "illegal expression '" + illegalExpression().text + "' in this context";
      case Kind::AmbiguousColumnAccess: return prefix + "ambiguous column access '" + ambiguousColumnAccess().name + "'";
      case Kind::UnknownCorrelationName: return prefix + "unknown correlation name in '" + unknownCorrelationName().name + "'";
      case Kind::DuplicateTableName: {
         auto& e = duplicateTableName();
         return prefix + "duplicate table name '" + e.first + "' (also at " + e.secondPos.toString() + " as '" + e.second + "')";
      }
   }
   __builtin_unreachable();
}
//---------------------------------------------------------------------------
ostream& operator<<(ostream& out, const AnalysisError& error)
// Write the message of an error
{
   return out << error.getMessage();
}
//---------------------------------------------------------------------------
void printErrors(ostream& out, const vector<AnalysisError>& errors)
// Write all errors, one per line
{
   for (auto& e : errors)
      out << e << endl;
}
//---------------------------------------------------------------------------
}
//---------------------------------------------------------------------------
