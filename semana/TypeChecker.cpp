#include "semana/TypeChecker.hpp"
#include "algebra/Expression.hpp"
#include <stdexcept>
//---------------------------------------------------------------------------
// (c) 2023 Thomas Neumann
//---------------------------------------------------------------------------
using namespace std;
//---------------------------------------------------------------------------
namespace aqsema {
//---------------------------------------------------------------------------
using Expression = algebra::Expression;
//---------------------------------------------------------------------------
void TypeChecker::invalidAST()
// Invalid AST node
{
   throw runtime_error("invalid AST");
}
//---------------------------------------------------------------------------
void TypeChecker::checkType(TypeSet expected, const Expression& exp, Errors& errors) const
// Check that an expression has one of the expected types
{
   auto type = checkExpression(exp, errors);
   // Only the primary type is reported
   if (!expected.matches(type))
      errors.push_back(AnalysisError::TypeMismatch{expected.getPrimary(), type, exp.getPosition()});
}
//---------------------------------------------------------------------------
Type TypeChecker::checkLiteral(const algebra::Literal& literal) const
// Check a literal
{
   using SubType = algebra::Literal::SubType;
   switch (literal.subType) {
      case SubType::Integer: return Type::getNumeric();
      case SubType::Float: return Type::getNumeric();
      case SubType::String: return Type::getString();
      case SubType::Date: return Type::getNumeric();
      case SubType::Timestamp: return Type::getNumeric();
      case SubType::Boolean: return Type::getBool();
   }
   __builtin_unreachable();
}
//---------------------------------------------------------------------------
Type TypeChecker::checkBinaryExpression(const algebra::BinaryExpression& exp, Errors& errors) const
// Check a binary expression
{
   using Op = algebra::BinaryExpression::Operation;
   switch (exp.op) {
      case Op::And:
      case Op::Or:
         // Logic is boolean only, min/max cover the numeric case
         checkType(TypeSet::getBool(), required(exp.left), errors);
         checkType(TypeSet::getBool(), required(exp.right), errors);
         return Type::getBool();
      case Op::Less:
      case Op::LessOrEqual:
      case Op::Greater:
      case Op::GreaterOrEqual:
         checkType(TypeSet::getNumeric(), required(exp.left), errors);
         checkType(TypeSet::getNumeric(), required(exp.right), errors);
         return Type::getBool();
      case Op::Equal:
      case Op::NotEqual: {
         // The left side determines the type of the right side
         auto leftType = checkExpression(required(exp.left), errors);
         checkType(TypeSet::exactly(leftType), required(exp.right), errors);
         return Type::getBool();
      }
      case Op::Plus:
      case Op::Minus:
      case Op::Mul:
      case Op::Div:
      case Op::Power:
         // Booleans are allowed to support arithmetic like c1 * c2 > 2
         checkType(TypeSet::getNumericOrBool(), required(exp.left), errors);
         checkType(TypeSet::getNumericOrBool(), required(exp.right), errors);
         return Type::getNumeric();
   }
   __builtin_unreachable();
}
//---------------------------------------------------------------------------
Type TypeChecker::checkUnaryExpression(const algebra::UnaryExpression& exp, Errors& errors) const
// Check an unary expression
{
   switch (exp.op) {
      case algebra::UnaryExpression::Not:
         checkType(TypeSet::getBool(), required(exp.input), errors);
         return Type::getBool();
      case algebra::UnaryExpression::Negate:
         checkType(TypeSet::getNumeric(), required(exp.input), errors);
         return Type::getNumeric();
   }
   __builtin_unreachable();
}
//---------------------------------------------------------------------------
Type TypeChecker::checkCall(const algebra::CallExpression& exp, Errors& errors) const
// Check a function call
{
   // Without a signature we know nothing about the call, but the arguments still have to be valid
   auto signature = functions.lookup(exp.name);
   if (!signature) {
      for (auto& a : exp.arguments)
         checkExpression(required(a), errors);
      return Type::getUnknown();
   }

   Errors argumentErrors;
   vector<Type> argumentTypes;
   argumentTypes.reserve(exp.arguments.size());
   for (auto& a : exp.arguments)
      argumentTypes.push_back(checkExpression(required(a), argumentErrors));

   auto result = signature->match(argumentTypes);
   if (!result)
      errors.push_back(AnalysisError::BadCall{exp.name, exp.getPosition()});
   errors.insert(errors.end(), make_move_iterator(argumentErrors.begin()), make_move_iterator(argumentErrors.end()));
   return result.value_or(Type::getUnknown());
}
//---------------------------------------------------------------------------
Type TypeChecker::checkCase(const algebra::CaseExpression& exp, Errors& errors) const
// Check a case expression
{
   // Conditions must match the searched value, or be boolean for a searched case
   auto conditionType = Type::getBool();
   if (exp.value)
      conditionType = checkExpression(*exp.value, errors);
   for (auto& c : exp.cases)
      checkType(TypeSet::exactly(conditionType), required(c.first), errors);

   // The first result defines the type of all results
   auto resultType = Type::getUnknown();
   if (exp.cases.empty()) {
      errors.push_back(AnalysisError::TypeMismatch{Type::getBool(), Type::getUnit(), exp.getPosition()});
   } else {
      resultType = checkExpression(required(exp.cases.front().second), errors);
      for (auto iter = exp.cases.begin() + 1, limit = exp.cases.end(); iter != limit; ++iter)
         checkType(TypeSet::exactly(resultType), required(iter->second), errors);
   }
   if (exp.defaultValue)
      checkType(TypeSet::exactly(resultType), *exp.defaultValue, errors);

   return resultType;
}
//---------------------------------------------------------------------------
Type TypeChecker::checkExpression(const Expression& exp, Errors& errors) const
// Check an expression
{
   switch (exp.getKind()) {
      case Expression::Kind::Literal: return checkLiteral(exp.as<algebra::Literal>());
      case Expression::Kind::Identifier: return Type::getUnknown();
      case Expression::Kind::RowId: return Type::getNumeric();
      case Expression::Kind::Wildcard: return Type::getUnknown();
      case Expression::Kind::ColumnAccess: return Type::getUnknown();
      case Expression::Kind::Unary: return checkUnaryExpression(exp.as<algebra::UnaryExpression>(), errors);
      case Expression::Kind::Binary: return checkBinaryExpression(exp.as<algebra::BinaryExpression>(), errors);
      case Expression::Kind::Call: return checkCall(exp.as<algebra::CallExpression>(), errors);
      case Expression::Kind::ArrayIndex: {
         // The index must exist, but is not checked, neither its type nor its range
         auto& index = exp.as<algebra::ArrayIndex>();
         required(index.index);
         checkExpression(required(index.array), errors);
         return Type::getUnknown();
      }
      case Expression::Kind::Case: return checkCase(exp.as<algebra::CaseExpression>(), errors);
      case Expression::Kind::Each: return checkExpression(required(exp.as<algebra::EachExpression>().input), errors);
   }
   __builtin_unreachable();
}
//---------------------------------------------------------------------------
void TypeChecker::checkProhibited(const Expression& exp, Errors& errors) const
// Check that an expression does not use constructs that are only valid in queries
{
   switch (exp.getKind()) {
      case Expression::Kind::Wildcard:
      case Expression::Kind::ColumnAccess:
      case Expression::Kind::RowId:
         errors.push_back(AnalysisError::IllegalExpression{exp.toString(), exp.getPosition()});
         break;
      default: break;
   }
   for (auto c : exp.getChildren())
      checkProhibited(required(c), errors);
}
//---------------------------------------------------------------------------
}
//---------------------------------------------------------------------------
