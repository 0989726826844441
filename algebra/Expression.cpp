#include "algebra/Expression.hpp"
#include "infra/SourceWriter.hpp"
#include <string_view>
//---------------------------------------------------------------------------
// (c) 2023 Thomas Neumann
//---------------------------------------------------------------------------
using namespace std;
//---------------------------------------------------------------------------
namespace aqsema::algebra {
//---------------------------------------------------------------------------
namespace {
//---------------------------------------------------------------------------
/// Compare with a lower case keyword, ignoring the case of the text
static bool isKeyword(string_view text, string_view keyword) {
   if (text.size() != keyword.size()) return false;
   for (size_t index = 0; index != text.size(); ++index) {
      unsigned c = static_cast<unsigned char>(text[index]);
      if ((((c >= 'A') && (c <= 'Z')) ? (c + 'a' - 'A') : c) != static_cast<unsigned char>(keyword[index])) return false;
   }
   return true;
}
//---------------------------------------------------------------------------
}
//---------------------------------------------------------------------------
Expression::~Expression()
// Destructor
{
}
//---------------------------------------------------------------------------
vector<const Expression*> Expression::getChildren() const
// Get the direct sub-expressions
{
   return {};
}
//---------------------------------------------------------------------------
void Expression::generateOperand(SourceWriter& out) const
// Render in a form that is suitable as operand
{
   out.write("(");
   generate(out);
   out.write(")");
}
//---------------------------------------------------------------------------
string Expression::toString() const
// Render into a string
{
   SourceWriter out;
   generate(out);
   return out.getResult();
}
//---------------------------------------------------------------------------
void Literal::generate(SourceWriter& out) const
// Render as query text
{
   switch (subType) {
      case SubType::String: out.writeString(value); break;
      case SubType::Boolean:
         // Unrecognized spellings are kept as written
         if (isKeyword(value, "true"))
            out.write("TRUE");
         else if (isKeyword(value, "false"))
            out.write("FALSE");
         else
            out.write(value);
         break;
      default: out.write(value); break;
   }
}
//---------------------------------------------------------------------------
void Identifier::generate(SourceWriter& out) const
// Render as query text
{
   out.write(name);
}
//---------------------------------------------------------------------------
void RowId::generate(SourceWriter& out) const
// Render as query text
{
   out.write("ROWID");
}
//---------------------------------------------------------------------------
void Wildcard::generate(SourceWriter& out) const
// Render as query text
{
   out.write("*");
}
//---------------------------------------------------------------------------
void ColumnAccess::generate(SourceWriter& out) const
// Render as query text
{
   out.writeQualified(table, column);
}
//---------------------------------------------------------------------------
UnaryExpression::UnaryExpression(Position pos, unique_ptr<Expression> input, Operation op)
   : Expression(tag, pos), input(move(input)), op(op)
// Constructor
{
}
//---------------------------------------------------------------------------
vector<const Expression*> UnaryExpression::getChildren() const
// Get the direct sub-expressions
{
   return {input.get()};
}
//---------------------------------------------------------------------------
void UnaryExpression::generate(SourceWriter& out) const
// Render as query text
{
   switch (op) {
      case Not: out.write("NOT "); break;
      case Negate: out.write("-"); break;
   }
   input->generateOperand(out);
}
//---------------------------------------------------------------------------
BinaryExpression::BinaryExpression(Position pos, unique_ptr<Expression> left, unique_ptr<Expression> right, Operation op)
   : Expression(tag, pos), left(move(left)), right(move(right)), op(op)
// Constructor
{
}
//---------------------------------------------------------------------------
const char* BinaryExpression::getOperatorName(Operation op)
// Get the operator as written
{
   switch (op) {
      case And: return "AND";
      case Or: return "OR";
      case Less: return "<";
      case LessOrEqual: return "<=";
      case Greater: return ">";
      case GreaterOrEqual: return ">=";
      case Equal: return "=";
      case NotEqual: return "!=";
      case Plus: return "+";
      case Minus: return "-";
      case Mul: return "*";
      case Div: return "/";
      case Power: return "^";
   }
   __builtin_unreachable();
}
//---------------------------------------------------------------------------
vector<const Expression*> BinaryExpression::getChildren() const
// Get the direct sub-expressions
{
   return {left.get(), right.get()};
}
//---------------------------------------------------------------------------
void BinaryExpression::generate(SourceWriter& out) const
// Render as query text
{
   left->generateOperand(out);
   out.write(" ");
   out.write(getOperatorName(op));
   out.write(" ");
   right->generateOperand(out);
}
//---------------------------------------------------------------------------
CallExpression::CallExpression(Position pos, string name, vector<unique_ptr<Expression>> arguments)
   : Expression(tag, pos), name(move(name)), arguments(move(arguments))
// Constructor
{
}
//---------------------------------------------------------------------------
vector<const Expression*> CallExpression::getChildren() const
// Get the direct sub-expressions
{
   vector<const Expression*> result;
   for (auto& a : arguments)
      result.push_back(a.get());
   return result;
}
//---------------------------------------------------------------------------
void CallExpression::generate(SourceWriter& out) const
// Render as query text
{
   out.write(name);
   out.write("(");
   bool first = true;
   for (auto& a : arguments) {
      if (first)
         first = false;
      else
         out.write(", ");
      a->generate(out);
   }
   out.write(")");
}
//---------------------------------------------------------------------------
ArrayIndex::ArrayIndex(Position pos, unique_ptr<Expression> array, unique_ptr<Expression> index)
   : Expression(tag, pos), array(move(array)), index(move(index))
// Constructor
{
}
//---------------------------------------------------------------------------
vector<const Expression*> ArrayIndex::getChildren() const
// Get the direct sub-expressions
{
   return {array.get(), index.get()};
}
//---------------------------------------------------------------------------
void ArrayIndex::generate(SourceWriter& out) const
// Render as query text
{
   array->generateOperand(out);
   out.write("[");
   index->generate(out);
   out.write("]");
}
//---------------------------------------------------------------------------
CaseExpression::CaseExpression(Position pos, unique_ptr<Expression> value, Cases cases, unique_ptr<Expression> defaultValue)
   : Expression(tag, pos), value(move(value)), cases(move(cases)), defaultValue(move(defaultValue))
// Constructor
{
}
//---------------------------------------------------------------------------
vector<const Expression*> CaseExpression::getChildren() const
// Get the direct sub-expressions
{
   vector<const Expression*> result;
   if (value) result.push_back(value.get());
   for (auto& c : cases) {
      result.push_back(c.first.get());
      result.push_back(c.second.get());
   }
   if (defaultValue) result.push_back(defaultValue.get());
   return result;
}
//---------------------------------------------------------------------------
void CaseExpression::generate(SourceWriter& out) const
// Render as query text
{
   out.write("CASE");
   if (value) {
      out.write(" ");
      value->generateOperand(out);
   }
   for (auto& c : cases) {
      out.write(" WHEN ");
      c.first->generate(out);
      out.write(" THEN ");
      c.second->generate(out);
   }
   if (defaultValue) {
      out.write(" ELSE ");
      defaultValue->generate(out);
   }
   out.write(" END");
}
//---------------------------------------------------------------------------
EachExpression::EachExpression(Position pos, unique_ptr<Expression> input)
   : Expression(tag, pos), input(move(input))
// Constructor
{
}
//---------------------------------------------------------------------------
vector<const Expression*> EachExpression::getChildren() const
// Get the direct sub-expressions
{
   return {input.get()};
}
//---------------------------------------------------------------------------
void EachExpression::generate(SourceWriter& out) const
// Render as query text
{
   out.write("EACH(");
   input->generate(out);
   out.write(")");
}
//---------------------------------------------------------------------------
}
//---------------------------------------------------------------------------
