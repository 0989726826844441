#include "algebra/Statement.hpp"
//---------------------------------------------------------------------------
// (c) 2023 Thomas Neumann
//---------------------------------------------------------------------------
using namespace std;
//---------------------------------------------------------------------------
namespace aqsema::algebra {
//---------------------------------------------------------------------------
namespace {
//---------------------------------------------------------------------------
/// Append the raw pointers of a list of expressions
static void appendAll(vector<const Expression*>& target, const vector<unique_ptr<Expression>>& source) {
   for (auto& e : source)
      target.push_back(e.get());
}
//---------------------------------------------------------------------------
/// Append the values of sort entries
static void appendAll(vector<const Expression*>& target, const vector<Sort::Entry>& source) {
   for (auto& e : source)
      target.push_back(e.value.get());
}
//---------------------------------------------------------------------------
}
//---------------------------------------------------------------------------
Statement::~Statement()
// Destructor
{
}
//---------------------------------------------------------------------------
Query::Query(vector<LocalQuery> locals, unique_ptr<Operator> main)
   : Statement(tag), locals(move(locals)), main(move(main))
// Constructor
{
}
//---------------------------------------------------------------------------
Update::Update(string table, vector<Assignment> assignments, vector<Sort::Entry> order, vector<unique_ptr<Expression>> where, vector<unique_ptr<Expression>> groupBy, vector<unique_ptr<Expression>> having)
   : Statement(tag), table(move(table)), assignments(move(assignments)), order(move(order)), where(move(where)), groupBy(move(groupBy)), having(move(having))
// Constructor
{
}
//---------------------------------------------------------------------------
vector<const Expression*> Update::getExpressions() const
// Get all expressions
{
   vector<const Expression*> result;
   for (auto& a : assignments)
      result.push_back(a.value.get());
   appendAll(result, order);
   appendAll(result, where);
   appendAll(result, groupBy);
   appendAll(result, having);
   return result;
}
//---------------------------------------------------------------------------
Delete::Delete(string table, variant<Columns, Conditions> target, vector<Sort::Entry> order, vector<unique_ptr<Expression>> groupBy, vector<unique_ptr<Expression>> having)
   : Statement(tag), table(move(table)), target(move(target)), order(move(order)), groupBy(move(groupBy)), having(move(having))
// Constructor
{
}
//---------------------------------------------------------------------------
vector<const Expression*> Delete::getExpressions() const
// Get all expressions
{
   vector<const Expression*> result;
   if (!deletesColumns()) appendAll(result, getWhere());
   appendAll(result, order);
   appendAll(result, groupBy);
   appendAll(result, having);
   return result;
}
//---------------------------------------------------------------------------
Create::Create(string name, variant<Schema, unique_ptr<Query>> content)
   : Statement(tag), name(move(name)), content(move(content))
// Constructor
{
}
//---------------------------------------------------------------------------
Insert::Insert(string table, vector<Sort::Entry> order, vector<string> columns, variant<Values, unique_ptr<Query>> source)
   : Statement(tag), table(move(table)), order(move(order)), columns(move(columns)), source(move(source))
// Constructor
{
}
//---------------------------------------------------------------------------
FunctionDefinition::FunctionDefinition(string name, vector<string> parameters, vector<BodyEntry> body)
   : Statement(tag), name(move(name)), parameters(move(parameters)), body(move(body))
// Constructor
{
}
//---------------------------------------------------------------------------
Verbatim::Verbatim(string code)
   : Statement(tag), code(move(code))
// Constructor
{
}
//---------------------------------------------------------------------------
}
//---------------------------------------------------------------------------
