#include "algebra/Operator.hpp"
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
}
//---------------------------------------------------------------------------
Operator::~Operator()
// Destructor
{
}
//---------------------------------------------------------------------------
TableScan::TableScan(Position pos, string name, optional<string> alias)
   : Operator(tag), name(move(name)), alias(move(alias)), pos(pos)
// Constructor
{
}
//---------------------------------------------------------------------------
string TableScan::getFullName() const
// Get the full description
{
   if (alias) return name + " as " + *alias;
   return name;
}
//---------------------------------------------------------------------------
vector<const Expression*> TableScan::getExpressions() const
// Get all expressions
{
   return {};
}
//---------------------------------------------------------------------------
vector<const Operator*> TableScan::getInputs() const
// Get the inputs
{
   return {};
}
//---------------------------------------------------------------------------
Project::Project(unique_ptr<Operator> input, vector<unique_ptr<Expression>> expressions)
   : Operator(tag), input(move(input)), expressions(move(expressions))
// Constructor
{
}
//---------------------------------------------------------------------------
vector<const Expression*> Project::getExpressions() const
// Get all expressions
{
   vector<const Expression*> result;
   appendAll(result, expressions);
   return result;
}
//---------------------------------------------------------------------------
vector<const Operator*> Project::getInputs() const
// Get the inputs
{
   return {input.get()};
}
//---------------------------------------------------------------------------
Filter::Filter(unique_ptr<Operator> input, vector<unique_ptr<Expression>> conditions)
   : Operator(tag), input(move(input)), conditions(move(conditions))
// Constructor
{
}
//---------------------------------------------------------------------------
vector<const Expression*> Filter::getExpressions() const
// Get all expressions
{
   vector<const Expression*> result;
   appendAll(result, conditions);
   return result;
}
//---------------------------------------------------------------------------
vector<const Operator*> Filter::getInputs() const
// Get the inputs
{
   return {input.get()};
}
//---------------------------------------------------------------------------
GroupBy::GroupBy(unique_ptr<Operator> input, vector<unique_ptr<Expression>> groupBy, vector<unique_ptr<Expression>> having)
   : Operator(tag), input(move(input)), groupBy(move(groupBy)), having(move(having))
// Constructor
{
}
//---------------------------------------------------------------------------
vector<const Expression*> GroupBy::getExpressions() const
// Get all expressions, groups first
{
   vector<const Expression*> result;
   appendAll(result, groupBy);
   appendAll(result, having);
   return result;
}
//---------------------------------------------------------------------------
vector<const Operator*> GroupBy::getInputs() const
// Get the inputs
{
   return {input.get()};
}
//---------------------------------------------------------------------------
Join::Join(unique_ptr<Operator> left, unique_ptr<Operator> right, vector<unique_ptr<Expression>> conditions, JoinType joinType)
   : Operator(tag), left(move(left)), right(move(right)), conditions(move(conditions)), joinType(joinType)
// Constructor
{
}
//---------------------------------------------------------------------------
vector<const Expression*> Join::getExpressions() const
// Get all expressions
{
   vector<const Expression*> result;
   appendAll(result, conditions);
   return result;
}
//---------------------------------------------------------------------------
vector<const Operator*> Join::getInputs() const
// Get the inputs
{
   return {left.get(), right.get()};
}
//---------------------------------------------------------------------------
Sort::Sort(unique_ptr<Operator> input, vector<Entry> order)
   : Operator(tag), input(move(input)), order(move(order))
// Constructor
{
}
//---------------------------------------------------------------------------
vector<const Expression*> Sort::getExpressions() const
// Get all expressions
{
   vector<const Expression*> result;
   for (auto& o : order)
      result.push_back(o.value.get());
   return result;
}
//---------------------------------------------------------------------------
vector<const Operator*> Sort::getInputs() const
// Get the inputs
{
   return {input.get()};
}
//---------------------------------------------------------------------------
}
//---------------------------------------------------------------------------
