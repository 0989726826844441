#include "algebra/Expression.hpp"
#include "algebra/Operator.hpp"
#include "algebra/Statement.hpp"
#include "semana/TypeChecker.hpp"
#include <map>
#include <optional>
#include <set>
#include <unordered_map>
//---------------------------------------------------------------------------
// (c) 2023 Thomas Neumann
//---------------------------------------------------------------------------
using namespace std;
//---------------------------------------------------------------------------
namespace aqsema {
//---------------------------------------------------------------------------
using Expression = algebra::Expression;
using Operator = algebra::Operator;
using TableScan = algebra::TableScan;
//---------------------------------------------------------------------------
namespace {
//---------------------------------------------------------------------------
/// Collect all tables of a query, left to right
static void collectTables(const Operator& op, vector<const TableScan*>& tables) {
   if (op.getKind() == Operator::Kind::TableScan) {
      tables.push_back(&op.as<TableScan>());
      return;
   }
   for (auto i : op.getInputs())
      collectTables(*i, tables);
}
//---------------------------------------------------------------------------
/// Collect the expressions of all operators in a tree
static void collectExpressions(const Operator& op, vector<const Expression*>& expressions) {
   auto e = op.getExpressions();
   expressions.insert(expressions.end(), e.begin(), e.end());
   for (auto i : op.getInputs())
      collectExpressions(*i, expressions);
}
//---------------------------------------------------------------------------
/// Collect all column accesses t.c within an expression
static void collectColumnAccesses(const Expression& exp, vector<const algebra::ColumnAccess*>& accesses) {
   if (exp.getKind() == Expression::Kind::ColumnAccess) {
      accesses.push_back(&exp.as<algebra::ColumnAccess>());
      return;
   }
   for (auto c : exp.getChildren())
      collectColumnAccesses(*c, accesses);
}
//---------------------------------------------------------------------------
/// A pair of reported tables
using TablePair = pair<const TableScan*, const TableScan*>;
//---------------------------------------------------------------------------
/// Group tables in order of first appearance, report the first two members of every group with duplicates unless that pair was reported before
template <class Key, class F>
static void reportDuplicates(const vector<const TableScan*>& tables, F keyOf, set<TablePair>& reported, TypeChecker::Errors& errors) {
   map<Key, unsigned> groupLookup;
   vector<vector<const TableScan*>> groups;
   for (auto t : tables) {
      auto [iter, inserted] = groupLookup.try_emplace(keyOf(*t), groups.size());
      if (inserted) groups.emplace_back();
      groups[iter->second].push_back(t);
   }
   for (auto& g : groups)
      if ((g.size() > 1) && reported.emplace(g[0], g[1]).second)
         errors.push_back(AnalysisError::DuplicateTableName{g[0]->getFullName(), g[1]->getFullName(), g[0]->pos, g[1]->pos});
}
//---------------------------------------------------------------------------
}
//---------------------------------------------------------------------------
void TypeChecker::checkSortExpressions(const vector<const Expression*>& order, Errors& errors) const
// Check that sort keys are simple column references
{
   for (auto o : order) {
      auto& key = required(o);
      auto kind = key.getKind();
      if ((kind != Expression::Kind::Identifier) && (kind != Expression::Kind::ColumnAccess))
         errors.push_back(AnalysisError::IllegalExpression{key.toString(), key.getPosition()});
   }
}
//---------------------------------------------------------------------------
void TypeChecker::checkOperator(const Operator& op, Errors& errors) const
// Check the expressions of an operator and its inputs
{
   switch (op.getKind()) {
      case Operator::Kind::Filter:
         for (auto& c : op.as<algebra::Filter>().conditions)
            checkType(TypeSet::getBool(), required(c), errors);
         break;
      case Operator::Kind::GroupBy:
         // Having is checked twice, once as predicate and once with all other expressions
         for (auto& h : op.as<algebra::GroupBy>().having)
            checkType(TypeSet::getBool(), required(h), errors);
         for (auto e : op.getExpressions())
            checkExpression(required(e), errors);
         break;
      case Operator::Kind::Join:
         for (auto& c : op.as<algebra::Join>().conditions)
            checkType(TypeSet::getBool(), required(c), errors);
         break;
      case Operator::Kind::Sort:
         checkSortExpressions(op.getExpressions(), errors);
         break;
      case Operator::Kind::TableScan:
      case Operator::Kind::Project:
         for (auto e : op.getExpressions())
            checkExpression(required(e), errors);
         break;
   }

   for (auto i : op.getInputs()) {
      if (!i) invalidAST();
      checkOperator(*i, errors);
   }
}
//---------------------------------------------------------------------------
void TypeChecker::checkDuplicateTables(const vector<const TableScan*>& tables, Errors& errors) const
// Check table names for duplicates
{
   set<TablePair> reported;

   // Correlation names must be unique
   vector<const TableScan*> aliased;
   for (auto t : tables)
      if (t->alias) aliased.push_back(t);
   reportDuplicates<string>(aliased, [](const TableScan& t) { return *t.alias; }, reported, errors);

   // The same binding twice is an error, too. A pair that was already reported as alias duplicate is not repeated
   reportDuplicates<pair<string, optional<string>>>(tables, [](const TableScan& t) { return pair(t.name, t.alias); }, reported, errors);
}
//---------------------------------------------------------------------------
void TypeChecker::checkColumnAccesses(const vector<string>& tableNames, const vector<const Expression*>& expressions, Errors& errors) const
// Check that all column accesses t.c refer to exactly one of the given table names
{
   unordered_map<string, unsigned> nameCount;
   for (auto& n : tableNames)
      ++nameCount[n];

   // Every distinct access is checked once
   vector<const algebra::ColumnAccess*> accesses;
   for (auto e : expressions)
      collectColumnAccesses(*e, accesses);
   set<pair<string, string>> seen;
   for (auto a : accesses) {
      if (!seen.emplace(a->table, a->column).second) continue;
      auto iter = nameCount.find(a->table);
      if (iter == nameCount.end())
         errors.push_back(AnalysisError::UnknownCorrelationName{a->getQualifiedName(), a->getPosition()});
      else if (iter->second > 1)
         errors.push_back(AnalysisError::AmbiguousColumnAccess{a->getQualifiedName(), a->getPosition()});
   }
}
//---------------------------------------------------------------------------
void TypeChecker::checkRelAlg(const Operator& root, Errors& errors) const
// Check a relational algebra tree
{
   checkOperator(root, errors);

   vector<const TableScan*> tables;
   collectTables(root, tables);
   checkDuplicateTables(tables, errors);

   // An aliased table can only be referenced by its alias
   vector<string> tableNames;
   for (auto t : tables)
      tableNames.push_back(t->getCorrelationName());
   vector<const Expression*> expressions;
   collectExpressions(root, expressions);
   checkColumnAccesses(tableNames, expressions, errors);
}
//---------------------------------------------------------------------------
void TypeChecker::checkQuery(const algebra::Query& query, Errors& errors) const
// Check a query with its local queries
{
   for (auto& l : query.locals) {
      if (!l.tree) invalidAST();
      checkRelAlg(*l.tree, errors);
   }
   if (!query.main) invalidAST();
   checkRelAlg(*query.main, errors);
}
//---------------------------------------------------------------------------
}
//---------------------------------------------------------------------------
