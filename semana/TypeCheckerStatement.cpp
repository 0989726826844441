#include "algebra/Expression.hpp"
#include "algebra/Statement.hpp"
#include "semana/TypeChecker.hpp"
//---------------------------------------------------------------------------
// (c) 2023 Thomas Neumann
//---------------------------------------------------------------------------
using namespace std;
//---------------------------------------------------------------------------
namespace aqsema {
//---------------------------------------------------------------------------
using Statement = algebra::Statement;
//---------------------------------------------------------------------------
namespace {
//---------------------------------------------------------------------------
/// Get the values of a sort specification
static vector<const algebra::Expression*> sortValues(const vector<algebra::Sort::Entry>& order) {
   vector<const algebra::Expression*> result;
   for (auto& o : order)
      result.push_back(o.value.get());
   return result;
}
//---------------------------------------------------------------------------
}
//---------------------------------------------------------------------------
void TypeChecker::checkUpdate(const algebra::Update& update, Errors& errors) const
// Check an update
{
   for (auto& a : update.assignments)
      checkExpression(required(a.value), errors);
   checkSortExpressions(sortValues(update.order), errors);
   for (auto& w : update.where)
      checkType(TypeSet::getBool(), required(w), errors);
   for (auto& g : update.groupBy)
      checkExpression(required(g), errors);
   for (auto& h : update.having)
      checkType(TypeSet::getBool(), required(h), errors);

   // There is only one table, so accesses can be unknown but never ambiguous
   checkColumnAccesses({update.table}, update.getExpressions(), errors);
}
//---------------------------------------------------------------------------
void TypeChecker::checkDelete(const algebra::Delete& del, Errors& errors) const
// Check a delete
{
   if (!del.deletesColumns())
      for (auto& w : del.getWhere())
         checkType(TypeSet::getBool(), required(w), errors);
   checkSortExpressions(sortValues(del.order), errors);
   for (auto& g : del.groupBy)
      checkExpression(required(g), errors);
   for (auto& h : del.having)
      checkType(TypeSet::getBool(), required(h), errors);

   checkColumnAccesses({del.table}, del.getExpressions(), errors);
}
//---------------------------------------------------------------------------
void TypeChecker::checkCreate(const algebra::Create& create, Errors& errors) const
// Check a table creation
{
   // A schema definition cannot contain errors that we could detect
   if (create.isFromQuery()) {
      if (!get<1>(create.content)) invalidAST();
      checkQuery(create.getQuery(), errors);
   }
}
//---------------------------------------------------------------------------
void TypeChecker::checkInsert(const algebra::Insert& insert, Errors& errors) const
// Check an insert. The values are not checked against the column types, these are usually unknown before runtime
{
   if (insert.isFromQuery()) {
      if (!get<1>(insert.source)) invalidAST();
      checkQuery(insert.getQuery(), errors);
      checkSortExpressions(sortValues(insert.order), errors);
   } else {
      for (auto& v : insert.getValues())
         checkExpression(required(v), errors);
      checkSortExpressions(sortValues(insert.order), errors);
      // There is no table in scope
      for (auto& v : insert.getValues())
         checkProhibited(required(v), errors);
   }
}
//---------------------------------------------------------------------------
void TypeChecker::checkFunction(const algebra::FunctionDefinition& function, Errors& errors) const
// Check a user defined function
{
   for (auto& e : function.body) {
      checkExpression(required(e.value), errors);
      checkProhibited(required(e.value), errors);
   }
}
//---------------------------------------------------------------------------
void TypeChecker::checkStatement(const Statement& statement, Errors& errors) const
// Check a top level construct
{
   switch (statement.getKind()) {
      case Statement::Kind::Query: checkQuery(statement.as<algebra::Query>(), errors); break;
      case Statement::Kind::Update: checkUpdate(statement.as<algebra::Update>(), errors); break;
      case Statement::Kind::Delete: checkDelete(statement.as<algebra::Delete>(), errors); break;
      case Statement::Kind::Create: checkCreate(statement.as<algebra::Create>(), errors); break;
      case Statement::Kind::Insert: checkInsert(statement.as<algebra::Insert>(), errors); break;
      case Statement::Kind::Function: checkFunction(statement.as<algebra::FunctionDefinition>(), errors); break;
      case Statement::Kind::Verbatim: break; // opaque, never inspected
   }
}
//---------------------------------------------------------------------------
TypeChecker::Errors TypeChecker::checkProgram(const algebra::Program& program) const
// Check a program
{
   Errors errors;
   for (auto& s : program.statements) {
      if (!s) invalidAST();
      checkStatement(*s, errors);
   }
   return errors;
}
//---------------------------------------------------------------------------
TypeChecker::Errors TypeChecker::analyze(const algebra::Program& program)
// Analyze a program
{
   auto functions = Functions::forProgram(program);
   return TypeChecker(functions).checkProgram(program);
}
//---------------------------------------------------------------------------
}
//---------------------------------------------------------------------------
