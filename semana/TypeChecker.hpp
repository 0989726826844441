#ifndef H_aqsema_TypeChecker
#define H_aqsema_TypeChecker
//---------------------------------------------------------------------------
#include "infra/Type.hpp"
#include "semana/AnalysisError.hpp"
#include "semana/Functions.hpp"
#include <memory>
#include <string>
#include <vector>
//---------------------------------------------------------------------------
// AQSema
// (c) 2023 Thomas Neumann
// SPDX-License-Identifier: BSD-3-Clause
//---------------------------------------------------------------------------
namespace aqsema {
//---------------------------------------------------------------------------
namespace algebra {
class BinaryExpression;
class CallExpression;
class CaseExpression;
class Create;
class Delete;
class Expression;
class FunctionDefinition;
class Insert;
class Literal;
class Operator;
class Query;
class Statement;
class TableScan;
class UnaryExpression;
class Update;
struct Program;
}
//---------------------------------------------------------------------------
/// Soft type check for queries. Most types are only known at runtime, so only errors that are certain are reported
class TypeChecker {
   public:
   /// The collected errors
   using Errors = std::vector<AnalysisError>;

   private:
   /// The functions
   const Functions& functions;

   /// Invalid AST node
   [[noreturn]] static void invalidAST();
   /// Access a required child node
   template <class T>
   static const T& required(const T* child) {
      if (!child) invalidAST();
      return *child;
   }
   /// Access a required child node
   template <class T>
   static const T& required(const std::unique_ptr<T>& child) { return required(child.get()); }

   /// Check a literal
   Type checkLiteral(const algebra::Literal& literal) const;
   /// Check a binary expression
   Type checkBinaryExpression(const algebra::BinaryExpression& exp, Errors& errors) const;
   /// Check an unary expression
   Type checkUnaryExpression(const algebra::UnaryExpression& exp, Errors& errors) const;
   /// Check a function call
   Type checkCall(const algebra::CallExpression& exp, Errors& errors) const;
   /// Check a case expression
   Type checkCase(const algebra::CaseExpression& exp, Errors& errors) const;

   /// Check the expressions of an operator and its inputs
   void checkOperator(const algebra::Operator& op, Errors& errors) const;
   /// Check that sort keys are simple column references
   void checkSortExpressions(const std::vector<const algebra::Expression*>& order, Errors& errors) const;
   /// Check table names for duplicates
   void checkDuplicateTables(const std::vector<const algebra::TableScan*>& tables, Errors& errors) const;
   /// Check that all column accesses t.c refer to exactly one of the given table names
   void checkColumnAccesses(const std::vector<std::string>& tableNames, const std::vector<const algebra::Expression*>& expressions, Errors& errors) const;

   /// Check an update
   void checkUpdate(const algebra::Update& update, Errors& errors) const;
   /// Check a delete
   void checkDelete(const algebra::Delete& del, Errors& errors) const;
   /// Check a table creation
   void checkCreate(const algebra::Create& create, Errors& errors) const;
   /// Check an insert
   void checkInsert(const algebra::Insert& insert, Errors& errors) const;
   /// Check a user defined function
   void checkFunction(const algebra::FunctionDefinition& function, Errors& errors) const;

   public:
   /// Constructor
   explicit TypeChecker(const Functions& functions) : functions(functions) {}

   /// Check an expression, returns its type. The type is unknown if it cannot be derived
   Type checkExpression(const algebra::Expression& exp, Errors& errors) const;
   /// Check that an expression has one of the expected types
   void checkType(TypeSet expected, const algebra::Expression& exp, Errors& errors) const;
   /// Check that an expression does not use constructs that are only valid in queries
   void checkProhibited(const algebra::Expression& exp, Errors& errors) const;

   /// Check a relational algebra tree, including table and column scoping
   void checkRelAlg(const algebra::Operator& root, Errors& errors) const;
   /// Check a query with its local queries
   void checkQuery(const algebra::Query& query, Errors& errors) const;
   /// Check a top level construct
   void checkStatement(const algebra::Statement& statement, Errors& errors) const;
   /// Check a program
   Errors checkProgram(const algebra::Program& program) const;

   /// Analyze a program. Registers its user defined functions on top of the builtins first
   static Errors analyze(const algebra::Program& program);
};
//---------------------------------------------------------------------------
}
//---------------------------------------------------------------------------
#endif
