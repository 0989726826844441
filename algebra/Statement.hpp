#ifndef H_aqsema_Statement
#define H_aqsema_Statement
//---------------------------------------------------------------------------
#include "algebra/Expression.hpp"
#include "algebra/Operator.hpp"
#include <memory>
#include <optional>
#include <string>
#include <variant>
#include <vector>
//---------------------------------------------------------------------------
// AQSema
// (c) 2023 Thomas Neumann
// SPDX-License-Identifier: BSD-3-Clause
//---------------------------------------------------------------------------
namespace aqsema {
//---------------------------------------------------------------------------
namespace algebra {
//---------------------------------------------------------------------------
/// Base class for top level constructs
class Statement {
   public:
   /// The kind of statement
   enum class Kind : uint8_t {
      Query,
      Update,
      Delete,
      Create,
      Insert,
      Function,
      Verbatim
   };

   private:
   /// The kind
   Kind kind;

   public:
   /// Constructor
   explicit Statement(Kind kind) : kind(kind) {}
   /// Destructor
   virtual ~Statement();

   /// Get the kind
   Kind getKind() const { return kind; }

   /// Access as a specific statement class
   template <class T>
   const T& as() const {
      assert(kind == T::tag);
      return static_cast<const T&>(*this);
   }
};
//---------------------------------------------------------------------------
/// A query, optionally with local queries that are computed first
class Query : public Statement {
   public:
   static constexpr Kind tag = Kind::Query;

   /// A named local query
   struct LocalQuery {
      /// The name
      std::string name;
      /// The column names (if given)
      std::vector<std::string> columns;
      /// The query tree
      std::unique_ptr<Operator> tree;
   };

   /// The local queries
   std::vector<LocalQuery> locals;
   /// The main query
   std::unique_ptr<Operator> main;

   public:
   /// Constructor
   Query(std::vector<LocalQuery> locals, std::unique_ptr<Operator> main);
};
//---------------------------------------------------------------------------
/// An update statement
class Update : public Statement {
   public:
   static constexpr Kind tag = Kind::Update;

   /// A column assignment
   struct Assignment {
      /// The column
      std::string column;
      /// The new value
      std::unique_ptr<Expression> value;
   };

   /// The target table
   std::string table;
   /// The assignments
   std::vector<Assignment> assignments;
   /// The order in which the rows are processed
   std::vector<Sort::Entry> order;
   /// The where conditions
   std::vector<std::unique_ptr<Expression>> where;
   /// The group by expressions
   std::vector<std::unique_ptr<Expression>> groupBy;
   /// The having conditions
   std::vector<std::unique_ptr<Expression>> having;

   public:
   /// Constructor
   Update(std::string table, std::vector<Assignment> assignments, std::vector<Sort::Entry> order, std::vector<std::unique_ptr<Expression>> where, std::vector<std::unique_ptr<Expression>> groupBy, std::vector<std::unique_ptr<Expression>> having);

   /// Get all expressions
   std::vector<const Expression*> getExpressions() const;
};
//---------------------------------------------------------------------------
/// A delete statement. Removes either columns or the rows matching a predicate
class Delete : public Statement {
   public:
   static constexpr Kind tag = Kind::Delete;

   using Columns = std::vector<std::string>;
   using Conditions = std::vector<std::unique_ptr<Expression>>;

   /// The target table
   std::string table;
   /// What to delete
   std::variant<Columns, Conditions> target;
   /// The order in which the rows are processed
   std::vector<Sort::Entry> order;
   /// The group by expressions
   std::vector<std::unique_ptr<Expression>> groupBy;
   /// The having conditions
   std::vector<std::unique_ptr<Expression>> having;

   public:
   /// Constructor
   Delete(std::string table, std::variant<Columns, Conditions> target, std::vector<Sort::Entry> order, std::vector<std::unique_ptr<Expression>> groupBy, std::vector<std::unique_ptr<Expression>> having);

   /// Do we delete columns?
   bool deletesColumns() const { return target.index() == 0; }
   /// Access the deleted columns
   const Columns& getColumns() const { return std::get<0>(target); }
   /// Access the where conditions
   const Conditions& getWhere() const { return std::get<1>(target); }

   /// Get all expressions
   std::vector<const Expression*> getExpressions() const;
};
//---------------------------------------------------------------------------
/// A table creation, either from a schema or from a query
class Create : public Statement {
   public:
   static constexpr Kind tag = Kind::Create;

   /// A column definition
   struct ColumnDefinition {
      /// The name
      std::string name;
      /// The type name as written
      std::string type;
   };
   using Schema = std::vector<ColumnDefinition>;

   /// The table name
   std::string name;
   /// The content
   std::variant<Schema, std::unique_ptr<Query>> content;

   public:
   /// Constructor
   Create(std::string name, std::variant<Schema, std::unique_ptr<Query>> content);

   /// Is created from a query?
   bool isFromQuery() const { return content.index() == 1; }
   /// Access the query
   const Query& getQuery() const { return *std::get<1>(content); }
};
//---------------------------------------------------------------------------
/// An insertion of values or of a query result
class Insert : public Statement {
   public:
   static constexpr Kind tag = Kind::Insert;

   using Values = std::vector<std::unique_ptr<Expression>>;

   /// The target table
   std::string table;
   /// The order of the inserted rows
   std::vector<Sort::Entry> order;
   /// The target columns (if given)
   std::vector<std::string> columns;
   /// The source
   std::variant<Values, std::unique_ptr<Query>> source;

   public:
   /// Constructor
   Insert(std::string table, std::vector<Sort::Entry> order, std::vector<std::string> columns, std::variant<Values, std::unique_ptr<Query>> source);

   /// Is inserted from a query?
   bool isFromQuery() const { return source.index() == 1; }
   /// Access the values
   const Values& getValues() const { return std::get<0>(source); }
   /// Access the query
   const Query& getQuery() const { return *std::get<1>(source); }
};
//---------------------------------------------------------------------------
/// A user defined function
class FunctionDefinition : public Statement {
   public:
   static constexpr Kind tag = Kind::Function;

   /// An entry of the body, either an expression or an assignment
   struct BodyEntry {
      /// The assigned variable (if any)
      std::optional<std::string> target;
      /// The value
      std::unique_ptr<Expression> value;
   };

   /// The name
   std::string name;
   /// The parameter names
   std::vector<std::string> parameters;
   /// The body
   std::vector<BodyEntry> body;

   public:
   /// Constructor
   FunctionDefinition(std::string name, std::vector<std::string> parameters, std::vector<BodyEntry> body);
};
//---------------------------------------------------------------------------
/// Code that is passed through unchanged
class Verbatim : public Statement {
   public:
   static constexpr Kind tag = Kind::Verbatim;

   /// The code
   std::string code;

   public:
   /// Constructor
   explicit Verbatim(std::string code);
};
//---------------------------------------------------------------------------
/// A whole program
struct Program {
   /// The top level constructs in program order
   std::vector<std::unique_ptr<Statement>> statements;
};
//---------------------------------------------------------------------------
}
}
//---------------------------------------------------------------------------
#endif
