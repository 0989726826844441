#ifndef H_aqsema_Operator
#define H_aqsema_Operator
//---------------------------------------------------------------------------
#include "algebra/Expression.hpp"
#include "infra/Position.hpp"
#include <memory>
#include <optional>
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
//---------------------------------------------------------------------------
/// Base class for operators
class Operator {
   public:
   /// The kind of operator. Closed, every check switches over it
   enum class Kind : uint8_t {
      TableScan,
      Project,
      Filter,
      GroupBy,
      Join,
      Sort
   };

   private:
   /// The kind
   Kind kind;

   public:
   /// Constructor
   explicit Operator(Kind kind) : kind(kind) {}
   /// Destructor
   virtual ~Operator();

   /// Get the kind
   Kind getKind() const { return kind; }

   /// Access as a specific operator class
   template <class T>
   const T& as() const {
      assert(kind == T::tag);
      return static_cast<const T&>(*this);
   }

   /// Get all expressions carried by the operator
   virtual std::vector<const Expression*> getExpressions() const = 0;
   /// Get the input operators
   virtual std::vector<const Operator*> getInputs() const = 0;
};
//---------------------------------------------------------------------------
/// A table scan operator
class TableScan : public Operator {
   public:
   static constexpr Kind tag = Kind::TableScan;

   /// The table name
   std::string name;
   /// The correlation name (if any)
   std::optional<std::string> alias;
   /// The position in the query text
   Position pos;

   public:
   /// Constructor
   TableScan(Position pos, std::string name, std::optional<std::string> alias = {});

   /// Get the name under which the columns can be accessed
   const std::string& getCorrelationName() const { return alias ? *alias : name; }
   /// Get the full description, i.e., name or name as alias
   std::string getFullName() const;

   /// Get all expressions
   std::vector<const Expression*> getExpressions() const override;
   /// Get the inputs
   std::vector<const Operator*> getInputs() const override;
};
//---------------------------------------------------------------------------
/// A projection
class Project : public Operator {
   public:
   static constexpr Kind tag = Kind::Project;

   /// The input
   std::unique_ptr<Operator> input;
   /// The result expressions
   std::vector<std::unique_ptr<Expression>> expressions;

   public:
   /// Constructor
   Project(std::unique_ptr<Operator> input, std::vector<std::unique_ptr<Expression>> expressions);

   /// Get all expressions
   std::vector<const Expression*> getExpressions() const override;
   /// Get the inputs
   std::vector<const Operator*> getInputs() const override;
};
//---------------------------------------------------------------------------
/// A filter operator
class Filter : public Operator {
   public:
   static constexpr Kind tag = Kind::Filter;

   /// The input
   std::unique_ptr<Operator> input;
   /// The filter conditions (conjunctive)
   std::vector<std::unique_ptr<Expression>> conditions;

   public:
   /// Constructor
   Filter(std::unique_ptr<Operator> input, std::vector<std::unique_ptr<Expression>> conditions);

   /// Get all expressions
   std::vector<const Expression*> getExpressions() const override;
   /// Get the inputs
   std::vector<const Operator*> getInputs() const override;
};
//---------------------------------------------------------------------------
/// A group by operator
class GroupBy : public Operator {
   public:
   static constexpr Kind tag = Kind::GroupBy;

   /// The input
   std::unique_ptr<Operator> input;
   /// The group by expressions
   std::vector<std::unique_ptr<Expression>> groupBy;
   /// The having conditions (conjunctive)
   std::vector<std::unique_ptr<Expression>> having;

   public:
   /// Constructor
   GroupBy(std::unique_ptr<Operator> input, std::vector<std::unique_ptr<Expression>> groupBy, std::vector<std::unique_ptr<Expression>> having);

   /// Get all expressions
   std::vector<const Expression*> getExpressions() const override;
   /// Get the inputs
   std::vector<const Operator*> getInputs() const override;
};
//---------------------------------------------------------------------------
/// A join operator
class Join : public Operator {
   public:
   static constexpr Kind tag = Kind::Join;

   /// Join types
   enum class JoinType {
      Cross,
      Inner,
      LeftOuter,
      FullOuter
   };

   /// The input
   std::unique_ptr<Operator> left, right;
   /// The join conditions (conjunctive)
   std::vector<std::unique_ptr<Expression>> conditions;
   /// The join type
   JoinType joinType;

   public:
   /// Constructor
   Join(std::unique_ptr<Operator> left, std::unique_ptr<Operator> right, std::vector<std::unique_ptr<Expression>> conditions, JoinType joinType);

   /// Get all expressions
   std::vector<const Expression*> getExpressions() const override;
   /// Get the inputs
   std::vector<const Operator*> getInputs() const override;
};
//---------------------------------------------------------------------------
/// A sort operator
class Sort : public Operator {
   public:
   static constexpr Kind tag = Kind::Sort;

   struct Entry {
      /// The value to order by
      std::unique_ptr<Expression> value;
      /// Descending?
      bool descending;
   };

   /// The input
   std::unique_ptr<Operator> input;
   /// The order
   std::vector<Entry> order;

   public:
   /// Constructor
   Sort(std::unique_ptr<Operator> input, std::vector<Entry> order);

   /// Get all expressions
   std::vector<const Expression*> getExpressions() const override;
   /// Get the inputs
   std::vector<const Operator*> getInputs() const override;
};
//---------------------------------------------------------------------------
}
}
//---------------------------------------------------------------------------
#endif
