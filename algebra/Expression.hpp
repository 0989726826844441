#ifndef H_aqsema_Expression
#define H_aqsema_Expression
//---------------------------------------------------------------------------
#include "infra/Position.hpp"
#include <cassert>
#include <cstdint>
#include <memory>
#include <string>
#include <utility>
#include <vector>
//---------------------------------------------------------------------------
// AQSema
// (c) 2023 Thomas Neumann
// SPDX-License-Identifier: BSD-3-Clause
//---------------------------------------------------------------------------
namespace aqsema {
//---------------------------------------------------------------------------
class SourceWriter;
//---------------------------------------------------------------------------
namespace algebra {
//---------------------------------------------------------------------------
/// Base class for expressions
class Expression {
   public:
   /// The kind of expression. Closed, every check switches over it
   enum class Kind : uint8_t {
      Literal,
      Identifier,
      RowId,
      Wildcard,
      ColumnAccess,
      Unary,
      Binary,
      Call,
      ArrayIndex,
      Case,
      Each
   };

   private:
   /// The kind
   Kind kind;
   /// The position in the query text
   Position pos;

   public:
   /// Constructor
   Expression(Kind kind, Position pos) : kind(kind), pos(pos) {}
   /// Destructor
   virtual ~Expression();

   /// Get the kind
   Kind getKind() const { return kind; }
   /// Get the position
   Position getPosition() const { return pos; }

   /// Access as a specific expression class
   template <class T>
   const T& as() const {
      assert(kind == T::tag);
      return static_cast<const T&>(*this);
   }

   /// Get the direct sub-expressions in query order
   virtual std::vector<const Expression*> getChildren() const;

   /// Render as query text
   virtual void generate(SourceWriter& out) const = 0;
   /// Render in a form that is suitable as operand
   virtual void generateOperand(SourceWriter& out) const;
   /// Render into a string
   std::string toString() const;
};
//---------------------------------------------------------------------------
/// A constant value
class Literal : public Expression {
   public:
   static constexpr Kind tag = Kind::Literal;

   /// Literal types
   enum class SubType : uint8_t {
      Integer,
      Float,
      String,
      Date,
      Timestamp,
      Boolean
   };

   /// The literal type
   SubType subType;
   /// The raw value as written
   std::string value;

   public:
   /// Constructor
   Literal(Position pos, SubType subType, std::string value) : Expression(tag, pos), subType(subType), value(std::move(value)) {}

   /// Render as query text
   void generate(SourceWriter& out) const override;
   /// Render in a form that is suitable as operand
   void generateOperand(SourceWriter& out) const override { generate(out); }
};
//---------------------------------------------------------------------------
/// A plain name
class Identifier : public Expression {
   public:
   static constexpr Kind tag = Kind::Identifier;

   /// The name
   std::string name;

   public:
   /// Constructor
   Identifier(Position pos, std::string name) : Expression(tag, pos), name(std::move(name)) {}

   /// Render as query text
   void generate(SourceWriter& out) const override;
   /// Render in a form that is suitable as operand
   void generateOperand(SourceWriter& out) const override { generate(out); }
};
//---------------------------------------------------------------------------
/// The row id pseudo column
class RowId : public Expression {
   public:
   static constexpr Kind tag = Kind::RowId;

   /// Constructor
   explicit RowId(Position pos) : Expression(tag, pos) {}

   /// Render as query text
   void generate(SourceWriter& out) const override;
   /// Render in a form that is suitable as operand
   void generateOperand(SourceWriter& out) const override { generate(out); }
};
//---------------------------------------------------------------------------
/// All columns
class Wildcard : public Expression {
   public:
   static constexpr Kind tag = Kind::Wildcard;

   /// Constructor
   explicit Wildcard(Position pos) : Expression(tag, pos) {}

   /// Render as query text
   void generate(SourceWriter& out) const override;
   /// Render in a form that is suitable as operand
   void generateOperand(SourceWriter& out) const override { generate(out); }
};
//---------------------------------------------------------------------------
/// A qualified column access t.c
class ColumnAccess : public Expression {
   public:
   static constexpr Kind tag = Kind::ColumnAccess;

   /// The table (or correlation) name
   std::string table;
   /// The column name
   std::string column;

   public:
   /// Constructor
   ColumnAccess(Position pos, std::string table, std::string column) : Expression(tag, pos), table(std::move(table)), column(std::move(column)) {}

   /// Get the name as written
   std::string getQualifiedName() const { return table + "." + column; }

   /// Render as query text
   void generate(SourceWriter& out) const override;
   /// Render in a form that is suitable as operand
   void generateOperand(SourceWriter& out) const override { generate(out); }
};
//---------------------------------------------------------------------------
/// An unary expression
class UnaryExpression : public Expression {
   public:
   static constexpr Kind tag = Kind::Unary;

   /// Possible operations
   enum Operation {
      Not,
      Negate
   };
   /// The input
   std::unique_ptr<Expression> input;
   /// The operation
   Operation op;

   public:
   /// Constructor
   UnaryExpression(Position pos, std::unique_ptr<Expression> input, Operation op);

   /// Get the direct sub-expressions
   std::vector<const Expression*> getChildren() const override;
   /// Render as query text
   void generate(SourceWriter& out) const override;
};
//---------------------------------------------------------------------------
/// A binary expression
class BinaryExpression : public Expression {
   public:
   static constexpr Kind tag = Kind::Binary;

   /// Possible operations
   enum Operation {
      And,
      Or,
      Less,
      LessOrEqual,
      Greater,
      GreaterOrEqual,
      Equal,
      NotEqual,
      Plus,
      Minus,
      Mul,
      Div,
      Power
   };
   /// The input
   std::unique_ptr<Expression> left, right;
   /// The operation
   Operation op;

   public:
   /// Constructor
   BinaryExpression(Position pos, std::unique_ptr<Expression> left, std::unique_ptr<Expression> right, Operation op);

   /// Get the operator as written
   static const char* getOperatorName(Operation op);

   /// Get the direct sub-expressions
   std::vector<const Expression*> getChildren() const override;
   /// Render as query text
   void generate(SourceWriter& out) const override;
};
//---------------------------------------------------------------------------
/// A function call
class CallExpression : public Expression {
   public:
   static constexpr Kind tag = Kind::Call;

   /// The function name
   std::string name;
   /// The arguments
   std::vector<std::unique_ptr<Expression>> arguments;

   public:
   /// Constructor
   CallExpression(Position pos, std::string name, std::vector<std::unique_ptr<Expression>> arguments);

   /// Get the direct sub-expressions
   std::vector<const Expression*> getChildren() const override;
   /// Render as query text
   void generate(SourceWriter& out) const override;
   /// Render in a form that is suitable as operand
   void generateOperand(SourceWriter& out) const override { generate(out); }
};
//---------------------------------------------------------------------------
/// An array index a[i]
class ArrayIndex : public Expression {
   public:
   static constexpr Kind tag = Kind::ArrayIndex;

   /// The indexed value
   std::unique_ptr<Expression> array;
   /// The index
   std::unique_ptr<Expression> index;

   public:
   /// Constructor
   ArrayIndex(Position pos, std::unique_ptr<Expression> array, std::unique_ptr<Expression> index);

   /// Get the direct sub-expressions
   std::vector<const Expression*> getChildren() const override;
   /// Render as query text
   void generate(SourceWriter& out) const override;
   /// Render in a form that is suitable as operand
   void generateOperand(SourceWriter& out) const override { generate(out); }
};
//---------------------------------------------------------------------------
/// A case expression, either simple (with value) or searched
class CaseExpression : public Expression {
   public:
   static constexpr Kind tag = Kind::Case;

   using Cases = std::vector<std::pair<std::unique_ptr<Expression>, std::unique_ptr<Expression>>>;

   /// The value to search (if any)
   std::unique_ptr<Expression> value;
   /// The cases as condition => result
   Cases cases;
   /// The default result (if any)
   std::unique_ptr<Expression> defaultValue;

   public:
   /// Constructor
   CaseExpression(Position pos, std::unique_ptr<Expression> value, Cases cases, std::unique_ptr<Expression> defaultValue);

   /// Get the direct sub-expressions
   std::vector<const Expression*> getChildren() const override;
   /// Render as query text
   void generate(SourceWriter& out) const override;
};
//---------------------------------------------------------------------------
/// Element-wise application
class EachExpression : public Expression {
   public:
   static constexpr Kind tag = Kind::Each;

   /// The input
   std::unique_ptr<Expression> input;

   public:
   /// Constructor
   EachExpression(Position pos, std::unique_ptr<Expression> input);

   /// Get the direct sub-expressions
   std::vector<const Expression*> getChildren() const override;
   /// Render as query text
   void generate(SourceWriter& out) const override;
   /// Render in a form that is suitable as operand
   void generateOperand(SourceWriter& out) const override { generate(out); }
};
//---------------------------------------------------------------------------
}
}
//---------------------------------------------------------------------------
#endif
