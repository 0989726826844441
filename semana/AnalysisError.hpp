#ifndef H_aqsema_AnalysisError
#define H_aqsema_AnalysisError
//---------------------------------------------------------------------------
#include "infra/Position.hpp"
#include "infra/Type.hpp"
#include <iosfwd>
#include <string>
#include <utility>
#include <variant>
#include <vector>
//---------------------------------------------------------------------------
// AQSema
// (c) 2023 Thomas Neumann
// SPDX-License-Identifier: BSD-3-Clause
//---------------------------------------------------------------------------
namespace aqsema {
//---------------------------------------------------------------------------
/// An error found during semantic analysis. Errors are values, they are collected and never thrown
class AnalysisError {
   public:
   /// The error kinds. The order matches the variant alternatives
   enum class Kind : uint8_t {
      TypeMismatch,
      BadCall,
      IllegalExpression,
      AmbiguousColumnAccess,
      UnknownCorrelationName,
      DuplicateTableName
   };

   /// Found a type that does not satisfy the expectation
   struct TypeMismatch {
      /// The expected type
      Type expected;
      /// The type found
      Type found;
      /// The position
      Position pos;

      bool operator==(const TypeMismatch& o) const { return (expected == o.expected) && (found == o.found) && (pos == o.pos); }
   };
   /// A function call that no signature accepts
   struct BadCall {
      /// The function name
      std::string function;
      /// The position
      Position pos;

      bool operator==(const BadCall& o) const { return (function == o.function) && (pos == o.pos); }
   };
   /// An expression that is not allowed in its context
   struct IllegalExpression {
      /// The expression as text
      std::string text;
      /// The position
      Position pos;

      bool operator==(const IllegalExpression& o) const { return (text == o.text) && (pos == o.pos); }
   };
   /// A column access t.c where t matches more than one table
   struct AmbiguousColumnAccess {
      /// The qualified name
      std::string name;
      /// The position
      Position pos;

      bool operator==(const AmbiguousColumnAccess& o) const { return (name == o.name) && (pos == o.pos); }
   };
   /// A column access t.c where t matches no table
   struct UnknownCorrelationName {
      /// The qualified name
      std::string name;
      /// The position
      Position pos;

      bool operator==(const UnknownCorrelationName& o) const { return (name == o.name) && (pos == o.pos); }
   };
   /// Two tables that cannot be told apart
   struct DuplicateTableName {
      /// The full names, i.e., name or name as alias
      std::string first, second;
      /// The positions
      Position firstPos, secondPos;

      bool operator==(const DuplicateTableName& o) const { return (first == o.first) && (second == o.second) && (firstPos == o.firstPos) && (secondPos == o.secondPos); }
   };

   private:
   /// The content
   std::variant<TypeMismatch, BadCall, IllegalExpression, AmbiguousColumnAccess, UnknownCorrelationName, DuplicateTableName> content;

   public:
   /// Constructor
   AnalysisError(TypeMismatch e) : content(std::move(e)) {}
   /// Constructor
   AnalysisError(BadCall e) : content(std::move(e)) {}
   /// Constructor
   AnalysisError(IllegalExpression e) : content(std::move(e)) {}
   /// Constructor
   AnalysisError(AmbiguousColumnAccess e) : content(std::move(e)) {}
   /// Constructor
   AnalysisError(UnknownCorrelationName e) : content(std::move(e)) {}
   /// Constructor
   AnalysisError(DuplicateTableName e) : content(std::move(e)) {}

   /// Get the kind
   Kind getKind() const { return static_cast<Kind>(content.index()); }
   /// Get the (first) position
   Position getPosition() const;

   /// Access a type mismatch
   const TypeMismatch& typeMismatch() const { return std::get<TypeMismatch>(content); }
   /// Access a bad call
   const BadCall& badCall() const { return std::get<BadCall>(content); }
   /// Access an illegal expression
   const IllegalExpression& illegalExpression() const { return std::get<IllegalExpression>(content); }
   /// Access an ambiguous column access
   const AmbiguousColumnAccess& ambiguousColumnAccess() const { return std::get<AmbiguousColumnAccess>(content); }
   /// Access an unknown correlation name
   const UnknownCorrelationName& unknownCorrelationName() const { return std::get<UnknownCorrelationName>(content); }
   /// Access a duplicate table name
   const DuplicateTableName& duplicateTableName() const { return std::get<DuplicateTableName>(content); }

   /// Get a human readable message including the position
   std::string getMessage() const;

   /// Comparison
   bool operator==(const AnalysisError& o) const { return content == o.content; }
   /// Comparison
   bool operator!=(const AnalysisError& o) const { return !(content == o.content); }
};
//---------------------------------------------------------------------------
/// Write the message of an error
std::ostream& operator<<(std::ostream& out, const AnalysisError& error);
/// Write all errors, one per line
void printErrors(std::ostream& out, const std::vector<AnalysisError>& errors);
//---------------------------------------------------------------------------
}
//---------------------------------------------------------------------------
#endif
