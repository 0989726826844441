#ifndef H_aqsema_Position
#define H_aqsema_Position
//---------------------------------------------------------------------------
#include <string>
//---------------------------------------------------------------------------
// AQSema
// (c) 2023 Thomas Neumann
// SPDX-License-Identifier: BSD-3-Clause
//---------------------------------------------------------------------------
namespace aqsema {
//---------------------------------------------------------------------------
/// A position in the query text. Produced by the parser, only passed through here
struct Position {
   /// The line (1-based, 0 if unknown)
   unsigned line = 0;
   /// The column (1-based, 0 if unknown)
   unsigned column = 0;

   /// Comparison
   bool operator==(const Position& o) const { return (line == o.line) && (column == o.column); }
   /// Comparison
   bool operator!=(const Position& o) const { return !(*this == o); }

   /// Format as line:column
   std::string toString() const { return std::to_string(line) + ":" + std::to_string(column); }
};
//---------------------------------------------------------------------------
}
//---------------------------------------------------------------------------
#endif
