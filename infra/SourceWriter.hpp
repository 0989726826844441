#ifndef H_aqsema_SourceWriter
#define H_aqsema_SourceWriter
//---------------------------------------------------------------------------
#include <string>
#include <string_view>
//---------------------------------------------------------------------------
// AQSema
// (c) 2023 Thomas Neumann
// SPDX-License-Identifier: BSD-3-Clause
//---------------------------------------------------------------------------
namespace aqsema {
//---------------------------------------------------------------------------
/// Helper class to render query fragments for diagnostics
class SourceWriter {
   private:
   /// The result buffer
   std::string result;

   public:
   /// Constructor
   SourceWriter();
   /// Destructor
   ~SourceWriter();

   /// Write a query fragment
   void write(std::string_view text);
   /// Write a qualified name
   void writeQualified(std::string_view qualifier, std::string_view name);
   /// Write a string literal
   void writeString(std::string_view str);

   /// Get the result
   std::string getResult() const { return result; }
};
//---------------------------------------------------------------------------
}
//---------------------------------------------------------------------------
#endif
