#include "infra/SourceWriter.hpp"
//---------------------------------------------------------------------------
// (c) 2023 Thomas Neumann
//---------------------------------------------------------------------------
using namespace std;
//---------------------------------------------------------------------------
namespace aqsema {
//---------------------------------------------------------------------------
SourceWriter::SourceWriter()
// Constructor
{
}
//---------------------------------------------------------------------------
SourceWriter::~SourceWriter()
// Destructor
{
}
//---------------------------------------------------------------------------
void SourceWriter::write(std::string_view text)
// Write a query fragment
{
   result += text;
}
//---------------------------------------------------------------------------
void SourceWriter::writeQualified(std::string_view qualifier, std::string_view name)
// Write a qualified name
{
   result += qualifier;
   result += '.';
   result += name;
}
//---------------------------------------------------------------------------
void SourceWriter::writeString(std::string_view str)
// Write a string literal
{
   result += '"';
   for (char c : str) {
      if ((c == '"') || (c == '\\')) result += '\\';
      result += c;
   }
   result += '"';
}
//---------------------------------------------------------------------------
}
//---------------------------------------------------------------------------
