#include "infra/Type.hpp"
//---------------------------------------------------------------------------
// (c) 2023 Thomas Neumann
//---------------------------------------------------------------------------
using namespace std;
//---------------------------------------------------------------------------
namespace aqsema {
//---------------------------------------------------------------------------
string Type::getName() const
// Get the name (for error reporting)
{
   switch (tag) {
      case Unit: return "unit";
      case Numeric: return "numeric";
      case Boolean: return "boolean";
      case String: return "string";
      case Unknown: return "unknown";
   }
   __builtin_unreachable();
}
//---------------------------------------------------------------------------
}
//---------------------------------------------------------------------------
