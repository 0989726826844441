#include "semana/Functions.hpp"
#include "algebra/Statement.hpp"
//---------------------------------------------------------------------------
// (c) 2023 Thomas Neumann
//---------------------------------------------------------------------------
using namespace std;
//---------------------------------------------------------------------------
namespace aqsema {
//---------------------------------------------------------------------------
namespace {
//---------------------------------------------------------------------------
using Signature = Functions::Signature;
//---------------------------------------------------------------------------
constexpr TypeSet num = TypeSet::getNumeric();
constexpr TypeSet numAndBool = TypeSet::getNumericOrBool();
constexpr TypeSet anyValue = TypeSet::getAny();
constexpr TypeSet str = TypeSet::exactly(Type::getString());
//---------------------------------------------------------------------------
/// A function that maps a numeric vector to a numeric result
static Signature numericFunction() { return Signature::builtin({{{num}, Type::getNumeric()}}); }
/// An aggregate that also accepts booleans
static Signature numericAggregate() { return Signature::builtin({{{numAndBool}, Type::getNumeric()}}); }
/// A running aggregate with optional window size
static Signature runningAggregate(TypeSet values) { return Signature::builtin({{{values}, Type::getNumeric()}, {{num, values}, Type::getNumeric()}}); }
/// A function that accepts any single value, with unknown result
static Signature anyFunction() { return Signature::builtin({{{anyValue}, Type::getUnknown()}}); }
/// A function that takes a count and any value, with unknown result
static Signature countedFunction() { return Signature::builtin({{{num, anyValue}, Type::getUnknown()}}); }
//---------------------------------------------------------------------------
}
//---------------------------------------------------------------------------
/// The builtin functions
const Functions Functions::builtins(nullptr,
                                    {
                                       // list of functions
                                       {"abs", numericFunction()}, // absolute value
                                       {"sqrt", numericFunction()}, // square root
                                       {"exp", numericFunction()}, // exponential
                                       {"log", numericFunction()}, // natural logarithm
                                       {"deltas", numericFunction()}, // differences of neighbors
                                       {"ratios", numericFunction()}, // ratios of neighbors
                                       {"prd", numericFunction()}, // product
                                       {"prds", numericFunction()}, // running product
                                       {"stddev", numericFunction()}, // standard deviation
                                       {"vars", numericFunction()}, // variance
                                       {"max", numericFunction()}, // maximum
                                       {"min", numericFunction()}, // minimum
                                       {"sum", numericAggregate()}, // sum, counts booleans
                                       {"avg", numericAggregate()}, // average, counts booleans
                                       {"sums", runningAggregate(numAndBool)}, // running sum
                                       {"avgs", runningAggregate(numAndBool)}, // running average
                                       {"maxs", runningAggregate(num)}, // running maximum
                                       {"mins", runningAggregate(num)}, // running minimum
                                       {"mod", Signature::builtin({{{num, num}, Type::getNumeric()}})}, // modulo
                                       {"count", Signature::builtin({{{anyValue}, Type::getNumeric()}})}, // number of values
                                       {"first", countedFunction()}, // first n values
                                       {"last", countedFunction()}, // last n values
                                       {"drop", countedFunction()}, // drop n values
                                       {"distinct", anyFunction()}, // remove duplicates
                                       {"fills", anyFunction()}, // fill nulls with previous value
                                       {"next", anyFunction()}, // shift up
                                       {"prev", anyFunction()}, // shift down
                                       {"reverse", anyFunction()}, // reverse order
                                       {"show", anyFunction()}, // print a value
                                       {"between", Signature::builtin({{{num, num, num}, Type::getBool()}})}, // range check
                                       {"like", Signature::builtin({{{str, str}, Type::getBool()}})} // pattern match
                                    });
//---------------------------------------------------------------------------
optional<Type> Functions::Signature::match(const vector<Type>& argumentTypes) const
// Find the result type for the given argument types
{
   if (isUserDefined()) {
      if (argumentTypes.size() == getArity()) return Type::getUnknown();
      return {};
   }
   for (auto& o : getOverloads()) {
      if (o.arguments.size() != argumentTypes.size()) continue;
      bool ok = true;
      for (size_t index = 0; index != argumentTypes.size(); ++index)
         if (!o.arguments[index].matches(argumentTypes[index])) {
            ok = false;
            break;
         }
      if (ok) return o.result;
   }
   return {};
}
//---------------------------------------------------------------------------
Functions::Functions(const Functions* parent)
   : parent(parent)
// Constructor
{
}
//---------------------------------------------------------------------------
Functions::Functions(const Functions* parent, std::initializer_list<std::pair<const std::string, Signature>> signatures)
   : parent(parent), functions(signatures.begin(), signatures.end())
// Constructor
{
}
//---------------------------------------------------------------------------
Functions::~Functions()
// Destructor
{
}
//---------------------------------------------------------------------------
const Functions::Signature* Functions::lookup(const std::string& name) const
// Find a function
{
   for (auto iter = this; iter; iter = iter->parent) {
      auto iter2 = iter->functions.find(name);
      if (iter2 != iter->functions.end()) return &(iter2->second);
   }
   return nullptr;
}
//---------------------------------------------------------------------------
void Functions::registerFunction(const std::string& name, Signature signature)
// Register a function
{
   functions.insert_or_assign(name, move(signature));
}
//---------------------------------------------------------------------------
Functions Functions::forProgram(const algebra::Program& program, const Functions* parent)
// Build the environment for a program
{
   Functions result(parent);
   for (auto& s : program.statements)
      if (s && (s->getKind() == algebra::Statement::Kind::Function)) {
         auto& f = s->as<algebra::FunctionDefinition>();
         result.registerFunction(f.name, Signature::userDefined(f.parameters.size()));
      }
   return result;
}
//---------------------------------------------------------------------------
}
//---------------------------------------------------------------------------
