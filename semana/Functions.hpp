#ifndef H_aqsema_Functions
#define H_aqsema_Functions
//---------------------------------------------------------------------------
#include "infra/Type.hpp"
#include <initializer_list>
#include <optional>
#include <string>
#include <unordered_map>
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
namespace algebra {
struct Program;
}
//---------------------------------------------------------------------------
/// A collection of functions
class Functions {
   public:
   /// An overload of a builtin function
   struct Overload {
      /// The accepted types per argument
      std::vector<TypeSet> arguments;
      /// The result type
      Type result;
   };
   /// A signature
   class Signature {
      /// The overloads of a builtin, or the arity of a user defined function
      std::variant<std::vector<Overload>, unsigned> content;

      /// Constructor
      explicit Signature(std::variant<std::vector<Overload>, unsigned> content) : content(std::move(content)) {}

      public:
      /// A builtin function. The overloads are tried in order
      static Signature builtin(std::vector<Overload> overloads) { return Signature(std::move(overloads)); }
      /// A user defined function. Only the argument count is checked, the result is unknown
      static Signature userDefined(unsigned arity) { return Signature(arity); }

      /// Is a builtin?
      bool isBuiltin() const { return content.index() == 0; }
      /// Is user defined?
      bool isUserDefined() const { return content.index() == 1; }
      /// Get the overloads of a builtin
      const std::vector<Overload>& getOverloads() const { return std::get<0>(content); }
      /// Get the arity of a user defined function
      unsigned getArity() const { return std::get<1>(content); }

      /// Find the result type for the given argument types. Empty if the call is not supported
      std::optional<Type> match(const std::vector<Type>& argumentTypes) const;
   };

   private:
   /// The parent set (if any)
   const Functions* parent;
   /// All functions contained here
   std::unordered_map<std::string, Signature> functions;

   public:
   /// Constructor
   explicit Functions(const Functions* parent);
   /// Constructor
   Functions(const Functions* parent, std::initializer_list<std::pair<const std::string, Signature>> signatures);
   /// Move constructor
   Functions(Functions&&) = default;
   /// Destructor
   ~Functions();

   Functions(const Functions&) = delete;
   void operator=(const Functions&) = delete;

   /// Find a function
   const Signature* lookup(const std::string& name) const;
   /// Register a function, replacing an existing entry with the same name
   void registerFunction(const std::string& name, Signature signature);

   /// Build the environment for a program. Registers the arity of all user defined functions
   static Functions forProgram(const algebra::Program& program, const Functions* parent = &builtins);

   /// The builtin functions
   static const Functions builtins;
};
//---------------------------------------------------------------------------
}
//---------------------------------------------------------------------------
#endif
