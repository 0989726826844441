#ifndef H_aqsema_Type
#define H_aqsema_Type
//---------------------------------------------------------------------------
#include <cstdint>
#include <initializer_list>
#include <string>
//---------------------------------------------------------------------------
// AQSema
// (c) 2023 Thomas Neumann
// SPDX-License-Identifier: BSD-3-Clause
//---------------------------------------------------------------------------
namespace aqsema {
//---------------------------------------------------------------------------
/// A type tag as known at translation time
class Type {
   public:
   /// Known types
   enum Tag : uint8_t {
      Unit,
      Numeric,
      Boolean,
      String,
      Unknown
   };

   private:
   /// The type
   Tag tag;

   public:
   /// Constructor
   constexpr Type(Tag tag) : tag(tag) {}

   /// Get the type tag
   constexpr Tag getType() const { return tag; }
   /// Is the type unknown?
   constexpr bool isUnknown() const { return tag == Unknown; }

   /// Get the name (for error reporting)
   std::string getName() const;

   /// Comparison
   constexpr bool operator==(const Type& o) const { return tag == o.tag; }
   /// Comparison
   constexpr bool operator!=(const Type& o) const { return tag != o.tag; }

   /// Create the placeholder type
   static constexpr Type getUnit() { return Type(Unit); }
   /// Create a numeric type. Dates and timestamps are numeric, too
   static constexpr Type getNumeric() { return Type(Numeric); }
   /// Create a boolean type
   static constexpr Type getBool() { return Type(Boolean); }
   /// Create a string type
   static constexpr Type getString() { return Type(String); }
   /// Create an unknown type
   static constexpr Type getUnknown() { return Type(Unknown); }
};
//---------------------------------------------------------------------------
/// A set of acceptable types, used as expectation
class TypeSet {
   /// The members as bit mask
   unsigned mask;
   /// The first member. Reported as expected type in errors
   Type primary;

   /// Constructor
   constexpr TypeSet(unsigned mask, Type primary) : mask(mask), primary(primary) {}

   /// The bit for a type
   static constexpr unsigned bit(Type t) { return 1u << static_cast<unsigned>(t.getType()); }

   public:
   /// Constructor. The first member becomes the primary type
   constexpr TypeSet(std::initializer_list<Type> types) : mask(0), primary(Type::getUnknown()) {
      bool first = true;
      for (auto t : types) {
         if (first) {
            primary = t;
            first = false;
         }
         mask |= bit(t);
      }
   }

   /// Is the type a member?
   constexpr bool contains(Type t) const { return mask & bit(t); }
   /// Get the primary member
   constexpr Type getPrimary() const { return primary; }

   /// Does a type satisfy the expectation? Unknown is compatible in both directions
   constexpr bool matches(Type actual) const { return contains(actual) || actual.isUnknown() || contains(Type::getUnknown()); }

   /// A set containing exactly one type
   static constexpr TypeSet exactly(Type t) { return TypeSet(bit(t), t); }
   /// Boolean values
   static constexpr TypeSet getBool() { return exactly(Type::getBool()); }
   /// Numeric values
   static constexpr TypeSet getNumeric() { return exactly(Type::getNumeric()); }
   /// Numeric or boolean values (booleans take part in arithmetic as 0/1)
   static constexpr TypeSet getNumericOrBool() { return TypeSet{Type::getNumeric(), Type::getBool()}; }
   /// Any known value
   static constexpr TypeSet getAny() { return TypeSet{Type::getNumeric(), Type::getBool(), Type::getString()}; }
};
//---------------------------------------------------------------------------
}
//---------------------------------------------------------------------------
#endif
