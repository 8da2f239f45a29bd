#pragma once
// ═══════════════════════════════════════════════════════════════════
//  gqlpp/type_ref.h — Named / List / NonNull type references
// ═══════════════════════════════════════════════════════════════════
//
//  Usage:
//    auto t = TypeRef::parse("[User!]!");
//    t.isNonNull();              // true
//    t.namedType();              // "User"
//    t.ofType().ofType();        // User!
//
//  Type references never own type definitions: they name them, and
//  the Schema resolves the name. This keeps self-referencing object
//  types finite.
// ═══════════════════════════════════════════════════════════════════

#include <memory>
#include <string>
#include <string_view>

namespace gqlpp {

class TypeRef {
public:
    enum class Kind { Named, List, NonNull };

    TypeRef() = default;

    static TypeRef named(std::string name);
    static TypeRef list(TypeRef ofType);
    // Throws std::invalid_argument when ofType is already NonNull
    static TypeRef nonNull(TypeRef ofType);
    // GraphQL type syntax; throws ParseError/LexError
    static TypeRef parse(std::string_view source);

    Kind kind() const { return kind_; }
    bool isNamed() const { return kind_ == Kind::Named; }
    bool isList() const { return kind_ == Kind::List; }
    bool isNonNull() const { return kind_ == Kind::NonNull; }
    bool empty() const { return kind_ == Kind::Named && name_.empty(); }

    // Wrapped type; only valid for List and NonNull
    const TypeRef& ofType() const;

    // NonNull stripped once
    const TypeRef& nullable() const;

    // Innermost named type
    const std::string& namedType() const;

    std::string toString() const;

    bool operator==(const TypeRef& other) const;
    bool operator!=(const TypeRef& other) const { return !(*this == other); }

private:
    Kind kind_ = Kind::Named;
    std::string name_;
    std::shared_ptr<const TypeRef> ofType_;
};

} // namespace gqlpp
