// ═══════════════════════════════════════════════════════════════════
//  src/type_ref.cpp — TypeRef construction and printing
// ═══════════════════════════════════════════════════════════════════

#include "gqlpp/type_ref.h"
#include "gqlpp/parser.h"

#include <stdexcept>

namespace gqlpp {

TypeRef TypeRef::named(std::string name) {
    TypeRef t;
    t.kind_ = Kind::Named;
    t.name_ = std::move(name);
    return t;
}

TypeRef TypeRef::list(TypeRef ofType) {
    TypeRef t;
    t.kind_ = Kind::List;
    t.ofType_ = std::make_shared<const TypeRef>(std::move(ofType));
    return t;
}

TypeRef TypeRef::nonNull(TypeRef ofType) {
    if (ofType.isNonNull()) {
        throw std::invalid_argument("NonNull cannot wrap NonNull type " + ofType.toString());
    }
    TypeRef t;
    t.kind_ = Kind::NonNull;
    t.ofType_ = std::make_shared<const TypeRef>(std::move(ofType));
    return t;
}

TypeRef TypeRef::parse(std::string_view source) {
    return parseType(source);
}

const TypeRef& TypeRef::ofType() const {
    if (!ofType_) {
        throw std::logic_error("Named type " + name_ + " has no wrapped type");
    }
    return *ofType_;
}

const TypeRef& TypeRef::nullable() const {
    return isNonNull() ? *ofType_ : *this;
}

const std::string& TypeRef::namedType() const {
    const TypeRef* t = this;
    while (!t->isNamed()) t = t->ofType_.get();
    return t->name_;
}

std::string TypeRef::toString() const {
    switch (kind_) {
        case Kind::Named:   return name_;
        case Kind::List:    return "[" + ofType_->toString() + "]";
        case Kind::NonNull: return ofType_->toString() + "!";
    }
    return name_;
}

bool TypeRef::operator==(const TypeRef& other) const {
    if (kind_ != other.kind_) return false;
    if (kind_ == Kind::Named) return name_ == other.name_;
    return *ofType_ == *other.ofType_;
}

} // namespace gqlpp
