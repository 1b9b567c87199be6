#include "adaptr/objects/binding.hpp"

namespace adaptr {

void Binding::unsupported(std::string_view access) const {
    throw NoConverterError("C++ type " + type_name() + " has no " + std::string(access) +
                           " access; register a converter for it", type_name());
}

Value Binding::read_scalar(const void*) const { unsupported("scalar"); }
ScalarStatus Binding::write_scalar(void*, const Value&) const { unsupported("scalar"); }

std::string Binding::enum_symbol(const void*) const { unsupported("enumeration"); }
bool Binding::set_enum_symbol(void*, std::string_view) const { unsupported("enumeration"); }

bool Binding::has_value(const void*) const { unsupported("optional"); }
ObjectRef Binding::value_of(const void*) const { unsupported("optional"); }
MutableRef Binding::emplace_value(void*) const { unsupported("optional"); }
void Binding::reset(void*) const { unsupported("optional"); }

std::size_t Binding::size(const void*) const { unsupported("sequence"); }
ObjectRef Binding::element(const void*, std::size_t) const { unsupported("sequence"); }
MutableRef Binding::mutable_element(void*, std::size_t) const { unsupported("sequence"); }
bool Binding::resize(void*, std::size_t) const { unsupported("sequence"); }

void Binding::for_each_entry(const void*, const EntryVisitor&) const { unsupported("mapping"); }
void Binding::clear(void*) const { unsupported("mapping"); }
MutableRef Binding::insert_entry(void*, const KeyFiller&) const { unsupported("mapping"); }
bool Binding::ordered() const { return true; }

void Binding::for_each_field(const void*, const FieldVisitor&) const { unsupported("record field"); }
void Binding::for_each_mutable_field(void*, const MutableFieldVisitor&) const { unsupported("record field"); }

std::size_t Binding::active_branch(const void*) const { unsupported("union"); }
ObjectRef Binding::branch(const void*) const { unsupported("union"); }
MutableRef Binding::emplace_branch(void*, std::size_t) const { unsupported("union"); }

} // namespace adaptr
