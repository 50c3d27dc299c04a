#pragma once
#include <cstddef>
#include <initializer_list>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <variant>
#include <vector>

namespace cm {

enum class FieldKind { Bool, Int, Float, String };

constexpr std::string_view to_string(FieldKind k) noexcept {
  switch (k) {
    case FieldKind::Bool:   return "bool";
    case FieldKind::Int:    return "int";
    case FieldKind::Float:  return "float";
    case FieldKind::String: return "string";
  }
  return "unknown";
}

// Scalar member types a record may map. Anything else is rejected in field().
template <class M>
struct is_field_type
    : std::bool_constant<std::is_same_v<M, bool> ||
                         std::is_same_v<M, signed char> ||
                         std::is_same_v<M, short> ||
                         std::is_same_v<M, int> ||
                         std::is_same_v<M, long> ||
                         std::is_same_v<M, long long> ||
                         std::is_same_v<M, float> ||
                         std::is_same_v<M, double> ||
                         std::is_same_v<M, std::string>> {};

template <class M>
inline constexpr bool is_field_type_v = is_field_type<M>::value;

template <class M>
constexpr FieldKind kind_of() noexcept {
  if constexpr (std::is_same_v<M, bool>) return FieldKind::Bool;
  else if constexpr (std::is_floating_point_v<M>) return FieldKind::Float;
  else if constexpr (std::is_same_v<M, std::string>) return FieldKind::String;
  else return FieldKind::Int;
}

template <class T>
using FieldRef = std::variant<bool T::*,
                              signed char T::*,
                              short T::*,
                              int T::*,
                              long T::*,
                              long long T::*,
                              float T::*,
                              double T::*,
                              std::string T::*>;

template <class T>
struct FieldDescriptor {
  std::string name;    // field identifier used in diagnostics
  std::string column;  // empty: field is not mapped
  FieldRef<T> ref;

  bool annotated() const noexcept { return !column.empty(); }

  FieldKind kind() const noexcept {
    return std::visit([](auto mp) {
      using M = std::remove_reference_t<decltype(std::declval<T&>().*mp)>;
      return kind_of<M>();
    }, ref);
  }
};

// Declare one field of a record. Leaving `column` empty keeps the field out
// of both the read and the write path.
template <class T, class M>
FieldDescriptor<T> field(std::string name, M T::* member, std::string column = {}) {
  static_assert(std::is_class_v<T>, "csvmap: not a record type");
  static_assert(is_field_type_v<M>,
                "csvmap: unsupported field kind (bool, signed integers, float, "
                "double and std::string are mappable)");
  return FieldDescriptor<T>{std::move(name), std::move(column), FieldRef<T>(std::in_place_type<M T::*>, member)};
}

template <class T>
class RecordDescriptor {
  static_assert(std::is_class_v<T>, "csvmap: not a record type");
  static_assert(std::is_default_constructible_v<T>,
                "csvmap: records are decoded into default-constructed instances");

public:
  RecordDescriptor() = default;
  RecordDescriptor(std::initializer_list<FieldDescriptor<T>> fields)
      : fields_(fields) {}

  RecordDescriptor& add(FieldDescriptor<T> f) {
    fields_.push_back(std::move(f));
    return *this;
  }

  const std::vector<FieldDescriptor<T>>& fields() const noexcept { return fields_; }
  std::size_t size() const noexcept { return fields_.size(); }
  const FieldDescriptor<T>& operator[](std::size_t i) const { return fields_[i]; }

private:
  std::vector<FieldDescriptor<T>> fields_;
};

// Specialize per record type:
//
//   template <> struct cm::RecordTraits<Person> {
//     static cm::RecordDescriptor<Person> describe() {
//       return { cm::field("Name", &Person::name, "name") };
//     }
//   };
template <class T>
struct RecordTraits;

// Built on first use, then shared read-only.
template <class T>
const RecordDescriptor<T>& descriptor_of() {
  static const RecordDescriptor<T> desc = RecordTraits<T>::describe();
  return desc;
}

}
