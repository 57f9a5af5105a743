// Copyright (c) 2021-2025, Nikita Pennie <nikitapnn1@gmail.com>
// SPDX-License-Identifier: MIT

#pragma once

#include <cstddef>
#include <cstdint>
#include <initializer_list>
#include <iosfwd>
#include <string>
#include <string_view>
#include <type_traits>
#include <unordered_map>
#include <utility>
#include <variant>
#include <vector>

#include <nvbind/exception.hpp>
#include <nvbind/export.hpp>
#include <nvbind/handle.hpp>
#include <nvbind/marker.hpp>

namespace nvbind {

struct Nil {
  bool operator==(const Nil&) const = default;
};

class Value;

using Array = std::vector<Value>;

/**
 * @brief MessagePack map. Keys are arbitrary values and unique; equality does
 * not depend on the order entries were inserted in.
 *
 * Entries keep insertion order. Lookups go through index_, which maps
 * hash_value(key) to positions in items_.
 *
 * Member functions are defined after Value, which is incomplete here.
 */
class Dictionary
{
public:
  using value_type = std::pair<Value, Value>;
  using container_type = std::vector<value_type>;
  using const_iterator = container_type::const_iterator;

  Dictionary() = default;
  Dictionary(std::initializer_list<value_type> items);

  /// Returns true if the key was not present before.
  bool insert_or_assign(Value key, Value value);

  const Value* find(const Value& key) const noexcept;
  const Value* find(std::string_view key) const noexcept;
  const Value* find(const char* key) const noexcept
  {
    return find(std::string_view(key));
  }

  /// String keyed lookup; throws nvbind::Exception if the key is absent.
  const Value& at(std::string_view key) const;

  std::size_t size() const noexcept;
  bool empty() const noexcept;
  void reserve(std::size_t n);

  const_iterator begin() const noexcept;
  const_iterator end() const noexcept;

  friend bool operator==(const Dictionary& a, const Dictionary& b);

private:
  container_type items_;
  std::unordered_multimap<std::size_t, std::size_t> index_;

  // position of key in items_, or size() if absent
  std::size_t locate(const Value& key, std::size_t hash) const noexcept;
};

class Value
{
public:
  // Alternative order follows ValueKind.
  using variant_type = std::variant<Nil,
                                    bool,
                                    std::int64_t,
                                    double,
                                    std::string,
                                    Array,
                                    Dictionary,
                                    Handle>;

  Value() = default;
  Value(Nil) noexcept {}
  Value(bool b) noexcept
      : data_(b)
  {
  }
  template <typename T>
    requires(std::is_integral_v<T> && !std::is_same_v<T, bool>)
  Value(T i) noexcept
      : data_(static_cast<std::int64_t>(i))
  {
  }
  Value(double d) noexcept
      : data_(d)
  {
  }
  Value(float f) noexcept
      : data_(static_cast<double>(f))
  {
  }
  Value(std::string s) noexcept
      : data_(std::move(s))
  {
  }
  Value(std::string_view s)
      : data_(std::string(s))
  {
  }
  Value(const char* s)
      : data_(std::string(s))
  {
  }
  Value(Array a) noexcept
      : data_(std::move(a))
  {
  }
  Value(Dictionary d) noexcept
      : data_(std::move(d))
  {
  }
  Value(Handle h) noexcept
      : data_(h)
  {
  }
  template <typename Derived>
  Value(const BasicHandle<Derived>& h) noexcept
      : data_(h.to_handle())
  {
  }

  ValueKind kind() const noexcept
  {
    return static_cast<ValueKind>(data_.index());
  }

  bool is_nil() const noexcept { return std::holds_alternative<Nil>(data_); }

  template <typename T> bool is() const noexcept
  {
    return std::holds_alternative<T>(data_);
  }

  template <typename T> const T& as() const
  {
    if (auto p = std::get_if<T>(&data_))
      return *p;
    throw_bad_access(kind_of<T>());
  }

  template <typename T> T& as()
  {
    if (auto p = std::get_if<T>(&data_))
      return *p;
    throw_bad_access(kind_of<T>());
  }

  const variant_type& data() const noexcept { return data_; }

  friend bool operator==(const Value& a, const Value& b);

private:
  variant_type data_;

  template <typename T> static constexpr ValueKind kind_of() noexcept
  {
    if constexpr (std::is_same_v<T, Nil>)
      return ValueKind::Nil;
    else if constexpr (std::is_same_v<T, bool>)
      return ValueKind::Boolean;
    else if constexpr (std::is_same_v<T, std::int64_t>)
      return ValueKind::Integer;
    else if constexpr (std::is_same_v<T, double>)
      return ValueKind::Float;
    else if constexpr (std::is_same_v<T, std::string>)
      return ValueKind::String;
    else if constexpr (std::is_same_v<T, Array>)
      return ValueKind::Array;
    else if constexpr (std::is_same_v<T, Dictionary>)
      return ValueKind::Dictionary;
    else
      return ValueKind::Handle;
  }

  [[noreturn]] NVBIND_API void throw_bad_access(ValueKind wanted) const;
};

/// Hash consistent with operator==: -0.0 and 0.0 hash alike, and a
/// Dictionary hashes the same whatever its insertion order.
NVBIND_API std::size_t hash_value(const Value& v) noexcept;

/// Debug representation, e.g. {"a": [1, 2.5, nil]}
NVBIND_API std::string to_string(const Value& v);
NVBIND_API std::ostream& operator<<(std::ostream& os, const Value& v);

//--------------------------------------------------------------------------
// Dictionary members (need a complete Value)
//--------------------------------------------------------------------------

inline Dictionary::Dictionary(std::initializer_list<value_type> items)
{
  reserve(items.size());
  for (auto const& [k, v] : items)
    insert_or_assign(k, v);
}

inline std::size_t Dictionary::size() const noexcept { return items_.size(); }

inline bool Dictionary::empty() const noexcept { return items_.empty(); }

inline void Dictionary::reserve(std::size_t n)
{
  items_.reserve(n);
  index_.reserve(n);
}

inline Dictionary::const_iterator Dictionary::begin() const noexcept
{
  return items_.begin();
}

inline Dictionary::const_iterator Dictionary::end() const noexcept
{
  return items_.end();
}

} // namespace nvbind
