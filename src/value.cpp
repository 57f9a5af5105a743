// Copyright (c) 2021-2025, Nikita Pennie <nikitapnn1@gmail.com>
// SPDX-License-Identifier: MIT

#include <functional>
#include <iomanip>
#include <ostream>
#include <sstream>

#include <boost/container_hash/hash.hpp>

#include <nvbind/value.hpp>

namespace nvbind {

namespace {

std::size_t kind_seed(ValueKind kind) noexcept
{
  return static_cast<std::size_t>(kind);
}

std::size_t hash_string(std::string_view s) noexcept
{
  auto seed = kind_seed(ValueKind::String);
  boost::hash_combine(seed, std::hash<std::string_view>{}(s));
  return seed;
}

} // namespace

NVBIND_API std::size_t hash_value(const Value& v) noexcept
{
  auto seed = kind_seed(v.kind());
  switch (v.kind()) {
  case ValueKind::Nil:
    break;
  case ValueKind::Boolean:
    boost::hash_combine(seed, v.as<bool>());
    break;
  case ValueKind::Integer:
    boost::hash_combine(seed, v.as<std::int64_t>());
    break;
  case ValueKind::Float: {
    auto const d = v.as<double>();
    // -0.0 == 0.0
    boost::hash_combine(seed, std::hash<double>{}(d == 0.0 ? 0.0 : d));
    break;
  }
  case ValueKind::String:
    return hash_string(v.as<std::string>());
  case ValueKind::Array:
    for (auto const& x : v.as<Array>())
      boost::hash_combine(seed, hash_value(x));
    break;
  case ValueKind::Dictionary: {
    // entry hashes are summed so insertion order does not matter
    std::size_t sum = 0;
    for (auto const& [k, val] : v.as<Dictionary>()) {
      std::size_t entry = hash_value(k);
      boost::hash_combine(entry, hash_value(val));
      sum += entry;
    }
    boost::hash_combine(seed, sum);
    break;
  }
  case ValueKind::Handle: {
    auto const& h = v.as<Handle>();
    boost::hash_combine(seed, static_cast<int>(h.kind));
    boost::hash_combine(seed, h.value);
    break;
  }
  }
  return seed;
}

std::size_t Dictionary::locate(const Value& key, std::size_t hash) const noexcept
{
  auto [first, last] = index_.equal_range(hash);
  for (; first != last; ++first) {
    if (items_[first->second].first == key)
      return first->second;
  }
  return items_.size();
}

bool Dictionary::insert_or_assign(Value key, Value value)
{
  auto const hash = hash_value(key);
  if (auto pos = locate(key, hash); pos != items_.size()) {
    items_[pos].second = std::move(value);
    return false;
  }
  items_.emplace_back(std::move(key), std::move(value));
  index_.emplace(hash, items_.size() - 1);
  return true;
}

const Value* Dictionary::find(const Value& key) const noexcept
{
  auto const pos = locate(key, hash_value(key));
  return pos != items_.size() ? &items_[pos].second : nullptr;
}

const Value* Dictionary::find(std::string_view key) const noexcept
{
  auto [first, last] = index_.equal_range(hash_string(key));
  for (; first != last; ++first) {
    auto const& kv = items_[first->second];
    if (kv.first.is<std::string>() && kv.first.as<std::string>() == key)
      return &kv.second;
  }
  return nullptr;
}

const Value& Dictionary::at(std::string_view key) const
{
  if (auto v = find(key))
    return *v;
  throw Exception("dictionary has no key \"" + std::string(key) + "\"");
}

bool operator==(const Dictionary& a, const Dictionary& b)
{
  if (a.size() != b.size())
    return false;
  // Keys are unique on both sides, so matching every entry of a is enough.
  for (auto const& [k, v] : a) {
    auto other = b.find(k);
    if (!other || !(*other == v))
      return false;
  }
  return true;
}

bool operator==(const Value& a, const Value& b) { return a.data_ == b.data_; }

NVBIND_API void Value::throw_bad_access(ValueKind wanted) const
{
  throw Exception("value holds " + std::string(to_string(kind())) + ", not " +
                  std::string(to_string(wanted)));
}

namespace {

template <class... Ts> struct overloaded : Ts... {
  using Ts::operator()...;
};

void print_string(std::ostream& os, std::string_view s)
{
  os << '"';
  for (char c : s) {
    switch (c) {
    case '"':
      os << "\\\"";
      break;
    case '\\':
      os << "\\\\";
      break;
    case '\n':
      os << "\\n";
      break;
    case '\t':
      os << "\\t";
      break;
    default:
      if (static_cast<unsigned char>(c) < 0x20) {
        os << "\\x" << std::hex << std::setw(2) << std::setfill('0')
           << static_cast<int>(c) << std::dec;
      } else {
        os << c;
      }
    }
  }
  os << '"';
}

void print(std::ostream& os, const Value& v)
{
  std::visit(overloaded{
                 [&](Nil) { os << "nil"; },
                 [&](bool b) { os << (b ? "true" : "false"); },
                 [&](std::int64_t i) { os << i; },
                 [&](double d) { os << d; },
                 [&](const std::string& s) { print_string(os, s); },
                 [&](const Array& a) {
                   os << '[';
                   for (std::size_t i = 0; i < a.size(); ++i) {
                     if (i)
                       os << ", ";
                     print(os, a[i]);
                   }
                   os << ']';
                 },
                 [&](const Dictionary& d) {
                   os << '{';
                   bool first = true;
                   for (auto const& [k, val] : d) {
                     if (!first)
                       os << ", ";
                     first = false;
                     print(os, k);
                     os << ": ";
                     print(os, val);
                   }
                   os << '}';
                 },
                 [&](const Handle& h) {
                   os << to_string(h.kind) << '(' << h.value << ')';
                 },
             },
             v.data());
}

} // namespace

NVBIND_API std::string to_string(const Value& v)
{
  std::ostringstream os;
  print(os, v);
  return os.str();
}

NVBIND_API std::ostream& operator<<(std::ostream& os, const Value& v)
{
  print(os, v);
  return os;
}

} // namespace nvbind
