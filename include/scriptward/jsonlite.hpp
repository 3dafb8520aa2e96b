#pragma once

// scriptward/jsonlite.hpp - Minimal strict JSON reader/writer.
//
// Objects are std::map, so lookups and iteration are in sorted key order.
// Numbers: non-negative integers parse to uint64_t, everything else to double.

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace scriptward::jsonlite {

struct JsonError {
  std::string code;
  std::string message;
};

struct Value;
using Object = std::map<std::string, Value>;
using Array = std::vector<Value>;

struct Value {
  std::variant<std::nullptr_t, bool, std::string, std::uint64_t, double, Object, Array> v;

  Value() : v(nullptr) {}
  Value(std::nullptr_t) : v(nullptr) {}
  Value(bool b) : v(b) {}
  Value(std::string s) : v(std::move(s)) {}
  Value(const char* s) : v(std::string(s)) {}
  Value(std::uint64_t n) : v(n) {}
  Value(double d) : v(d) {}
  Value(Object o) : v(std::move(o)) {}
  Value(Array a) : v(std::move(a)) {}
};

// Parse a document whose top level must be an object. On failure *error is
// set and an empty object is returned.
Object parse(const std::string& text, std::optional<JsonError>* error);

std::optional<JsonError> validate_strict(const std::string& text);

std::string escape(const std::string& s);
std::string format_double(double d);

// Type-safe extractors. Missing keys and type mismatches yield the default.
std::string get_string(const Object& obj, const std::string& key, const std::string& def = "");
bool get_bool(const Object& obj, const std::string& key, bool def = false);
unsigned long long get_u64(const Object& obj, const std::string& key, unsigned long long def = 0);
double get_double(const Object& obj, const std::string& key, double def = 0.0);
std::vector<std::string> get_string_array(const Object& obj, const std::string& key);
std::map<std::string, std::string> get_string_map(const Object& obj, const std::string& key);

}  // namespace scriptward::jsonlite
