#pragma once

#include <cstddef>
#include <initializer_list>
#include <span>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include "urikit/string-equal-ignore-case.hpp"

namespace urikit::http {

// A header name with all its values, in insertion order.
struct HeaderField {
  bool operator==(const HeaderField &) const noexcept = default;

  std::string name;
  std::vector<std::string> values;
};

using HeaderFields = std::vector<HeaderField>;

// Ordered collection of header fields with case-insensitive name lookup.
// Each field keeps the casing of the name it was first added with (or last set with, see set()).
//
// Names must be RFC 7230 tokens and values must not contain CR or LF, otherwise invalid_argument is thrown.
// Values are stored without their surrounding optional whitespace.
class HttpHeaders {
 public:
  HttpHeaders() = default;

  // Adds all given fields, merging the values of fields with the same name (case-insensitively).
  explicit HttpHeaders(std::span<const HeaderField> fields) { merge(fields); }

  HttpHeaders(std::initializer_list<HeaderField> fields) {
    merge(std::span<const HeaderField>(fields.begin(), fields.size()));
  }

  // Replaces all values of header 'name' by 'values'. The header moves to the last position with the casing of
  // 'name'.
  void set(std::string_view name, std::span<const std::string> values);

  void set(std::string_view name, std::string_view value);

  // Appends 'values' to the existing values of header 'name', keeping its original casing and position.
  // If the header does not exist, it is added last.
  void add(std::string_view name, std::span<const std::string> values);

  void add(std::string_view name, std::string_view value);

  // add() for each field.
  void merge(std::span<const HeaderField> fields);

  // Sets 'value' as the only value of header 'name' and moves it to the first position.
  // An already present header keeps its original casing.
  void setFirst(std::string_view name, std::string_view value);

  // Removes header 'name'. Returns true if it was present.
  bool erase(std::string_view name);

  [[nodiscard]] bool contains(std::string_view name) const { return _index.contains(name); }

  // Values of header 'name', empty if absent.
  [[nodiscard]] std::span<const std::string> values(std::string_view name) const;

  // Values of header 'name' joined by ", ", empty if absent.
  [[nodiscard]] std::string line(std::string_view name) const;

  [[nodiscard]] const HeaderFields &fields() const noexcept { return _fields; }

  [[nodiscard]] std::size_t size() const noexcept { return _fields.size(); }

  [[nodiscard]] bool empty() const noexcept { return _fields.empty(); }

  bool operator==(const HttpHeaders &other) const noexcept { return _fields == other._fields; }

 private:
  // Rebuilds the name index after a change of positions.
  void reindex();

  HeaderFields _fields;
  std::unordered_map<std::string, std::size_t, CaseInsensitiveHashFunc, CaseInsensitiveEqualFunc> _index;
};

}  // namespace urikit::http
