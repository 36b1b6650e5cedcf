#include "urikit/http-headers.hpp"

#include <cstddef>
#include <iterator>
#include <span>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "urikit/http-header-is-valid.hpp"
#include "urikit/invalid_argument_exception.hpp"

namespace urikit::http {

namespace {

// Strips leading and trailing OWS (SP and HTAB, RFC 7230 3.2.3). Inner whitespace is kept.
constexpr std::string_view TrimOws(std::string_view sv) noexcept {
  const auto first = sv.find_first_not_of(" \t");
  if (first == std::string_view::npos) {
    return {};
  }
  return sv.substr(first, sv.find_last_not_of(" \t") - first + 1);
}

void CheckHeaderName(std::string_view name) {
  if (!IsValidHeaderName(name)) {
    throw invalid_argument("Invalid header name '{}'", name);
  }
}

std::string CheckedValue(std::string_view name, std::string_view value) {
  const std::string_view trimmed = TrimOws(value);
  if (!IsValidHeaderValue(trimmed)) {
    throw invalid_argument("Invalid value for header '{}'", name);
  }
  return std::string(trimmed);
}

std::vector<std::string> CheckedValues(std::string_view name, std::span<const std::string> values) {
  CheckHeaderName(name);
  std::vector<std::string> ret;
  ret.reserve(values.size());
  for (const std::string &value : values) {
    ret.push_back(CheckedValue(name, value));
  }
  return ret;
}

}  // namespace

void HttpHeaders::set(std::string_view name, std::span<const std::string> values) {
  std::vector<std::string> newValues = CheckedValues(name, values);
  erase(name);
  _index.emplace(std::string(name), _fields.size());
  _fields.push_back(HeaderField{std::string(name), std::move(newValues)});
}

void HttpHeaders::set(std::string_view name, std::string_view value) {
  const std::string values[] = {std::string(value)};
  set(name, values);
}

void HttpHeaders::add(std::string_view name, std::span<const std::string> values) {
  std::vector<std::string> newValues = CheckedValues(name, values);
  const auto it = _index.find(name);
  if (it == _index.end()) {
    _index.emplace(std::string(name), _fields.size());
    _fields.push_back(HeaderField{std::string(name), std::move(newValues)});
    return;
  }
  std::vector<std::string> &existingValues = _fields[it->second].values;
  existingValues.insert(existingValues.end(), std::make_move_iterator(newValues.begin()),
                        std::make_move_iterator(newValues.end()));
}

void HttpHeaders::add(std::string_view name, std::string_view value) {
  const std::string values[] = {std::string(value)};
  add(name, values);
}

void HttpHeaders::merge(std::span<const HeaderField> fields) {
  for (const HeaderField &field : fields) {
    add(field.name, field.values);
  }
}

void HttpHeaders::setFirst(std::string_view name, std::string_view value) {
  CheckHeaderName(name);
  std::string newValue = CheckedValue(name, value);

  std::string fieldName(name);
  const auto it = _index.find(name);
  if (it != _index.end()) {
    fieldName = std::move(_fields[it->second].name);
    _fields.erase(_fields.begin() + static_cast<std::ptrdiff_t>(it->second));
  }
  _fields.insert(_fields.begin(), HeaderField{std::move(fieldName), {std::move(newValue)}});
  reindex();
}

bool HttpHeaders::erase(std::string_view name) {
  const auto it = _index.find(name);
  if (it == _index.end()) {
    return false;
  }
  _fields.erase(_fields.begin() + static_cast<std::ptrdiff_t>(it->second));
  reindex();
  return true;
}

std::span<const std::string> HttpHeaders::values(std::string_view name) const {
  const auto it = _index.find(name);
  if (it == _index.end()) {
    return {};
  }
  return _fields[it->second].values;
}

std::string HttpHeaders::line(std::string_view name) const {
  const std::span<const std::string> vals = values(name);
  std::string ret;
  for (std::size_t pos = 0; pos < vals.size(); ++pos) {
    if (pos != 0) {
      ret.append(", ");
    }
    ret.append(vals[pos]);
  }
  return ret;
}

void HttpHeaders::reindex() {
  _index.clear();
  for (std::size_t pos = 0; pos < _fields.size(); ++pos) {
    _index.emplace(_fields[pos].name, pos);
  }
}

}  // namespace urikit::http
