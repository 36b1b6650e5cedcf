#pragma once

namespace urikit {

constexpr bool isdigit(char ch) { return ch >= '0' && ch <= '9'; }

constexpr bool islower(char ch) { return ch >= 'a' && ch <= 'z'; }

constexpr bool isupper(char ch) { return ch >= 'A' && ch <= 'Z'; }

constexpr bool isalpha(char ch) { return islower(ch) || isupper(ch); }

constexpr bool isalnum(char ch) { return isalpha(ch) || isdigit(ch); }

constexpr bool isspace(char ch) { return ch == ' ' || (ch >= '\t' && ch <= '\r'); }

}  // namespace urikit
