#pragma once

namespace geminet {

constexpr bool isdigit(char ch) { return ch >= '0' && ch <= '9'; }

constexpr bool islower(char ch) { return ch >= 'a' && ch <= 'z'; }

constexpr bool isupper(char ch) { return ch >= 'A' && ch <= 'Z'; }

constexpr bool isalpha(char ch) { return islower(ch) || isupper(ch); }

constexpr bool isalnum(char ch) { return isalpha(ch) || isdigit(ch); }

constexpr char tolower(char ch) { return isupper(ch) ? static_cast<char>(ch | 0x20) : ch; }

}  // namespace geminet
