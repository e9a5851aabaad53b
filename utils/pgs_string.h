#ifndef pgs_STRING_H
#define pgs_STRING_H

#include <stdexcept>
#include <string>
#include <algorithm>
#include <cctype>

// Wrapper around std::string to provide additional functionality
class pgs_string
{
  std::string str;

  static bool is_space(char c)
  {
    return std::isspace(static_cast<unsigned char>(c)) != 0;
  }

public:
  static const size_t npos = std::string::npos;
  pgs_string() : str() {}
  pgs_string(const char* s) : str(s) {}
  pgs_string(const char* s, size_t len) : str(s, len) {}
  pgs_string(const std::string& s) : str(s) {}

  // from numbers
  pgs_string(int i) : str(std::to_string(i)) {}
  pgs_string(long i) : str(std::to_string(i)) {}
  pgs_string(long long i) : str(std::to_string(i)) {}
  pgs_string(unsigned long i) : str(std::to_string(i)) {}
  pgs_string(double d) : str(std::to_string(d)) {}
  // single char
  pgs_string(char c) : str(1, c) {}

  std::string& to_std() { return str; }
  const std::string& to_std_const() const { return str; }
  const char* c_str() const { return str.c_str(); }

  pgs_string operator+(const pgs_string& s) const { return str + s.str; }
  pgs_string operator+(const char* s) const { return str + s; }
  pgs_string& operator+=(const pgs_string& s) { str += s.str; return *this; }
  bool operator==(const pgs_string& s) const { return str == s.str; }
  bool operator!=(const pgs_string& s) const { return str != s.str; }
  bool operator<(const pgs_string& s) const { return str < s.str; }

  bool empty() const { return str.empty(); }
  size_t size() const { return str.size(); }
  size_t length() const { return str.length(); }
  void clear() { str.clear(); }

  char& operator[](size_t i) { return str[i]; }
  char operator[](size_t i) const { return str[i]; }

  pgs_string substr(size_t pos, size_t len = npos) const { return str.substr(pos, len); }

  // Whole string (surrounding whitespace allowed) must be an integer
  bool is_integer() const
  {
    std::string t = trim().str;
    if (t.empty())
    {
      return false;
    }
    try
    {
      size_t used = 0;
      std::stoll(t, &used);
      return used == t.size();
    }
    catch (const std::invalid_argument&)
    {
      return false;
    }
    catch (const std::out_of_range&)
    {
      return false;
    }
  }

  long long to_int(long long def = 0) const
  {
    if (!is_integer())
    {
      return def;
    }
    return std::stoll(trim().str);
  }

  size_t find(const pgs_string& s, size_t pos = 0) const { return str.find(s.str, pos); }
  size_t rfind(const pgs_string& s) const { return str.rfind(s.str); }
  size_t find_last_of(const pgs_string& chars) const { return str.find_last_of(chars.str); }

  bool contains(const pgs_string& s) const { return str.find(s.str) != std::string::npos; }

  pgs_string lower() const
  {
    pgs_string res = *this;
    for (size_t i = 0; i < res.size(); ++i)
    {
      res[i] = static_cast<char>(std::tolower(static_cast<unsigned char>(res[i])));
    }
    return res;
  }

  // Replaces every occurrence of any character in chars with to
  pgs_string& replace_any(const pgs_string& chars, char to)
  {
    for (char& c : str)
    {
      if (chars.str.find(c) != std::string::npos)
      {
        c = to;
      }
    }
    return *this;
  }

  pgs_string trim() const
  {
    size_t start = str.find_first_not_of(" \t\n\r\f\v");
    if (start == std::string::npos) return pgs_string();
    size_t end = str.find_last_not_of(" \t\n\r\f\v");
    return str.substr(start, end - start + 1);
  }

  bool starts_with(const pgs_string& prefix) const
  {
    return str.size() >= prefix.size() && str.compare(0, prefix.size(), prefix.str) == 0;
  }

  bool ends_with(const pgs_string& suffix) const
  {
    return str.size() >= suffix.size() &&
           str.compare(str.size() - suffix.size(), suffix.size(), suffix.str) == 0;
  }

  pgs_string repeat(size_t times) const
  {
    pgs_string result;
    for (size_t i = 0; i < times; ++i) {
      result += *this;
    }
    return result;
  }

  pgs_string pad_left(size_t total_width, char pad_char = ' ') const
  {
    if (str.size() >= total_width) return *this;
    return pgs_string(pad_char).repeat(total_width - str.size()) + *this;
  }

  // Collapses every whitespace run to a single space and trims both ends
  pgs_string normalize_whitespace() const
  {
    std::string result;
    bool in_whitespace = false;

    for (char c : str) {
      if (is_space(c)) {
        if (!in_whitespace) {
          result += ' ';
          in_whitespace = true;
        }
      } else {
        result += c;
        in_whitespace = false;
      }
    }

    return pgs_string(result).trim();
  }
};

inline pgs_string operator+(const char* lhs, const pgs_string& rhs) {
    return pgs_string(lhs) + rhs;
}

#endif // pgs_STRING_H
