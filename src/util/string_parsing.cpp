#include "util/string_parsing.hpp"
#include <cctype>
#include <stdexcept>

namespace notekeep {
namespace util {

std::optional<int> SafeParseInt(const std::string &str, int min, int max) {
  auto value = SafeParseInt64(str, min, max);
  if (!value) {
    return std::nullopt;
  }
  return static_cast<int>(*value);
}

std::optional<int64_t> SafeParseInt64(const std::string &str, int64_t min,
                                      int64_t max) {
  // Reject empty or whitespace-leading strings
  if (str.empty() || std::isspace(static_cast<unsigned char>(str[0]))) {
    return std::nullopt;
  }

  size_t pos = 0;
  long long value = 0;
  try {
    value = std::stoll(str, &pos);
  } catch (const std::invalid_argument &) {
    return std::nullopt;
  } catch (const std::out_of_range &) {
    return std::nullopt;
  }

  // Check entire string was consumed
  if (pos != str.size()) {
    return std::nullopt;
  }

  if (value < min || value > max) {
    return std::nullopt;
  }

  return static_cast<int64_t>(value);
}

std::string TrimWhitespace(const std::string &str) {
  size_t first = str.find_first_not_of(WHITESPACE_CHARS);
  if (first == std::string::npos) {
    return "";
  }
  size_t last = str.find_last_not_of(WHITESPACE_CHARS);
  return str.substr(first, last - first + 1);
}

bool IsValidUtf8(const std::string &str) {
  size_t i = 0;
  const size_t n = str.size();
  while (i < n) {
    unsigned char c = static_cast<unsigned char>(str[i]);
    if (c < 0x80) {
      ++i;
      continue;
    }

    size_t len = 0;
    uint32_t cp = 0;
    if ((c & 0xE0) == 0xC0) {
      len = 2;
      cp = c & 0x1F;
    } else if ((c & 0xF0) == 0xE0) {
      len = 3;
      cp = c & 0x0F;
    } else if ((c & 0xF8) == 0xF0) {
      len = 4;
      cp = c & 0x07;
    } else {
      return false;
    }

    if (i + len > n) {
      return false;
    }
    for (size_t k = 1; k < len; ++k) {
      unsigned char cc = static_cast<unsigned char>(str[i + k]);
      if ((cc & 0xC0) != 0x80) {
        return false;
      }
      cp = (cp << 6) | (cc & 0x3F);
    }

    // Overlong encodings, UTF-16 surrogates, out of range
    if ((len == 2 && cp < 0x80) || (len == 3 && cp < 0x800) ||
        (len == 4 && cp < 0x10000) || (cp >= 0xD800 && cp <= 0xDFFF) ||
        cp > 0x10FFFF) {
      return false;
    }
    i += len;
  }
  return true;
}

size_t Utf8Length(const std::string &str) {
  size_t count = 0;
  for (char ch : str) {
    if ((static_cast<unsigned char>(ch) & 0xC0) != 0x80) {
      ++count;
    }
  }
  return count;
}

std::optional<std::vector<std::string>>
SplitCommandLine(const std::string &line) {
  std::vector<std::string> args;
  std::string current;
  bool in_token = false;
  bool in_quotes = false;

  for (size_t i = 0; i < line.size(); ++i) {
    char c = line[i];
    if (in_quotes) {
      if (c == '\\' && i + 1 < line.size() &&
          (line[i + 1] == '"' || line[i + 1] == '\\')) {
        current += line[++i];
      } else if (c == '"') {
        in_quotes = false;
      } else {
        current += c;
      }
    } else if (c == '"') {
      in_quotes = true;
      in_token = true;
    } else if (std::isspace(static_cast<unsigned char>(c))) {
      if (in_token) {
        args.push_back(current);
        current.clear();
        in_token = false;
      }
    } else {
      current += c;
      in_token = true;
    }
  }

  if (in_quotes) {
    return std::nullopt;
  }
  if (in_token) {
    args.push_back(current);
  }
  return args;
}

} // namespace util
} // namespace notekeep
