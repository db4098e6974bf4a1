#ifndef IO_HPP
#define IO_HPP

#include <charconv>
#include <iosfwd>
#include <iostream>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "Model.hpp"

namespace IO {

// Read a whole file; throws if it cannot be opened
std::string readFile(const std::string& path);

// ------------------------------
// Text helpers shared by the puzzle parsers. All views returned point into
// the caller's string.
// ------------------------------
std::string_view trim(std::string_view s);

// Split on '\n', dropping a trailing '\r' and the final empty line
std::vector<std::string_view> lines(std::string_view text);

// Split on any of the delimiter characters; keeps empty fields
std::vector<std::string_view> split(std::string_view text,
                                    std::string_view delims);

// Split on runs of whitespace; never yields empty fields
std::vector<std::string_view> words(std::string_view text);

// Split at the first occurrence of delim; throws if absent
std::pair<std::string_view, std::string_view> splitOnce(std::string_view text,
                                                         std::string_view delim);

// Sections separated by blank lines
std::vector<std::string_view> splitBlocks(std::string_view text);

// Remove a required prefix; throws if absent
std::string_view stripPrefix(std::string_view s, std::string_view prefix);

template <typename T>
T parseInt(std::string_view s) {
  s = trim(s);
  // from_chars rejects a leading '+', which never appears in puzzle inputs
  T value{};
  auto res = std::from_chars(s.data(), s.data() + s.size(), value);
  if (s.empty() || res.ec != std::errc() || res.ptr != s.data() + s.size())
    throw std::runtime_error("Invalid number: '" + std::string(s) + "'");
  return value;
}

// Whitespace separated numbers
template <typename T>
std::vector<T> parseNumbers(std::string_view s) {
  std::vector<T> out;
  for (std::string_view w : words(s)) out.push_back(parseInt<T>(w));
  return out;
}

// Buffered writer for puzzle answers
class Endpoint {
 private:
  std::ostream* out_{nullptr};
  std::string outBuf_;
  static constexpr size_t kFlushThreshold_ = 1 << 16;
  void flushOut();

 public:
  explicit Endpoint(std::ostream& out);
  ~Endpoint();

  // "Part N: <label>: <value>"
  void write(const Model::Answer& answer);
  void write(const std::vector<Model::Answer>& answers);

  // Free-form line
  void note(std::string_view line);

  void flush();
};
};  // namespace IO

#endif
