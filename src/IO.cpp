#include "../include/IO.hpp"

#include <cctype>
#include <fstream>
#include <sstream>

using namespace IO;

namespace {
inline bool isSpace(char c) {
  return std::isspace(static_cast<unsigned char>(c)) != 0;
}
}  // namespace

std::string IO::readFile(const std::string& path) {
  std::ifstream f(path, std::ios::binary);
  if (!f) throw std::runtime_error("Failed to open: " + path);
  std::ostringstream ss;
  ss << f.rdbuf();
  return ss.str();
}

std::string_view IO::trim(std::string_view s) {
  size_t i = 0;
  while (i < s.size() && isSpace(s[i])) ++i;
  s.remove_prefix(i);
  size_t n = s.size();
  while (n > 0 && isSpace(s[n - 1])) --n;
  return s.substr(0, n);
}

std::vector<std::string_view> IO::lines(std::string_view text) {
  std::vector<std::string_view> out;
  size_t pos = 0;
  while (pos < text.size()) {
    size_t end = text.find('\n', pos);
    if (end == std::string_view::npos) end = text.size();
    std::string_view line = text.substr(pos, end - pos);
    if (!line.empty() && line.back() == '\r') line.remove_suffix(1);  // CRLF
    out.push_back(line);
    pos = end + 1;
  }
  return out;
}

std::vector<std::string_view> IO::split(std::string_view text,
                                        std::string_view delims) {
  std::vector<std::string_view> out;
  size_t start = 0;
  for (;;) {
    size_t end = text.find_first_of(delims, start);
    if (end == std::string_view::npos) {
      out.push_back(text.substr(start));
      return out;
    }
    out.push_back(text.substr(start, end - start));
    start = end + 1;
  }
}

std::vector<std::string_view> IO::words(std::string_view text) {
  std::vector<std::string_view> out;
  size_t i = 0;
  while (i < text.size()) {
    while (i < text.size() && isSpace(text[i])) ++i;
    size_t j = i;
    while (j < text.size() && !isSpace(text[j])) ++j;
    if (j > i) out.push_back(text.substr(i, j - i));
    i = j;
  }
  return out;
}

std::pair<std::string_view, std::string_view> IO::splitOnce(
    std::string_view text, std::string_view delim) {
  size_t pos = text.find(delim);
  if (pos == std::string_view::npos)
    throw std::runtime_error("Missing '" + std::string(delim) + "' in: " +
                             std::string(text));
  return {text.substr(0, pos), text.substr(pos + delim.size())};
}

std::vector<std::string_view> IO::splitBlocks(std::string_view text) {
  std::vector<std::string_view> out;
  std::vector<std::string_view> all = lines(text);

  // Views cover [first line, last line] of each run of non-blank lines
  size_t i = 0;
  while (i < all.size()) {
    while (i < all.size() && trim(all[i]).empty()) ++i;
    if (i == all.size()) break;
    const char* begin = all[i].data();
    const char* end = begin;
    while (i < all.size() && !trim(all[i]).empty()) {
      end = all[i].data() + all[i].size();
      ++i;
    }
    out.emplace_back(begin, static_cast<size_t>(end - begin));
  }
  return out;
}

std::string_view IO::stripPrefix(std::string_view s, std::string_view prefix) {
  if (s.substr(0, prefix.size()) != prefix)
    throw std::runtime_error("Expected '" + std::string(prefix) +
                             "' at: " + std::string(s));
  s.remove_prefix(prefix.size());
  return s;
}

Endpoint::Endpoint(std::ostream& out) : out_(&out) {}

Endpoint::~Endpoint() { flushOut(); }

void Endpoint::write(const Model::Answer& answer) {
  char tmp[24];
  auto res = std::to_chars(tmp, tmp + sizeof(tmp), answer.value);
  if (res.ec != std::errc()) throw std::runtime_error("to_chars failed");

  outBuf_.append("Part ");
  outBuf_.append(std::to_string(answer.part));
  outBuf_.append(": ");
  outBuf_.append(answer.label);
  outBuf_.append(": ");
  outBuf_.append(tmp, static_cast<size_t>(res.ptr - tmp));
  outBuf_.push_back('\n');

  if (outBuf_.size() >= kFlushThreshold_) flushOut();
}

void Endpoint::write(const std::vector<Model::Answer>& answers) {
  for (const auto& a : answers) write(a);
}

void Endpoint::note(std::string_view line) {
  outBuf_.append(line);
  outBuf_.push_back('\n');
  if (outBuf_.size() >= kFlushThreshold_) flushOut();
}

void Endpoint::flush() { flushOut(); }

void Endpoint::flushOut() {
  if (!outBuf_.empty()) {
    out_->write(outBuf_.data(), static_cast<std::streamsize>(outBuf_.size()));
    out_->flush();
    outBuf_.clear();
  }
}
