#include "RenamerEngine.h"

#include <wx/string.h>

#include <algorithm>
#include <cctype>
#include <chrono>
#include <ctime>
#include <filesystem>
#include <iomanip>
#include <sstream>
#include <string>

namespace fs = std::filesystem;

// Converts string to lowercase
std::string ToLower(std::string s) {
  std::transform(s.begin(), s.end(), s.begin(),
                 [](unsigned char c) { return std::tolower(c); });
  return s;
}

// Formats the current time with a strftime-style 'format', in UTC or local
// time. Returns an empty string if the clock cannot be converted
std::string FormatTimestamp(const char *format, bool utc) {
  auto now = std::chrono::system_clock::now();
  auto now_c = std::chrono::system_clock::to_time_t(now);
  std::tm now_tm = {};
#ifdef _WIN32
  if ((utc ? gmtime_s(&now_tm, &now_c) : localtime_s(&now_tm, &now_c)) != 0) {
    return std::string();
  }
#else
  if ((utc ? gmtime_r(&now_c, &now_tm) : localtime_r(&now_c, &now_tm)) ==
      nullptr) {
    return std::string();
  }
#endif
  std::stringstream timestamp_ss;
  timestamp_ss << std::put_time(&now_tm, format);
  return timestamp_ss.fail() ? std::string() : timestamp_ss.str();
}

// Counts Unicode code points in a UTF-8 string by counting every byte that is
// not a continuation byte
std::size_t RenamerEngine::CountCodePoints(const std::string &utf8) {
  std::size_t count = 0;
  for (unsigned char c : utf8) {
    if ((c & 0xC0) != 0x80) {
      ++count;
    }
  }
  return count;
}

// Cuts 'utf8' to at most 'maxBytes' without splitting a multi-byte sequence
std::string RenamerEngine::TruncateUtf8(const std::string &utf8,
                                        std::size_t maxBytes) {
  if (utf8.size() <= maxBytes) {
    return utf8;
  }
  std::size_t cut = maxBytes;
  // Back up while the first excluded byte continues a sequence
  while (cut > 0 &&
         (static_cast<unsigned char>(utf8[cut]) & 0xC0) == 0x80) {
    --cut;
  }
  return utf8.substr(0, cut);
}

// Strips leading/trailing ASCII whitespace and dots
std::string RenamerEngine::TrimName(const std::string &s) {
  auto isTrimmed = [](unsigned char c) {
    return c == '.' || std::isspace(c) != 0;
  };
  std::size_t begin = 0;
  std::size_t end = s.size();
  while (begin < end && isTrimmed(static_cast<unsigned char>(s[begin]))) {
    ++begin;
  }
  while (end > begin && isTrimmed(static_cast<unsigned char>(s[end - 1]))) {
    --end;
  }
  return s.substr(begin, end - begin);
}

// Case-insensitive match of the path's extension (".PDF" matches ".pdf")
bool RenamerEngine::MatchesExtension(const fs::path &path,
                                     const std::string &extension) {
  if (extension.empty()) {
    return true;
  }
  std::string wanted = ToLower(extension);
  if (wanted[0] != '.') {
    wanted = "." + wanted; // Ensure leading dot for consistent matching
  }
  return ToLower(path.extension().string()) == wanted;
}

// Command line and config values are converted through UTF-8, never through
// the C locale, so non-ASCII directory names survive
fs::path PathFromWxString(const wxString &value) {
  const wxScopedCharBuffer utf8 = value.utf8_str();
  return fs::u8path(std::string(utf8.data(), utf8.length()));
}

wxString PathToWxString(const fs::path &path) {
  const std::string utf8 = path.u8string();
  return wxString::FromUTF8(utf8.data(), utf8.size());
}
