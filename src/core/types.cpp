#include "core/types.hpp"

#include <ctime>
#include <iomanip>
#include <sstream>

namespace termctl {

std::string to_string(ErrorCode code) {
  switch (code) {
    case ErrorCode::ShellUnavailable:
      return "ShellUnavailable";
    case ErrorCode::SpawnFailed:
      return "SpawnFailed";
    case ErrorCode::NotFound:
      return "NotFound";
    case ErrorCode::NotADirectory:
      return "NotADirectory";
    case ErrorCode::NotAFile:
      return "NotAFile";
    case ErrorCode::OutOfRange:
      return "OutOfRange";
    case ErrorCode::PermissionDenied:
      return "PermissionDenied";
    case ErrorCode::UnknownTool:
      return "UnknownTool";
    case ErrorCode::InvalidArgument:
      return "InvalidArgument";
    case ErrorCode::IoError:
      return "IoError";
    case ErrorCode::Internal:
      return "Internal";
  }
  return "Internal";
}

std::string format_timestamp(const Timestamp &ts) {
  auto time = std::chrono::system_clock::to_time_t(ts);
  auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(ts.time_since_epoch()).count() % 1000;

  std::tm tm_buf{};
#ifdef _WIN32
  localtime_s(&tm_buf, &time);
#else
  localtime_r(&time, &tm_buf);
#endif

  std::ostringstream ss;
  ss << std::put_time(&tm_buf, "%Y-%m-%dT%H:%M:%S") << '.' << std::setw(3) << std::setfill('0') << ms;
  return ss.str();
}

std::string sanitize_utf8(const std::string &input) {
  static const char kReplacement[] = "\xEF\xBF\xBD";  // U+FFFD

  auto byte_at = [&input](size_t i) {
    return static_cast<unsigned char>(input[i]);
  };
  auto is_continuation = [&](size_t i) {
    return i < input.size() && (byte_at(i) & 0xC0) == 0x80;
  };

  std::string output;
  output.reserve(input.size());

  size_t i = 0;
  while (i < input.size()) {
    unsigned char c = byte_at(i);

    size_t len = 0;
    uint32_t cp = 0;
    uint32_t min_cp = 0;
    if (c <= 0x7F) {
      output.push_back(static_cast<char>(c));
      i++;
      continue;
    } else if ((c & 0xE0) == 0xC0) {
      len = 2;
      cp = c & 0x1F;
      min_cp = 0x80;
    } else if ((c & 0xF0) == 0xE0) {
      len = 3;
      cp = c & 0x0F;
      min_cp = 0x800;
    } else if ((c & 0xF8) == 0xF0) {
      len = 4;
      cp = c & 0x07;
      min_cp = 0x10000;
    } else {
      // Invalid leading byte
      output.append(kReplacement);
      i++;
      continue;
    }

    bool complete = true;
    for (size_t k = 1; k < len; ++k) {
      if (!is_continuation(i + k)) {
        complete = false;
        break;
      }
      cp = (cp << 6) | (byte_at(i + k) & 0x3F);
    }

    if (!complete) {
      output.append(kReplacement);
      i++;
      continue;
    }

    // Reject overlong encodings, surrogates and out-of-range code points
    bool valid = cp >= min_cp && cp <= 0x10FFFF && (cp < 0xD800 || cp > 0xDFFF);
    if (valid) {
      output.append(input, i, len);
    } else {
      output.append(kReplacement);
    }
    i += len;
  }

  return output;
}

}  // namespace termctl
