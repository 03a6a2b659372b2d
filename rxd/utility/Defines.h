#pragma once

#include <cstddef>  // std::byte
#include <cstdint>
#include <sstream>
#include <string_view>

#include <Lightning/Lightning.h>

namespace rxd {

#define NO_DISCARD [[nodiscard]]

// Just rebrand the standard contract macros.
#define RXD_REQUIRE(condition, message) LL_REQUIRE(condition, message)
#define RXD_ASSERT(condition, message) LL_ASSERT(condition, message)
#define RXD_FAIL(message) LL_FAIL(message)

//! \brief Throw an exception of a specific type, with a message that is built by streaming.
#define RXD_THROW(exception_type, message)   \
  do {                                       \
    std::ostringstream _rxd_stream_;         \
    _rxd_stream_ << message;                 \
    throw exception_type(_rxd_stream_.str()); \
  } while (false)

//! \brief The datatype used to represent a byte offset into a dumped stream.
using offset_t = uint64_t;

//! \brief Smallest allowed line width or byte group length.
inline constexpr std::size_t kMinimumWidth = 1;

//! \brief Largest allowed line width or byte group length.
inline constexpr std::size_t kMaximumWidth = 256;

}  // namespace rxd

namespace std {

inline void format_logstream(const exception& ex, lightning::RefBundle& handler) {
  using namespace lightning;
  using namespace lightning::formatting;

  handler << NewLineIndent << AnsiColor8Bit(R"(""")", AnsiForegroundColor::Red)
          << AnsiColorSegment(AnsiForegroundColor::Yellow);  // Exception in yellow.
  const char* begin = ex.what();
  const char* end = ex.what();
  while (*end) {
    for (; *end && *end != '\n'; ++end)
      ;  // Find next newline.
    handler << NewLineIndent << string_view(begin, static_cast<string_view::size_type>(end - begin));
    for (; *end && *end == '\n'; ++end)
      ;  // Pass any number of newlines.
    begin = end;
  }
  handler << AnsiResetSegment << NewLineIndent  // Reset colors to default.
          << AnsiColor8Bit(R"(""")", AnsiForegroundColor::Red);
}

}  // namespace std
