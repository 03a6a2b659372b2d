#include "rxd/dump/LineFormatter.h"

namespace rxd::formatting {

namespace {

constexpr const char* hex_digits = "0123456789abcdef";

//! First code point of the Unicode Control Pictures block, U+2400 SYMBOL FOR NULL.
constexpr uint32_t control_pictures_base = 0x2400;

void appendUtf8(std::string& out, uint32_t code_point) {
  // Only the BMP is needed, the control pictures are all three byte sequences.
  RXD_REQUIRE(0x800 <= code_point && code_point <= 0xFFFF, "code point out of range for a three byte sequence");
  out.push_back(static_cast<char>(0xE0 | (code_point >> 12)));
  out.push_back(static_cast<char>(0x80 | ((code_point >> 6) & 0x3F)));
  out.push_back(static_cast<char>(0x80 | (code_point & 0x3F)));
}

}  // namespace

void FormatHexByte(char* begin, const char* end, std::byte x) {
  RXD_REQUIRE(2 <= end - begin, "buffer too small");
  auto value = std::to_integer<unsigned>(x);
  begin[0] = hex_digits[value >> 4];
  begin[1] = hex_digits[value & 0xF];
}

std::size_t HexFieldWidth(std::size_t line_width, std::size_t byte_group_length) noexcept {
  return ((2 * byte_group_length + 1) * line_width - 1) / byte_group_length;
}

void AppendOffset(std::string& out, offset_t offset) {
  // A 64 bit offset needs at most 16 digits.
  char buffer[16];
  std::size_t num_digits = 0;
  do {
    buffer[num_digits++] = hex_digits[offset & 0xF];
    offset >>= 4;
  } while (offset != 0);

  if (num_digits < kOffsetDigits) {
    out.append(kOffsetDigits - num_digits, '0');
  }
  for (auto i = num_digits; 0 < i; --i) {
    out.push_back(buffer[i - 1]);
  }
}

void AppendHexField(std::string& out, std::span<const std::byte> chunk, const DumpOptions& options) {
  const auto line_width = options.GetLineWidth();
  const auto group_length = options.GetByteGroupLength();
  RXD_REQUIRE(chunk.size() <= line_width,
              "chunk of " << chunk.size() << " bytes does not fit in a line of " << line_width << " bytes");

  const auto start = out.size();
  char buffer[2];
  for (std::size_t i = 0; i < chunk.size(); ++i) {
    // Separate groups with a single space.
    if (i != 0 && i % group_length == 0) {
      out.push_back(' ');
    }
    FormatHexByte(buffer, buffer + 2, chunk[i]);
    out.append(buffer, 2);
  }

  // Pad out to the width of a full line so the character column always starts in the same place.
  const auto width = HexFieldWidth(line_width, group_length);
  const auto written = out.size() - start;
  if (written < width) {
    out.append(width - written, ' ');
  }
}

void AppendCharacter(std::string& out, std::byte x, bool control_pictures) {
  auto value = std::to_integer<uint32_t>(x);
  if (value < 0x20) {
    if (control_pictures) {
      appendUtf8(out, control_pictures_base + value);
    }
    else {
      out.push_back('.');
    }
  }
  else if (value < 0x7F) {
    out.push_back(static_cast<char>(value));
  }
  else {
    out.push_back('.');
  }
}

void AppendCharacterField(std::string& out, std::span<const std::byte> chunk, bool control_pictures) {
  for (auto x : chunk) {
    AppendCharacter(out, x, control_pictures);
  }
}

std::string FormatLine(offset_t offset, std::span<const std::byte> chunk, const DumpOptions& options) {
  std::string line;
  line.reserve(kOffsetDigits + 2 * kColumnSeparator.size()
               + HexFieldWidth(options.GetLineWidth(), options.GetByteGroupLength())
               + 3 * chunk.size());

  AppendOffset(line, offset);
  line.append(kColumnSeparator);
  AppendHexField(line, chunk, options);
  line.append(kColumnSeparator);
  AppendCharacterField(line, chunk, options.GetControlPictures());
  return line;
}

}  // namespace rxd::formatting
