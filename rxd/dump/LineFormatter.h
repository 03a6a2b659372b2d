#pragma once

#include <span>
#include <string>
#include <string_view>

#include "rxd/dump/DumpOptions.h"

namespace rxd::formatting {

//! \brief Separator written between the offset, hex, and character columns.
inline constexpr std::string_view kColumnSeparator = " | ";

//! \brief Minimum number of hex digits used to write a chunk offset.
inline constexpr std::size_t kOffsetDigits = 8;

//! \brief Format a byte as two lowercase hex digits, writing to a provided buffer.
//!
//! \param begin The beginning of the buffer to write to.
//! \param end The end of the buffer to write to. The buffer must hold at least two characters.
//! \param x The byte to format.
void FormatHexByte(char* begin, const char* end, std::byte x);

//! \brief Get the width, in characters, of the hex column for a given line width and byte group length.
//!
//! This is the width of a full line: every group written, with one space between groups.
NO_DISCARD std::size_t HexFieldWidth(std::size_t line_width, std::size_t byte_group_length) noexcept;

//! \brief Append an offset as lowercase hex, zero padded to kOffsetDigits digits.
void AppendOffset(std::string& out, offset_t offset);

//! \brief Append the hex column for a chunk, padded with spaces to the full width of the column.
//!
//! The bytes are grouped starting at the first byte of the chunk. The chunk may be shorter than a line, but not
//! longer.
void AppendHexField(std::string& out, std::span<const std::byte> chunk, const DumpOptions& options);

//! \brief Append the display character for a single byte.
//!
//! Printable ASCII is written as is. C0 control codes are written as '.', or as the UTF-8 encoding of the
//! matching Control Pictures glyph (U+2400 + byte) if control_pictures is set. Anything else is written as '.'.
void AppendCharacter(std::string& out, std::byte x, bool control_pictures);

//! \brief Append the character column for a chunk. There is no padding for short chunks.
void AppendCharacterField(std::string& out, std::span<const std::byte> chunk, bool control_pictures);

//! \brief Format one data line: offset, hex column, and character column.
NO_DISCARD std::string FormatLine(offset_t offset, std::span<const std::byte> chunk, const DumpOptions& options);

}  // namespace rxd::formatting
