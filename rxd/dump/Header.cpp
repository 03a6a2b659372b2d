#include "rxd/dump/Header.h"
// Other files.
#include <vector>

#include "rxd/dump/LineFormatter.h"

namespace rxd::formatting {

std::string FormatLegendLine(const DumpOptions& options) {
  const auto line_width = options.GetLineWidth();

  // Line widths never exceed 256, so every column index fits in a single byte.
  std::vector<std::byte> indices(line_width);
  for (std::size_t i = 0; i < line_width; ++i) {
    indices[i] = static_cast<std::byte>(i);
  }

  std::string line(kOffsetDigits, ' ');
  line.append(kColumnSeparator);
  AppendHexField(line, indices, options);
  line.append(kColumnSeparator);
  line.append(line_width, ' ');
  return line;
}

std::string FormatRuleLine(const DumpOptions& options) {
  const auto hex_width = HexFieldWidth(options.GetLineWidth(), options.GetByteGroupLength());

  // Each column is as wide as its contents plus the spaces on either side of the separators.
  std::string line(kOffsetDigits + 1, '-');
  line.push_back('+');
  line.append(hex_width + 2, '-');
  line.push_back('+');
  line.append(options.GetLineWidth() + 1, '-');
  return line;
}

}  // namespace rxd::formatting
