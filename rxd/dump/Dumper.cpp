#include "rxd/dump/Dumper.h"
// Other files.
#include <cerrno>
#include <cstring>
#include <fstream>
#include <ostream>

#include "rxd/dump/Header.h"
#include "rxd/dump/LineFormatter.h"
#include "rxd/utility/Exceptions.h"

namespace rxd {

Dumper::Dumper(DumpOptions options)
    : options_(options)
    , chunk_(options.GetLineWidth()) {}

std::size_t Dumper::Dump(ByteSource& source, const LineSink& sink) {
  LOG_SEV(Debug) << "Starting dump with options " << options_ << ".";

  sink(formatting::FormatLegendLine(options_));
  sink(formatting::FormatRuleLine(options_));

  const auto byte_limit = options_.GetByteLimit();
  offset_t chunk_offset = 0;
  std::size_t num_lines = 0;
  for (;;) {
    // Check the cap before reading, so nothing past the last requested line is ever read.
    if (byte_limit && *byte_limit <= chunk_offset) {
      LOG_SEV(Debug) << "Reached the line count of " << *options_.GetLineCount() << ", stopping.";
      break;
    }

    auto chunk_size = fillChunk(source);
    if (chunk_size == 0) {
      LOG_SEV(Debug) << "Reached the end of the source after " << num_lines << " lines.";
      break;
    }
    LOG_SEV(Trace) << "Read chunk of " << chunk_size << " bytes at offset " << chunk_offset << ".";

    sink(formatting::FormatLine(chunk_offset, std::span(chunk_.data(), chunk_size), options_));
    ++num_lines;
    // Short chunks only happen at the end of the source, so always advance by a full line.
    chunk_offset += options_.GetLineWidth();
  }
  return num_lines;
}

std::size_t Dumper::Dump(ByteSource& source, std::ostream& out) {
  return Dump(source, [&out](std::string_view line) { out << line << '\n'; });
}

std::vector<std::string> Dumper::Lines(ByteSource& source) {
  std::vector<std::string> lines;
  Dump(source, [&lines](std::string_view line) { lines.emplace_back(line); });
  return lines;
}

std::size_t Dumper::fillChunk(ByteSource& source) {
  std::size_t filled = 0;
  while (filled < chunk_.size()) {
    auto count = source.Read(std::span(chunk_).subspan(filled));
    if (count == 0) {
      break;
    }
    RXD_ASSERT(filled + count <= chunk_.size(), "byte source wrote past the end of the buffer");
    filled += count;
  }
  return filled;
}

std::size_t HexDump(std::istream& in, std::ostream& hex_out, const DumpOptions& options) {
  StreamByteSource source(in);
  Dumper dumper(options);
  auto num_lines = dumper.Dump(source, hex_out);
  // Flush.
  hex_out << std::flush;
  return num_lines;
}

std::size_t HexDump(const std::filesystem::path& filepath, std::ostream& hex_out, const DumpOptions& options) {
  std::ifstream in(filepath, std::ios::binary);
  if (in.fail()) {
    RXD_THROW(SourceUnavailable, "could not read file " << filepath.string() << ": " << std::strerror(errno));
  }
  LOG_SEV(Debug) << "Opened file " << filepath.string() << " for dumping.";
  return HexDump(in, hex_out, options);
}

}  // namespace rxd
