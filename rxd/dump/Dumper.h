#pragma once

#include <filesystem>
#include <functional>
#include <iosfwd>
#include <string>
#include <string_view>
#include <vector>

#include "rxd/dump/ByteSource.h"
#include "rxd/dump/DumpOptions.h"

namespace rxd {

//! \brief Receives each line of a dump, in order, without a trailing newline.
using LineSink = std::function<void(std::string_view)>;

//! \brief Reads a byte source chunk by chunk and turns it into the lines of a hex dump.
//!
//! Every dump starts with two header lines (a legend and a rule) followed by one line per chunk of
//! GetLineWidth() bytes. Only the last chunk may be shorter. If a line count is set, the dumper stops before
//! reading any byte past line_count * line_width.
//!
//! The byte source is only borrowed for the duration of a call to Dump, so one dumper can be used for any
//! number of sources.
class Dumper {
public:
  explicit Dumper(DumpOptions options = {});

  //! \brief Dump a source, passing each line to the sink as soon as it is formatted.
  //!
  //! \param source The source to read from. Read failures propagate as SourceReadFailure, after any lines that
  //!     were already passed to the sink.
  //! \param sink Receives the lines.
  //! \return The number of data lines, not counting the header.
  std::size_t Dump(ByteSource& source, const LineSink& sink);

  //! \brief Dump a source to an output stream, one line per row.
  std::size_t Dump(ByteSource& source, std::ostream& out);

  //! \brief Dump a source and collect all the lines, header included.
  NO_DISCARD std::vector<std::string> Lines(ByteSource& source);

  NO_DISCARD const DumpOptions& GetOptions() const noexcept { return options_; }

private:
  //! \brief Read from the source until the chunk buffer is full or the source is exhausted.
  //!
  //! Returns the number of bytes in the chunk.
  std::size_t fillChunk(ByteSource& source);

  DumpOptions options_;

  //! \brief Reusable buffer for one chunk, sized to the line width.
  std::vector<std::byte> chunk_;
};

//! \brief Read data from an input stream and write it as a hex dump to an output stream.
//!
//! \param in The input stream to read from.
//! \param hex_out The output stream to write the hex dump to.
//! \param options The options for the hex dump.
//! \return The number of data lines written.
std::size_t HexDump(std::istream& in, std::ostream& hex_out, const DumpOptions& options = {});

//! \brief Read data from a file and write it as a hex dump to an output stream.
//!
//! Throws SourceUnavailable if the file cannot be opened.
std::size_t HexDump(const std::filesystem::path& filepath, std::ostream& hex_out, const DumpOptions& options = {});

}  // namespace rxd
