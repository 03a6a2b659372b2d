#include "rxd/dump/ByteSource.h"
// Other files.
#include <algorithm>
#include <cstring>

#include "rxd/utility/Exceptions.h"

namespace rxd {

std::size_t StreamByteSource::Read(std::span<std::byte> buffer) {
  if (buffer.empty() || in_.eof()) {
    return 0;
  }
  if (in_.bad()) {
    RXD_THROW(SourceReadFailure, "input stream is in a bad state");
  }
  in_.read(reinterpret_cast<char*>(buffer.data()), static_cast<std::streamsize>(buffer.size()));
  if (in_.bad()) {
    RXD_THROW(SourceReadFailure, "failed to read from input stream");
  }
  // Hitting the end of the stream sets the fail bit too, which is fine, gcount says how much was read.
  return static_cast<std::size_t>(in_.gcount());
}

std::size_t MemoryByteSource::Read(std::span<std::byte> buffer) {
  auto count = std::min(buffer.size(), GetRemaining());
  if (count != 0) {
    std::memcpy(buffer.data(), data_.data() + position_, count);
    position_ += count;
  }
  return count;
}

}  // namespace rxd
