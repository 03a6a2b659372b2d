#pragma once

#include <istream>
#include <span>

#include "rxd/utility/Defines.h"

namespace rxd {

//! \brief A sequential, forward-only source of bytes.
//!
//! A source is borrowed by whoever reads from it. It is never opened, closed, or repositioned by a reader.
class ByteSource {
public:
  virtual ~ByteSource() = default;

  //! \brief Read up to buffer.size() bytes into the front of the buffer.
  //!
  //! Returns the number of bytes written. Zero means the source is exhausted. A source may return fewer
  //! bytes than requested before it is exhausted. Throws SourceReadFailure if the underlying source fails.
  NO_DISCARD virtual std::size_t Read(std::span<std::byte> buffer) = 0;
};

//! \brief Byte source that reads from an input stream, e.g. a file opened in binary mode.
class StreamByteSource : public ByteSource {
public:
  explicit StreamByteSource(std::istream& in)
      : in_(in) {}

  NO_DISCARD std::size_t Read(std::span<std::byte> buffer) override;

private:
  std::istream& in_;
};

//! \brief Byte source over a region of memory that outlives the source.
class MemoryByteSource : public ByteSource {
public:
  explicit MemoryByteSource(std::span<const std::byte> data)
      : data_(data) {}

  NO_DISCARD std::size_t Read(std::span<std::byte> buffer) override;

  //! \brief Get the number of bytes that have not been read yet.
  NO_DISCARD std::size_t GetRemaining() const noexcept { return data_.size() - position_; }

private:
  std::span<const std::byte> data_;
  std::size_t position_ = 0;
};

}  // namespace rxd
