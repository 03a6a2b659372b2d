#include "rxd/dump/DumpOptions.h"
// Other files.
#include <limits>

#include "rxd/utility/Exceptions.h"

namespace rxd {

namespace {

void checkWidth(const char* name, std::size_t value) {
  if (value < kMinimumWidth || kMaximumWidth < value) {
    RXD_THROW(InvalidConfiguration,
              name << " must be between " << kMinimumWidth << " and " << kMaximumWidth << ", got "
                   << value);
  }
}

}  // namespace

DumpOptions& DumpOptions::SetControlPictures(bool control_pictures) noexcept {
  control_pictures_ = control_pictures;
  return *this;
}

DumpOptions& DumpOptions::SetLineCount(std::optional<std::size_t> line_count) noexcept {
  line_count_ = line_count;
  return *this;
}

DumpOptions& DumpOptions::SetLineWidth(std::size_t line_width) {
  checkWidth("line width", line_width);
  line_width_ = line_width;
  return *this;
}

DumpOptions& DumpOptions::SetByteGroupLength(std::size_t byte_group_length) {
  checkWidth("byte group length", byte_group_length);
  byte_group_length_ = byte_group_length;
  return *this;
}

std::optional<offset_t> DumpOptions::GetByteLimit() const noexcept {
  if (!line_count_) {
    return {};
  }
  // Saturate, a cap too large to express in bytes cannot be reached by any source.
  constexpr auto max_offset = std::numeric_limits<offset_t>::max();
  if (max_offset / line_width_ < *line_count_) {
    return max_offset;
  }
  return static_cast<offset_t>(*line_count_) * line_width_;
}

}  // namespace rxd
