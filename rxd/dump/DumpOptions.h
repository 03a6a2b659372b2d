#pragma once

#include <optional>

#include "rxd/utility/Defines.h"

namespace rxd {

//! \brief Layout options for a dump.
//!
//! The setters validate their argument and return the options object, so a full set of options can be
//! built in one chained expression:
//!
//!   auto options = DumpOptions {}.SetLineWidth(8).SetByteGroupLength(2).SetControlPictures(true);
//!
//! A width or group length outside [kMinimumWidth, kMaximumWidth] throws InvalidConfiguration.
class DumpOptions {
public:
  //! \brief Whether to render C0 control codes as Unicode Control Pictures glyphs instead of '.'.
  DumpOptions& SetControlPictures(bool control_pictures) noexcept;

  //! \brief Cap the number of data lines. An empty optional means no cap.
  DumpOptions& SetLineCount(std::optional<std::size_t> line_count) noexcept;

  //! \brief Set the number of bytes shown per line.
  DumpOptions& SetLineWidth(std::size_t line_width);

  //! \brief Set the number of bytes written together, without a space, in the hex column.
  DumpOptions& SetByteGroupLength(std::size_t byte_group_length);

  NO_DISCARD bool GetControlPictures() const noexcept { return control_pictures_; }
  NO_DISCARD std::optional<std::size_t> GetLineCount() const noexcept { return line_count_; }
  NO_DISCARD std::size_t GetLineWidth() const noexcept { return line_width_; }
  NO_DISCARD std::size_t GetByteGroupLength() const noexcept { return byte_group_length_; }

  //! \brief The number of source bytes a dump with these options may read, or nullopt if unbounded.
  NO_DISCARD std::optional<offset_t> GetByteLimit() const noexcept;

private:
  bool control_pictures_ = false;
  std::optional<std::size_t> line_count_ {};
  std::size_t line_width_ = 16;
  std::size_t byte_group_length_ = 1;
};

//! \brief Write the options to a lightning log record.
inline void format_logstream(const DumpOptions& options, lightning::RefBundle& handler) {
  handler << "{ line width: " << options.GetLineWidth() << ", group length: " << options.GetByteGroupLength()
          << ", line count: ";
  if (auto line_count = options.GetLineCount()) {
    handler << *line_count;
  }
  else {
    handler << "unlimited";
  }
  handler << ", control pictures: " << (options.GetControlPictures() ? "on" : "off") << " }";
}

}  // namespace rxd
