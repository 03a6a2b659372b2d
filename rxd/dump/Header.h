#pragma once

#include <string>

#include "rxd/dump/DumpOptions.h"

namespace rxd::formatting {

//! \brief Format the legend line, which labels every byte column of the hex column with its index in the line.
//!
//! The indices are grouped and padded the same way data is, so the legend lines up with every data line.
NO_DISCARD std::string FormatLegendLine(const DumpOptions& options);

//! \brief Format the rule line that separates the legend from the data, e.g. "---------+------...+-----".
NO_DISCARD std::string FormatRuleLine(const DumpOptions& options);

}  // namespace rxd::formatting
