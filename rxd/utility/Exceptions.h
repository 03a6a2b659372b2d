#pragma once

#include <stdexcept>
#include <string>

namespace rxd {

//! \brief Base class for every error the dump engine and its front end report.
class RxdError : public std::runtime_error {
public:
  explicit RxdError(const std::string& message)
      : std::runtime_error(message) {}
};

//! \brief A dump option was given a value outside its allowed range.
//!
//! Raised while the options are being built, so no byte of the source has been read yet.
class InvalidConfiguration : public RxdError {
public:
  using RxdError::RxdError;
};

//! \brief The byte source failed while a dump was reading from it.
//!
//! Lines that were already emitted stay emitted, the dump is not retried.
class SourceReadFailure : public RxdError {
public:
  using RxdError::RxdError;
};

//! \brief The input could not be opened. Only raised by callers that open their own sources.
class SourceUnavailable : public RxdError {
public:
  using RxdError::RxdError;
};

}  // namespace rxd
