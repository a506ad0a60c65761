#pragma once

#include <stdexcept>
#include <string>

namespace subalign {

// Base class for failures of one merge run.
class MergeError : public std::runtime_error {
  public:
    using std::runtime_error::runtime_error;
};

// Malformed or empty input track.
class InputError : public MergeError {
  public:
    using MergeError::MergeError;
};

// Embedding provider failed or broke its contract.
class ProviderError : public MergeError {
  public:
    using MergeError::MergeError;
};

// Raised when the caller sets the cancellation token. Not a MergeError.
class MergeCancelled : public std::runtime_error {
  public:
    MergeCancelled() : std::runtime_error("merge cancelled") {}
};

} // namespace subalign
