#pragma once

#include "bounded_cache/types.hpp"

#include <cstddef>
#include <memory>
#include <string>

namespace bounded_cache {

// Approximates the retained size of a payload. Called once per set, before
// the cache lock is taken, so implementations must be pure.
class ISizeEstimator {
public:
  virtual ~ISizeEstimator() = default;
  virtual std::string name() const = 0;
  virtual std::size_t estimate(const Value &value) const = 0;
};

// "payload": byte length of the stored payload.
// "utf16": twice the payload length, for payloads holding serialized text
// that a host keeps in a two-byte string encoding.
// Returns nullptr for an unknown name.
std::unique_ptr<ISizeEstimator> make_estimator_by_name(const std::string &name);

} // namespace bounded_cache
