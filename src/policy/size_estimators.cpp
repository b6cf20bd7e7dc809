#include "bounded_cache/size_estimator.hpp"

namespace bounded_cache {
namespace {

class PayloadSizeEstimator final : public ISizeEstimator {
public:
  std::string name() const override { return "payload"; }
  std::size_t estimate(const Value &value) const override {
    return value.size();
  }
};

class Utf16WidthEstimator final : public ISizeEstimator {
public:
  std::string name() const override { return "utf16"; }
  std::size_t estimate(const Value &value) const override {
    return value.size() * 2;
  }
};

} // namespace

std::unique_ptr<ISizeEstimator>
make_estimator_by_name(const std::string &name) {
  if (name == "payload")
    return std::make_unique<PayloadSizeEstimator>();
  if (name == "utf16")
    return std::make_unique<Utf16WidthEstimator>();
  return nullptr;
}

} // namespace bounded_cache
