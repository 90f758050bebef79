#ifndef FEATURE_ACCUM_H
#define FEATURE_ACCUM_H

#include <string>

#include "fdict.h"
#include "sparse_vector.h"

// Collects the feature contributions of one feature function call.
// Values added for the same feature sum up.
class FeatureAccumulator {
 public:
  explicit FeatureAccumulator(SparseVector<double>* v) : v_(v) {}
  void Add(const std::string& name, double value) {
    Add(FD::Convert(name), value);
  }
  void Add(int fid, double value) {
    if (fid) v_->add_value(fid, value);
  }
  const SparseVector<double>& features() const { return *v_; }
 private:
  SparseVector<double>* v_;
};

#endif
