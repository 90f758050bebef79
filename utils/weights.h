#ifndef _WEIGHTS_H_
#define _WEIGHTS_H_

#include <iostream>
#include <string>
#include <vector>
#include "sparse_vector.h"

typedef double weight_t;

class Weights {
 public:
  // text format: one "FeatureName value" (or "FeatureName=value") per line,
  // '#' starts a comment line
  static void InitFromFile(const std::string& fname,
                           std::vector<weight_t>* weights,
                           std::vector<std::string>* feature_list = NULL);
  static void InitFromStream(std::istream* in,
                             std::vector<weight_t>* weights,
                             std::vector<std::string>* feature_list = NULL);
  static void InitSparseVector(const std::vector<weight_t>& dv,
                               SparseVector<weight_t>* sv);
  // check for infinities, NaNs, etc
  static void SanityCheck(const std::vector<weight_t>& w);
  static std::string GetString(const std::vector<weight_t>& w,
                               bool hide_zero_value_features = true);
  // "name=value name2=value2"
  static void UpdateFromString(const std::string& w_string,
                               std::vector<weight_t>& w);
 private:
  Weights();
};

#endif
