#ifndef _FFSET_H_
#define _FFSET_H_

#include <cstdint>
#include <vector>

#include "weights.h"

namespace HG { struct Edge; struct Node; }
class Hypergraph;
class FeatureFunction;
class SentenceMetadata;
class TRule;

// concatenation of the state slices of all stateful feature functions;
// compared byte-wise
typedef std::vector<uint8_t> FFState;

// this class is a set of FeatureFunctions that can be used to score
// a translation forest
class ModelSet {
 public:
  ModelSet(const std::vector<weight_t>& weights,
           const std::vector<const FeatureFunction*>& models);

  // adds the rule features and the features of every model to
  // edge->feature_values_ and sets edge->transition_score_.
  // NOTE: edge need not be in hg.edges_ but its TAIL nodes must be
  // (the tail states are read from them).
  void AddFeaturesToEdge(const SentenceMetadata& smeta,
                         const Hypergraph& hg,
                         HG::Edge* edge,
                         FFState* residual_context,
                         double* future_cost_estimate = NULL) const;

  // this is called INSTEAD of above when the head of edge is the goal
  // (edge must have a single tail, whose state is residual_context)
  void AddFinalFeatures(const FFState& residual_context,
                        HG::Edge* edge,
                        const SentenceMetadata& smeta) const;

  // weights . (rule features + every model's EstimateCost)
  double EstimateRuleScore(const TRule& rule) const;

  double Score(const SparseVector<double>& features) const {
    return features.dot(weights_);
  }

  const std::vector<weight_t>& weights() const { return weights_; }
  bool empty() const { return models_.empty(); }
  bool stateless() const { return !state_size_; }
  int state_size() const { return state_size_; }

 private:
  std::vector<const FeatureFunction*> models_;
  const std::vector<weight_t>& weights_;
  int state_size_;
  std::vector<int> model_state_pos_;
};

#endif
