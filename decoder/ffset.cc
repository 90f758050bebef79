#include "ffset.h"

#include <cstring>

#include "ff.h"
#include "feature_accum.h"
#include "hg.h"
#include "trule.h"

using namespace std;

ModelSet::ModelSet(const vector<weight_t>& w, const vector<const FeatureFunction*>& models) :
    models_(models),
    weights_(w),
    state_size_(0),
    model_state_pos_(models.size()) {
  for (unsigned i = 0; i < models_.size(); ++i) {
    model_state_pos_[i] = state_size_;
    state_size_ += models_[i]->StateSize();
  }
}

void ModelSet::AddFeaturesToEdge(const SentenceMetadata& smeta,
                                 const Hypergraph& hg,
                                 HG::Edge* edge,
                                 FFState* context,
                                 double* future_cost_estimate) const {
  context->resize(state_size_);
  if (state_size_ > 0) {
    memset(&(*context)[0], 0, state_size_);
  }
  edge->feature_values_ += edge->rule_->GetFeatureValues();
  FeatureAccumulator features(&edge->feature_values_);
  SparseVector<double> est_vals;  // only used if future_cost_estimate is non-NULL
  FeatureAccumulator estimated(&est_vals);
  vector<const void*> ants(edge->tail_nodes_.size());
  for (unsigned i = 0; i < models_.size(); ++i) {
    const FeatureFunction& ff = *models_[i];
    void* cur_ff_context = NULL;
    if (ff.StateSize() > 0) {
      const int spos = model_state_pos_[i];
      cur_ff_context = &(*context)[spos];
      for (unsigned k = 0; k < ants.size(); ++k)
        ants[k] = &hg.nodes_[edge->tail_nodes_[k]].state_[spos];
    } else {
      fill(ants.begin(), ants.end(), static_cast<const void*>(NULL));
    }
    ff.TraversalFeatures(smeta, *edge, ants, &features, &estimated, cur_ff_context);
    if (future_cost_estimate)
      ff.EstimateFutureCost(*edge->rule_, cur_ff_context, smeta, &estimated);
  }
  if (future_cost_estimate)
    *future_cost_estimate = est_vals.dot(weights_);
  edge->transition_score_ = edge->feature_values_.dot(weights_);
}

void ModelSet::AddFinalFeatures(const FFState& state, HG::Edge* edge, const SentenceMetadata& smeta) const {
  FeatureAccumulator features(&edge->feature_values_);
  for (unsigned i = 0; i < models_.size(); ++i) {
    const FeatureFunction& ff = *models_[i];
    const void* ant_state = NULL;
    if (ff.StateSize() > 0)
      ant_state = &state[model_state_pos_[i]];
    ff.FinalTraversalFeatures(smeta, ant_state, &features);
  }
  edge->transition_score_ = edge->feature_values_.dot(weights_);
}

double ModelSet::EstimateRuleScore(const TRule& rule) const {
  SparseVector<double> est = rule.GetFeatureValues();
  FeatureAccumulator acc(&est);
  for (unsigned i = 0; i < models_.size(); ++i)
    models_[i]->EstimateCost(rule, &acc);
  return est.dot(weights_);
}
