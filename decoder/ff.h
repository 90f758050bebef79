#ifndef FF_H_
#define FF_H_

#include <string>
#include <vector>

#include "feature_accum.h"
#include "sparse_vector.h"

namespace HG { struct Edge; struct Node; }
class Hypergraph;
class SentenceMetadata;
class TRule;

// if you want to develop a new feature, inherit from this class and
// override TraversalFeaturesImpl(...).  If it's a feature that returns /
// depends on context, you may also need to implement
// FinalTraversalFeatures(...)
//
// Feature functions are shared by every sentence decoded concurrently, so
// all scoring methods are const and must not modify the object.
class FeatureFunction {
 public:
  std::string name_; // set by FF factory using usage()
  FeatureFunction() : state_size_() {}
  explicit FeatureFunction(int state_size) : state_size_(state_size) {}
  virtual ~FeatureFunction();
  bool IsStateful() const { return state_size_ > 0; }
  int StateSize() const { return state_size_; }

  // override this.  not virtual because we want to expose this to factory template for help before creating a FF
  static std::string usage(bool show_params,bool show_details) {
    return usage_helper("FIXME_feature_needs_name","[no parameters]","[no documentation yet]",show_params,show_details);
  }
  static std::string usage_helper(std::string const& name,std::string const& params,std::string const& details,bool show_params,bool show_details);

  // Compute the feature values of an edge and (if this applies) the estimates
  // of the feature values when this edge is incorporated into a larger context.
  // The rule, the tail nodes and the span are those of the edge; ant_contexts
  // holds the states of the tail nodes, in tail order.
  inline void TraversalFeatures(const SentenceMetadata& smeta,
                                const HG::Edge& edge,
                                const std::vector<const void*>& ant_contexts,
                                FeatureAccumulator* features,
                                FeatureAccumulator* estimated_features,
                                void* out_state) const {
    TraversalFeaturesImpl(smeta, edge, ant_contexts,
                          features, estimated_features, out_state);
  }

  // if there's some state left when you transition to the goal state, score
  // it here.  For example, a language model might the cost of adding
  // <s> and </s>.
  virtual void FinalTraversalFeatures(const SentenceMetadata& smeta,
                                      const void* residual_state,
                                      FeatureAccumulator* final_features) const;

  // context free estimate of what this function will contribute to any edge
  // built from rule; used to order grammar rules before search
  virtual void EstimateCost(const TRule& rule,
                            FeatureAccumulator* estimated_features) const;

  // estimate of what this function will still contribute once a node with
  // state is used inside larger derivations; used to order cube pruning
  virtual void EstimateFutureCost(const TRule& rule,
                                  const void* state,
                                  const SentenceMetadata& smeta,
                                  FeatureAccumulator* estimated_features) const;

 protected:
  // context is a pointer to a buffer of size StateSize() that the
  // feature function can write its state to.  It's up to the feature function
  // to determine how much space it needs and to determine how to encode its
  // residual contextual information since it is OPAQUE to all clients outside
  // of the particular FeatureFunction class.  There is one exception:
  // equality of the contents (i.e., memcmp) is required to determine whether
  // two states can be combined.
  virtual void TraversalFeaturesImpl(const SentenceMetadata& smeta,
                                     const HG::Edge& edge,
                                     const std::vector<const void*>& ant_contexts,
                                     FeatureAccumulator* features,
                                     FeatureAccumulator* estimated_features,
                                     void* context) const = 0;

  // !!! ONLY call these from subclass *CONSTRUCTORS* !!!
  void SetStateSize(size_t state_size) {
    state_size_ = state_size;
  }

 private:
  int state_size_;
};

#endif
