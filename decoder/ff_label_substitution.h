#ifndef _FF_LABEL_SUBSTITUTION_H_
#define _FF_LABEL_SUBSTITUTION_H_

#include <string>
#include <vector>

#include "ff.h"

// Compares every nonterminal of a rule with the label of the node that was
// substituted into it:
//   LabelSubstitution_MATCH / LabelSubstitution_NOMATCH
//   LabelSubstitution_<node label>_substitutes_<rule label>
// and one feature describing the whole rule application,
//   LabelSubstitution_<LHS>S</LHS>_<Nont>NP,VP</Nont>_MONO_<Subst>NP,X</Subst>
// The label of a node is kept in its state; since nodes are already told
// apart by label this never splits a node.
class LabelSubstitution : public FeatureFunction {
 public:
  LabelSubstitution(const std::string& param);
  static std::string usage(bool p,bool d) {
    return usage_helper("LabelSubstitution","","sparse features pairing rule nonterminals with the labels substituted into them",p,d);
  }
 protected:
  virtual void TraversalFeaturesImpl(const SentenceMetadata& smeta,
                                     const HG::Edge& edge,
                                     const std::vector<const void*>& ant_contexts,
                                     FeatureAccumulator* features,
                                     FeatureAccumulator* estimated_features,
                                     void* context) const;
 private:
  const int match_fid_;
  const int nomatch_fid_;
};

#endif
