#ifndef _FF_BASIC_H_
#define _FF_BASIC_H_

#include "ff.h"

// word penalty feature, for each word on the E side of a rule,
// add value_
class WordPenalty : public FeatureFunction {
 public:
  WordPenalty(const std::string& param);
  static std::string usage(bool p,bool d) {
    return usage_helper("WordPenalty","","number of target words (local feature)",p,d);
  }
  virtual void EstimateCost(const TRule& rule,
                            FeatureAccumulator* estimated_features) const;
 protected:
  virtual void TraversalFeaturesImpl(const SentenceMetadata& smeta,
                                     const HG::Edge& edge,
                                     const std::vector<const void*>& ant_contexts,
                                     FeatureAccumulator* features,
                                     FeatureAccumulator* estimated_features,
                                     void* context) const;
 private:
  const int fid_;
  const double value_;
};

class SourceWordPenalty : public FeatureFunction {
 public:
  SourceWordPenalty(const std::string& param);
  static std::string usage(bool p,bool d) {
    return usage_helper("SourceWordPenalty","","number of source words (local feature, and meaningless except when input has non-constant number of source words, e.g. lattices)",p,d);
  }
 protected:
  virtual void TraversalFeaturesImpl(const SentenceMetadata& smeta,
                                     const HG::Edge& edge,
                                     const std::vector<const void*>& ant_contexts,
                                     FeatureAccumulator* features,
                                     FeatureAccumulator* estimated_features,
                                     void* context) const;
 private:
  const int fid_;
  const double value_;
};

// Arity_N=1 for a rule with N nonterminals; rules with more than
// the maximum arity fire nothing
class ArityPenalty : public FeatureFunction {
 public:
  static const unsigned kDEFAULT_MAX_ARITY = 9;
  ArityPenalty(const std::string& param);
  static std::string usage(bool p,bool d) {
    return usage_helper("ArityPenalty","[MaxArity(default 9)]","Indicator feature Arity_N=1 for rule of arity N (local feature).  0<=N<=MaxArity",p,d);
  }

 protected:
  virtual void TraversalFeaturesImpl(const SentenceMetadata& smeta,
                                     const HG::Edge& edge,
                                     const std::vector<const void*>& ant_contexts,
                                     FeatureAccumulator* features,
                                     FeatureAccumulator* estimated_features,
                                     void* context) const;
 private:
  std::vector<int> fids_;
};

#endif
