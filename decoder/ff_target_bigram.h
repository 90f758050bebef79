#ifndef _FF_TARGET_BIGRAM_H_
#define _FF_TARGET_BIGRAM_H_

#include <string>
#include <vector>

#include <boost/shared_ptr.hpp>

#include "ff.h"

struct TargetBigramImpl;

// sparse indicator TargetBigram_a_b=1 for every pair of adjacent target
// words a b; the state of a node is its leftmost and rightmost word.
// param = "[-v vocab-file] [-n top-n] [-t threshold]"
// with a vocabulary, words outside of it are replaced by UNK
class TargetBigram : public FeatureFunction {
 public:
  TargetBigram(const std::string& param);
  static std::string usage(bool p,bool d) {
    return usage_helper("TargetBigram",
                        "[-v <vocab file>] [-n <top-n>] [-t <count threshold>]",
                        "indicator features for the target bigrams of a derivation. The vocabulary file has lines <rank> <word> <count>; only the first top-n lines with a count of at least threshold are used",
                        p,d);
  }
  // words kept from the vocabulary file (plus <s> and </s>), 0 if none was given
  int VocabularySize() const;

 protected:
  virtual void TraversalFeaturesImpl(const SentenceMetadata& smeta,
                                     const HG::Edge& edge,
                                     const std::vector<const void*>& ant_contexts,
                                     FeatureAccumulator* features,
                                     FeatureAccumulator* estimated_features,
                                     void* context) const;
 private:
  boost::shared_ptr<TargetBigramImpl> pimpl_;
};

#endif
