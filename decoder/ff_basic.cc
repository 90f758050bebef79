#include "ff_basic.h"

#include <cmath>

#include <boost/lexical_cast.hpp>

#include "errors.h"
#include "hg.h"
#include "stringlib.h"
#include "verbose.h"

using namespace std;

// each word costs log_10(e)
WordPenalty::WordPenalty(const string& param) :
    fid_(FD::Convert("WordPenalty")),
    value_(-1.0 / log(10)) {
  if (!param.empty() && !SILENT) {
    cerr << "Warning WordPenalty ignoring parameter: " << param << endl;
  }
}

void WordPenalty::TraversalFeaturesImpl(const SentenceMetadata& smeta,
                                        const HG::Edge& edge,
                                        const std::vector<const void*>& ant_states,
                                        FeatureAccumulator* features,
                                        FeatureAccumulator* estimated_features,
                                        void* state) const {
  (void) smeta;
  (void) ant_states;
  (void) state;
  (void) estimated_features;
  features->Add(fid_, edge.rule_->EWords() * value_);
}

void WordPenalty::EstimateCost(const TRule& rule, FeatureAccumulator* estimated_features) const {
  estimated_features->Add(fid_, rule.EWords() * value_);
}

SourceWordPenalty::SourceWordPenalty(const string& param) :
    fid_(FD::Convert("SourceWordPenalty")),
    value_(-1.0 / log(10)) {
  if (!param.empty() && !SILENT) {
    cerr << "Warning SourceWordPenalty ignoring parameter: " << param << endl;
  }
}

void SourceWordPenalty::TraversalFeaturesImpl(const SentenceMetadata& smeta,
                                              const HG::Edge& edge,
                                              const std::vector<const void*>& ant_states,
                                              FeatureAccumulator* features,
                                              FeatureAccumulator* estimated_features,
                                              void* state) const {
  (void) smeta;
  (void) ant_states;
  (void) state;
  (void) estimated_features;
  features->Add(fid_, edge.rule_->FWords() * value_);
}

ArityPenalty::ArityPenalty(const std::string& param) {
  unsigned max_arity = kDEFAULT_MAX_ARITY;
  const string p = Trim(param);
  if (!p.empty()) {
    try {
      max_arity = boost::lexical_cast<unsigned>(p);
    } catch (const boost::bad_lexical_cast&) {
      throw ConfigurationError("ArityPenalty: bad maximum arity '" + p + "'");
    }
  }
  for (unsigned i = 0; i <= max_arity; ++i)
    fids_.push_back(FD::Convert("Arity_" + boost::lexical_cast<string>(i)));
}

void ArityPenalty::TraversalFeaturesImpl(const SentenceMetadata& smeta,
                                         const HG::Edge& edge,
                                         const std::vector<const void*>& ant_states,
                                         FeatureAccumulator* features,
                                         FeatureAccumulator* estimated_features,
                                         void* state) const {
  (void) smeta;
  (void) ant_states;
  (void) state;
  (void) estimated_features;
  const unsigned a = edge.Arity();
  if (a < fids_.size())
    features->Add(fids_[a], 1.0);
}
