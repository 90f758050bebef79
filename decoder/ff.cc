#include "ff.h"

#include "hg.h"

using namespace std;

FeatureFunction::~FeatureFunction() {}

void FeatureFunction::FinalTraversalFeatures(const SentenceMetadata&,
                                             const void* /* ant_state */,
                                             FeatureAccumulator* /* features */) const {}

void FeatureFunction::EstimateCost(const TRule&, FeatureAccumulator*) const {}

void FeatureFunction::EstimateFutureCost(const TRule&,
                                         const void*,
                                         const SentenceMetadata&,
                                         FeatureAccumulator*) const {}

string FeatureFunction::usage_helper(std::string const& name,std::string const& params,std::string const& details,bool sp,bool sd) {
  string r=name;
  if (sp) {
    r+=": ";
    r+=params;
  }
  if (sd) {
    r+="\n";
    r+=details;
  }
  return r;
}
