#include "ff_label_substitution.h"

#include <sstream>

#include "hg.h"
#include "tdict.h"
#include "verbose.h"

using namespace std;

LabelSubstitution::LabelSubstitution(const string& param) :
    match_fid_(FD::Convert("LabelSubstitution_MATCH")),
    nomatch_fid_(FD::Convert("LabelSubstitution_NOMATCH")) {
  SetStateSize(sizeof(WordID));
  if (!param.empty() && !SILENT) {
    cerr << "Warning LabelSubstitution ignoring parameter: " << param << endl;
  }
}

void LabelSubstitution::TraversalFeaturesImpl(const SentenceMetadata& smeta,
                                              const HG::Edge& edge,
                                              const vector<const void*>& ant_states,
                                              FeatureAccumulator* features,
                                              FeatureAccumulator* estimated_features,
                                              void* state) const {
  (void) smeta;
  (void) estimated_features;
  const TRule& rule = *edge.rule_;
  *static_cast<WordID*>(state) = -rule.GetLHS();
  if (ant_states.empty()) return;

  ostringstream rule_nts, sub_nts;
  for (unsigned k = 0; k < ant_states.size(); ++k) {
    const WordID rule_nt = rule.NonterminalCategory(k);
    const WordID sub_nt = *static_cast<const WordID*>(ant_states[k]);
    features->Add(rule_nt == sub_nt ? match_fid_ : nomatch_fid_, 1.0);
    features->Add("LabelSubstitution_" + TD::Convert(sub_nt) + "_substitutes_" + TD::Convert(rule_nt), 1.0);
    if (k) { rule_nts << ','; sub_nts << ','; }
    rule_nts << TD::Convert(rule_nt);
    sub_nts << TD::Convert(sub_nt);
  }
  // a rule inverts if its target nonterminals are not in source order
  bool inverting = false;
  int last = -1;
  const vector<WordID>& e = rule.e();
  for (unsigned i = 0; i < e.size(); ++i) {
    if (e[i] >= 0) continue;
    const int k = -(e[i] + 1);
    if (k < last) inverting = true;
    last = k;
  }
  ostringstream os;
  os << "LabelSubstitution_<LHS>" << TD::Convert(-rule.GetLHS()) << "</LHS>_<Nont>"
     << rule_nts.str() << "</Nont>_" << (inverting ? "INV" : "MONO")
     << "_<Subst>" << sub_nts.str() << "</Subst>";
  features->Add(os.str(), 1.0);
}
