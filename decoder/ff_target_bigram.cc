#include "ff_target_bigram.h"

#include <sstream>
#include <unordered_set>

#include <boost/lexical_cast.hpp>

#include "errors.h"
#include "filelib.h"
#include "hg.h"
#include "stringlib.h"
#include "tdict.h"
#include "verbose.h"

using namespace std;

namespace {
  struct BigramState {
    WordID left;   // 0 if the yield is empty
    WordID right;
  };
}

struct TargetBigramImpl {
  TargetBigramImpl() : use_vocab_(false), kUNK(TD::Convert("UNK")) {}

  void LoadVocab(const string& filename, int top_n, int threshold) {
    use_vocab_ = true;
    vocab_.insert(TD::Convert("<s>"));
    vocab_.insert(TD::Convert("</s>"));
    ReadFile rf(filename);
    istream& in = *rf.stream();
    string line;
    int lc = 0;
    vector<string> fields;
    while (getline(in, line)) {
      if (lc >= top_n) break;
      ++lc;
      SplitOnWhitespace(line, &fields);
      if (fields.empty()) continue;
      if (fields.size() < 3) {
        ostringstream os;
        os << filename << ":" << lc << ": expected <rank> <word> <count>";
        throw ConfigurationError(os.str());
      }
      int count = 0;
      try {
        count = boost::lexical_cast<int>(fields[2]);
      } catch (const boost::bad_lexical_cast&) {
        ostringstream os;
        os << filename << ":" << lc << ": bad count '" << fields[2] << "'";
        throw ConfigurationError(os.str());
      }
      if (count >= threshold)
        vocab_.insert(TD::Convert(fields[1]));
    }
    if (!SILENT)
      cerr << "TargetBigram: " << vocab_.size() << " words in vocabulary " << filename << endl;
  }

  WordID Map(WordID w) const {
    if (use_vocab_ && vocab_.count(w) == 0) return kUNK;
    return w;
  }

  void Fire(WordID a, WordID b, FeatureAccumulator* features) const {
    features->Add("TargetBigram_" + TD::Convert(Map(a)) + "_" + TD::Convert(Map(b)), 1.0);
  }

  void Score(const HG::Edge& edge,
             const vector<const void*>& ant_states,
             FeatureAccumulator* features,
             BigramState* out) const {
    const vector<WordID>& e = edge.rule_->e();
    WordID left = 0;
    WordID prev = 0;
    for (unsigned i = 0; i < e.size(); ++i) {
      if (e[i] < 0) {
        const BigramState& ant = *static_cast<const BigramState*>(ant_states[-(e[i] + 1)]);
        if (!ant.left) continue;
        if (prev) Fire(prev, ant.left, features);
        if (!left) left = ant.left;
        prev = ant.right;
      } else {
        if (prev) Fire(prev, e[i], features);
        if (!left) left = e[i];
        prev = e[i];
      }
    }
    out->left = left;
    out->right = prev;
  }

  bool use_vocab_;
  unordered_set<WordID> vocab_;
  const WordID kUNK;
};

TargetBigram::TargetBigram(const string& param) : pimpl_(new TargetBigramImpl) {
  SetStateSize(sizeof(BigramState));
  vector<string> argv;
  SplitOnWhitespace(param, &argv);
  string vocab_file;
  int top_n = 1000000;
  int threshold = 0;
  for (unsigned i = 0; i < argv.size(); ++i) {
    const string& opt = argv[i];
    if (opt != "-v" && opt != "-n" && opt != "-t")
      throw ConfigurationError("TargetBigram: unknown argument '" + opt + "'\n" + usage(true, false));
    if (i + 1 == argv.size())
      throw ConfigurationError("TargetBigram: missing value for " + opt);
    const string& val = argv[++i];
    if (opt == "-v") {
      vocab_file = val;
      continue;
    }
    int n = 0;
    try {
      n = boost::lexical_cast<int>(val);
    } catch (const boost::bad_lexical_cast&) {
      throw ConfigurationError("TargetBigram: " + opt + " expects a number, got '" + val + "'");
    }
    if (n < 0)
      throw ConfigurationError("TargetBigram: " + opt + " must not be negative");
    if (opt == "-n") top_n = n; else threshold = n;
  }
  if (!vocab_file.empty())
    pimpl_->LoadVocab(vocab_file, top_n, threshold);
}

int TargetBigram::VocabularySize() const {
  return pimpl_->vocab_.size();
}

void TargetBigram::TraversalFeaturesImpl(const SentenceMetadata& smeta,
                                         const HG::Edge& edge,
                                         const vector<const void*>& ant_states,
                                         FeatureAccumulator* features,
                                         FeatureAccumulator* estimated_features,
                                         void* state) const {
  (void) smeta;
  (void) estimated_features;
  pimpl_->Score(edge, ant_states, features, static_cast<BigramState*>(state));
}
