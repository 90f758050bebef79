#include "trule.h"

#include <cstdlib>
#include <sstream>
#include <stdexcept>

#include "fdict.h"
#include "stringlib.h"
#include "tdict.h"

using namespace std;

ostream &operator<<(ostream &o,TRule const& r) {
  return o<<r.AsString(true);
}

int DenseFeatureId(int k) {
  ostringstream os;
  os << "PhraseModel_" << k;
  return FD::Convert(os.str());
}

TRule::TRule(const string& text) : lhs_(0), arity_(0), owner_(0) {
  if (!ReadFromString(text))
    throw runtime_error("Failed to parse rule: " + text);
}

bool TRule::IsGoal() const {
  static const int kGOAL(TD::Convert("Goal") * -1);
  return GetLHS() == kGOAL;
}

TRule* TRule::CreateRuleSynchronous(const string& rule) {
  TRule* res = new TRule;
  if (res->ReadFromString(rule)) return res;
  cerr << "[ERROR] Failed to create rule from: " << rule << endl;
  delete res;
  return NULL;
}

TRulePtr TRule::CreatePassThroughRule(WordID lhs, WordID word) {
  static const int kPASSTHROUGH = FD::Convert("PassThrough");
  TRulePtr r(new TRule(vector<WordID>(1, word), vector<WordID>(1, word), lhs < 0 ? lhs : -lhs));
  r->scores_.set_value(kPASSTHROUGH, 1.0);
  return r;
}

namespace {

bool IsNonterminalToken(const string& tok) {
  return tok.size() > 2 && tok[0] == '[' && tok[tok.size() - 1] == ']';
}

// "[X,2]" -> 2, "[2]" -> 2, "[X]" -> 0
int NonterminalIndex(const string& tok) {
  const string inner = tok.substr(1, tok.size() - 2);
  const size_t comma = inner.rfind(',');
  const string num = (comma == string::npos) ? inner : inner.substr(comma + 1);
  if (num.empty()) return 0;
  for (unsigned i = 0; i < num.size(); ++i)
    if (num[i] < '0' || num[i] > '9') return 0;
  return atoi(num.c_str());
}

}

bool TRule::ReadFromString(const string& line) {
  vector<string> fields;
  SplitOnTripleBar(line, &fields);
  if (fields.size() < 3) {
    cerr << "Rule needs at least [LHS] ||| source ||| target: " << line << endl;
    return false;
  }
  if (!IsNonterminalToken(fields[0])) {
    cerr << "Bad LHS in rule: " << line << endl;
    return false;
  }
  lhs_ = -TD::Convert(StripNonterminalBrackets(fields[0]));

  f_.clear();
  vector<WordID> src_cats;
  const vector<string> src = SplitOnWhitespace(fields[1]);
  for (unsigned i = 0; i < src.size(); ++i) {
    if (IsNonterminalToken(src[i])) {
      const WordID cat = TD::Convert(StripNonterminalBrackets(src[i]));
      f_.push_back(-cat);
      src_cats.push_back(cat);
      const int idx = NonterminalIndex(src[i]);
      if (idx != 0 && idx != static_cast<int>(src_cats.size())) {
        cerr << "Source nonterminals must be numbered left to right: " << line << endl;
        return false;
      }
    } else {
      f_.push_back(TD::Convert(src[i]));
    }
  }

  e_.clear();
  int next_unindexed = 0;
  const vector<string> trg = SplitOnWhitespace(fields[2]);
  for (unsigned i = 0; i < trg.size(); ++i) {
    if (IsNonterminalToken(trg[i])) {
      int idx = NonterminalIndex(trg[i]);
      if (idx == 0) idx = ++next_unindexed;
      if (idx < 1 || idx > static_cast<int>(src_cats.size())) {
        cerr << "Target nonterminal " << trg[i] << " has no source counterpart: " << line << endl;
        return false;
      }
      e_.push_back(-idx);
    } else {
      e_.push_back(TD::Convert(trg[i]));
    }
  }

  scores_.clear();
  dense_features_ = 0;
  if (fields.size() > 3) {
    const vector<string> feats = SplitOnWhitespace(fields[3]);
    for (unsigned i = 0; i < feats.size(); ++i) {
      const size_t eq = feats[i].find('=');
      char* end = NULL;
      if (eq == string::npos) {
        const double v = strtod(feats[i].c_str(), &end);
        if (*end) {
          cerr << "Bad feature value " << feats[i] << " in rule: " << line << endl;
          return false;
        }
        scores_.set_value(DenseFeatureId(dense_features_++), v);
      } else {
        const string val = feats[i].substr(eq + 1);
        const double v = strtod(val.c_str(), &end);
        if (val.empty() || *end) {
          cerr << "Bad feature value " << feats[i] << " in rule: " << line << endl;
          return false;
        }
        scores_.set_value(FD::Convert(feats[i].substr(0, eq)), v);
      }
    }
  }
  arity_ = src_cats.size();
  return true;
}

void TRule::ComputeArity() {
  int n = 0;
  for (vector<WordID>::const_iterator i = f_.begin(); i != f_.end(); ++i)
    if (*i <= 0) ++n;
  arity_ = n;
}

WordID TRule::NonterminalCategory(int k) const {
  int seen = 0;
  for (unsigned i = 0; i < f_.size(); ++i) {
    if (f_[i] <= 0) {
      if (seen == k) return -f_[i];
      ++seen;
    }
  }
  return 0;
}

string TRule::ETargetString() const {
  ostringstream os;
  for (unsigned i = 0; i < e_.size(); ++i) {
    if (i) os << ' ';
    const WordID& w = e_[i];
    if (w < 0) {
      const int k = -(w + 1);
      os << '[' << TD::Convert(NonterminalCategory(k)) << ',' << (k + 1) << ']';
    } else {
      os << TD::Convert(w);
    }
  }
  return os.str();
}

string TRule::AsString(bool verbose) const {
  ostringstream os;
  int idx = 0;
  if (lhs_) {
    os << '[' << TD::Convert(lhs_ * -1) << "] |||";
  } else { os << "NOLHS |||"; }
  for (unsigned i = 0; i < f_.size(); ++i) {
    const WordID& w = f_[i];
    if (w < 0) {
      int wi = w * -1;
      ++idx;
      os << " [" << TD::Convert(wi) << ',' << idx << ']';
    } else {
      os << ' ' << TD::Convert(w);
    }
  }
  os << " ||| ";
  for (unsigned i =0; i<e_.size(); ++i) {
    if (i) os << ' ';
    const WordID& w = e_[i];
    if (w < 0)
      os << '[' << -w << ']';
    else
      os << TD::Convert(w);
  }
  if (!scores_.empty() && verbose) {
    os << " ||| " << scores_;
  }
  return os.str();
}
