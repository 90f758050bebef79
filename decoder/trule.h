#ifndef TRULE_H_
#define TRULE_H_

#include <algorithm>
#include <iterator>
#include <vector>
#include <cassert>
#include <iostream>
#include <string>

#include <boost/shared_ptr.hpp>
#include <boost/functional/hash.hpp>

#include "sparse_vector.h"
#include "wordid.h"
#include "tdict.h"

class TRule;
typedef boost::shared_ptr<TRule> TRulePtr;

// Synchronous translation rule
class TRule {
 public:
  TRule() : lhs_(0), arity_(0), owner_(0) { }
  TRule(const std::vector<WordID>& e, const std::vector<WordID>& f, const WordID& lhs) :
    e_(e), f_(f), lhs_(lhs), arity_(0), owner_(0) { ComputeArity(); }

  // throws std::runtime_error if the text is not a well formed rule
  explicit TRule(const std::string& text);

  // make a rule from a hiero-like rule table, e.g.
  //    [X] ||| [X,1] DE [X,2] ||| [X,2] of the [X,1] ||| Cost=0.5 0.1 0.2
  // returns NULL (and reports the problem) on malformed input
  static TRule* CreateRuleSynchronous(const std::string& rule);

  // [lhs] ||| src ||| src ||| PassThrough=1
  static TRulePtr CreatePassThroughRule(WordID lhs, WordID word);

  // builds the target side from tail yields; var_values[k] is the yield of tail k
  void ESubstitute(const std::vector<const std::vector<WordID>* >& var_values,
                   std::vector<WordID>* result) const {
    result->clear();
    for (const auto& c : e_) {
      if (c < 0) {
        const auto& var_value = *var_values[-(c + 1)];
        std::copy(var_value.begin(),
                  var_value.end(),
                  std::back_inserter(*result));
      } else {
        result->push_back(c);
      }
    }
  }

  bool ReadFromString(const std::string& line);

  std::string AsString(bool verbose = true) const;
  // target side with nonterminals written as [CAT,k], e.g. "[NP,1] said [SBAR,2]"
  std::string ETargetString() const;
  friend std::ostream &operator<<(std::ostream &o,TRule const& r);

  const std::vector<WordID>& f() const { return f_; }
  const std::vector<WordID>& e() const { return e_; }

  int EWords() const { return ELength() - Arity(); }
  int FWords() const { return FLength() - Arity(); }
  int FLength() const { return f_.size(); }
  int ELength() const { return e_.size(); }
  int Arity() const { return arity_; }
  bool IsUnary() const { return (Arity() == 1) && (f_.size() == 1); }
  bool IsGoal() const;
  const SparseVector<double>& GetFeatureValues() const { return scores_; }
  double Score(int i) const { return scores_.value(i); }
  WordID GetLHS() const { return lhs_; }
  // category (positive TD id) of the k-th source nonterminal
  WordID NonterminalCategory(int k) const;
  WordID GetOwner() const { return owner_; }
  void ComputeArity();

  // -1 = first variable, -2 = second variable, ..., i.e. tail_nodes_[-(w+1)] if w<0, TD::Convert(w) otherwise
  std::vector<WordID> e_;
  // < 0: *-1 = encoding of category of variable
  std::vector<WordID> f_;
  // < 0: *-1 = category
  WordID lhs_;
  SparseVector<double> scores_;

  char arity_;
  // TD id of the name of the grammar that created this rule, 0 if none
  WordID owner_;
  // number of positional feature values (PhraseModel_0, PhraseModel_1, ...)
  int dense_features_ = 0;
};

// id of the k-th positional feature of a rule
int DenseFeatureId(int k);

inline size_t hash_value(const TRule& r) {
  size_t h = boost::hash_value(r.e_);
  boost::hash_combine(h, -r.lhs_);
  boost::hash_combine(h, boost::hash_value(r.f_));
  return h;
}

inline bool operator==(const TRule& a, const TRule& b) {
  return (a.lhs_ == b.lhs_ && a.e_ == b.e_ && a.f_ == b.f_);
}

#endif
