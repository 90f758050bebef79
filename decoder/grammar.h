#ifndef GRAMMAR_H_
#define GRAMMAR_H_

#include <iostream>
#include <algorithm>
#include <vector>
#include <map>
#include <string>

#include <boost/atomic.hpp>
#include <boost/shared_ptr.hpp>
#include <boost/thread/mutex.hpp>

#include "lattice.h"
#include "trule.h"

class ModelSet;

// rules of one bin that share a left hand side, best estimated score first
struct RuleGroup {
  WordID lhs;
  std::vector<TRulePtr> rules;
};
typedef std::vector<RuleGroup> RuleGroups;

struct RuleBin {
  virtual ~RuleBin();
  virtual int GetNumRules() const = 0;
  virtual TRulePtr GetIthRule(int i) const = 0;
  virtual int Arity() const = 0;
  // sorts on first use; safe to call from several threads at once
  virtual const RuleGroups& GetSortedRules(const ModelSet& models) const = 0;
  virtual bool IsSorted() const = 0;
};

struct GrammarIter {
  virtual ~GrammarIter();
  virtual const RuleBin* GetRules() const = 0;
  virtual const GrammarIter* Extend(int symbol) const = 0;
};

// A grammar is shared (read only) by every sentence being decoded.
// Rule lists are ordered by estimated score the first time they are needed,
// which is the only mutation that can happen while decoding.
struct Grammar {
  typedef std::map<WordID, std::vector<TRulePtr> > Cat2Rules;
  static const std::vector<TRulePtr> NO_RULES;

  Grammar() : owner_(0), num_dense_features_(0), num_rules_(0), sorted_(false) {}
  virtual ~Grammar();
  virtual const GrammarIter* GetRoot() const = 0;
  virtual bool HasRuleForSpan(int i, int j, int distance) const;

  // orders every rule bin and the unary rules by estimated score;
  // runs at most once, later calls return immediately
  void SortGrammar(const ModelSet& models);
  bool IsSorted() const { return sorted_.load(boost::memory_order_acquire); }

  int GetNumRules() const { return num_rules_; }
  // TD id of the grammar name, stamped on the rules it owns
  WordID GetOwner() const { return owner_; }
  const std::string& GetGrammarName() const { return grammar_name_; }
  void SetGrammarName(const std::string& n);
  // largest number of positional rule features
  int NumDenseFeatures() const { return num_dense_features_; }

  inline const std::vector<TRulePtr>& GetAllUnaryRules() const {
    return unaries_;
  }

  // get all the unary rules that rewrite category cat
  inline const std::vector<TRulePtr>& GetUnaryRulesForRHS(const WordID& cat) const {
    Cat2Rules::const_iterator found = rhs2unaries_.find(cat);
    if (found == rhs2unaries_.end())
      return NO_RULES;
    else
      return found->second;
  }

 protected:
  // called once, with the sort lock held
  virtual void SortRules(const ModelSet& models);
  void MarkUnsorted() { sorted_.store(false, boost::memory_order_release); }

  Cat2Rules rhs2unaries_;     // these must be filled in by subclasses!
  std::vector<TRulePtr> unaries_;
  std::string grammar_name_;
  WordID owner_;
  int num_dense_features_;
  int num_rules_;

 private:
  boost::mutex sort_mutex_;
  boost::atomic<bool> sorted_;
};

typedef boost::shared_ptr<Grammar> GrammarPtr;

class TGImpl;
struct TextGrammar : public Grammar {
  TextGrammar();
  explicit TextGrammar(const std::string& file);
  explicit TextGrammar(std::istream* in);
  void SetMaxSpan(int m) { max_span_ = m; }

  virtual const GrammarIter* GetRoot() const;
  // adding rules to a grammar that is being used for decoding is not allowed
  void AddRule(const TRulePtr& rule);
  void ReadFromFile(const std::string& filename);
  void ReadFromStream(std::istream* in, const std::string& name = "UNKNOWN");
  virtual bool HasRuleForSpan(int i, int j, int distance) const;

 protected:
  virtual void SortRules(const ModelSet& models);

 private:
  int max_span_;
  boost::shared_ptr<TGImpl> pimpl_;
};

// [goal] ||| [default] ||| [1]
// [goal] ||| [goal] [default] ||| [1] [2] ||| Glue=1
// only applicable to spans starting at position 0
struct GlueGrammar : public TextGrammar {
  GlueGrammar(const std::string& goal_nt, const std::string& default_nt);
  virtual bool HasRuleForSpan(int i, int j, int distance) const;
};

// per-sentence grammar holding the rules of words no other grammar knows
struct PassThroughGrammar : public TextGrammar {
  explicit PassThroughGrammar(const std::string& default_nt);
  // adds [default] ||| word ||| word ||| PassThrough=1 unless already present
  void AddOOVRule(WordID word);
  bool HasOOVRule(WordID word) const;
 private:
  const WordID default_nt_;
  std::vector<WordID> words_;
};

#endif
