#include "grammar.h"

#include <algorithm>
#include <utility>
#include <map>

#include "ffset.h"
#include "filelib.h"
#include "stringlib.h"
#include "tdict.h"
#include "verbose.h"

using namespace std;

const vector<TRulePtr> Grammar::NO_RULES;

RuleBin::~RuleBin() {}
GrammarIter::~GrammarIter() {}
Grammar::~Grammar() {}

bool Grammar::HasRuleForSpan(int i, int j, int distance) const {
  (void) i;
  (void) j;
  (void) distance;
  return true;  // always true by default
}

void Grammar::SetGrammarName(const string& n) {
  grammar_name_ = n;
  owner_ = TD::Convert(n);
}

namespace {

struct ScoredRule {
  double score;
  int order;
  TRulePtr rule;
  bool operator<(const ScoredRule& o) const {
    return score > o.score || (score == o.score && order < o.order);
  }
};

void SortByEstimate(const ModelSet& models, vector<TRulePtr>* rules) {
  vector<ScoredRule> scored(rules->size());
  for (unsigned i = 0; i < rules->size(); ++i) {
    scored[i].score = models.EstimateRuleScore(*(*rules)[i]);
    scored[i].order = i;
    scored[i].rule = (*rules)[i];
  }
  sort(scored.begin(), scored.end());
  for (unsigned i = 0; i < scored.size(); ++i)
    (*rules)[i] = scored[i].rule;
}

}

void Grammar::SortRules(const ModelSet& models) {
  for (Cat2Rules::iterator it = rhs2unaries_.begin(); it != rhs2unaries_.end(); ++it)
    SortByEstimate(models, &it->second);
}

void Grammar::SortGrammar(const ModelSet& models) {
  if (IsSorted()) return;
  boost::mutex::scoped_lock lock(sort_mutex_);
  if (sorted_.load(boost::memory_order_relaxed)) return;
  SortRules(models);
  sorted_.store(true, boost::memory_order_release);
}

struct TextRuleBin : public RuleBin {
  TextRuleBin() : sorted_(false) {}
  int GetNumRules() const {
    return rules_.size();
  }
  TRulePtr GetIthRule(int i) const {
    return rules_[i];
  }
  void AddRule(TRulePtr t) {
    rules_.push_back(t);
    sorted_.store(false, boost::memory_order_release);
  }
  int Arity() const {
    return rules_.front()->Arity();
  }
  bool IsSorted() const {
    return sorted_.load(boost::memory_order_acquire);
  }
  const RuleGroups& GetSortedRules(const ModelSet& models) const {
    if (IsSorted()) return groups_;
    boost::mutex::scoped_lock lock(mutex_);
    if (!sorted_.load(boost::memory_order_relaxed)) {
      vector<TRulePtr> rules = rules_;
      SortByEstimate(models, &rules);
      groups_.clear();
      map<WordID, int> lhs2group;
      for (unsigned i = 0; i < rules.size(); ++i) {
        const WordID lhs = rules[i]->GetLHS();
        map<WordID, int>::iterator found = lhs2group.find(lhs);
        if (found == lhs2group.end()) {
          found = lhs2group.insert(make_pair(lhs, static_cast<int>(groups_.size()))).first;
          groups_.push_back(RuleGroup());
          groups_.back().lhs = lhs;
        }
        groups_[found->second].rules.push_back(rules[i]);
      }
      sorted_.store(true, boost::memory_order_release);
    }
    return groups_;
  }
 private:
  vector<TRulePtr> rules_;
  mutable RuleGroups groups_;
  mutable boost::mutex mutex_;
  mutable boost::atomic<bool> sorted_;
};

struct TextGrammarNode : public GrammarIter {
  TextGrammarNode() : rb_(NULL) {}
  ~TextGrammarNode() {
    delete rb_;
  }
  const GrammarIter* Extend(int symbol) const {
    map<WordID, TextGrammarNode>::const_iterator i = tree_.find(symbol);
    if (i == tree_.end()) return NULL;
    return &i->second;
  }

  const RuleBin* GetRules() const {
    return rb_;
  }

  void SortAll(const ModelSet& models) const {
    if (rb_) rb_->GetSortedRules(models);
    for (map<WordID, TextGrammarNode>::const_iterator i = tree_.begin(); i != tree_.end(); ++i)
      i->second.SortAll(models);
  }

  map<WordID, TextGrammarNode> tree_;
  TextRuleBin* rb_;
};

struct TGImpl {
  TextGrammarNode root_;
};

TextGrammar::TextGrammar() : max_span_(10), pimpl_(new TGImpl) {}
TextGrammar::TextGrammar(const string& file) :
    max_span_(10),
    pimpl_(new TGImpl) {
  ReadFromFile(file);
}

TextGrammar::TextGrammar(istream* in) :
    max_span_(10),
    pimpl_(new TGImpl) {
  ReadFromStream(in);
}

const GrammarIter* TextGrammar::GetRoot() const {
  return &pimpl_->root_;
}

void TextGrammar::AddRule(const TRulePtr& rule) {
  if (!rule->owner_) rule->owner_ = owner_;
  num_dense_features_ = max(num_dense_features_, rule->dense_features_);
  ++num_rules_;
  MarkUnsorted();
  if (rule->IsUnary()) {
    rhs2unaries_[rule->f().front()].push_back(rule);
    unaries_.push_back(rule);
  } else {
    TextGrammarNode* cur = &pimpl_->root_;
    for (unsigned i = 0; i < rule->f_.size(); ++i)
      cur = &cur->tree_[rule->f_[i]];
    if (cur->rb_ == NULL)
      cur->rb_ = new TextRuleBin;
    cur->rb_->AddRule(rule);
  }
}

void TextGrammar::SortRules(const ModelSet& models) {
  Grammar::SortRules(models);
  pimpl_->root_.SortAll(models);
}

void TextGrammar::ReadFromFile(const string& filename) {
  ReadFile in(filename);
  ReadFromStream(in.stream(), filename);
}

void TextGrammar::ReadFromStream(istream* in, const string& name) {
  if (grammar_name_.empty()) SetGrammarName(name);
  string line;
  int lc = 0;
  int bad = 0;
  while (getline(*in, line)) {
    ++lc;
    if (line.empty() || line[0] == '#') continue;
    TRulePtr rule(TRule::CreateRuleSynchronous(line));
    if (!rule) {
      cerr << name << ":" << lc << ": skipping malformed rule" << endl;
      ++bad;
      continue;
    }
    AddRule(rule);
  }
  if (!SILENT) {
    cerr << "  " << name << ": " << num_rules_ << " rules";
    if (bad) cerr << " (" << bad << " malformed lines skipped)";
    cerr << endl;
  }
}

bool TextGrammar::HasRuleForSpan(int /* i */, int /* j */, int distance) const {
  return (max_span_ >= distance);
}

GlueGrammar::GlueGrammar(const string& goal_nt, const string& default_nt) {
  SetGrammarName("GlueGrammar");
  TRulePtr stop_glue(new TRule("[" + goal_nt + "] ||| [" + default_nt + ",1] ||| [1]"));
  AddRule(stop_glue);
  TRulePtr glue(new TRule("[" + goal_nt + "] ||| [" + goal_nt + ",1] ["
      + default_nt + ",2] ||| [1] [2] ||| Glue=1"));
  AddRule(glue);
}

bool GlueGrammar::HasRuleForSpan(int i, int /* j */, int /* distance */) const {
  return (i == 0);
}

PassThroughGrammar::PassThroughGrammar(const string& default_nt) :
    default_nt_(TD::Convert(default_nt)) {
  SetGrammarName("PassThrough");
  SetMaxSpan(1);
}

bool PassThroughGrammar::HasOOVRule(WordID word) const {
  return find(words_.begin(), words_.end(), word) != words_.end();
}

void PassThroughGrammar::AddOOVRule(WordID word) {
  if (HasOOVRule(word)) return;
  words_.push_back(word);
  AddRule(TRule::CreatePassThroughRule(default_nt_, word));
}
