#ifndef TREE_FRAGMENT_H_
#define TREE_FRAGMENT_H_

#include <iostream>
#include <map>
#include <string>
#include <vector>

#include <boost/shared_ptr.hpp>

class TRule;

namespace chartdec {

class TreeFragment;
typedef boost::shared_ptr<const TreeFragment> TreeFragmentPtr;

// An immutable tree written in PTB style, e.g.
//   (S (NP "the" "man") VP)
// quoted leaves are terminals, unquoted leaves are frontier sites
// (nonterminals that still have to be filled in by a subtree).
// Trees share their subtrees; nothing is modified once built.
class TreeFragment {
 public:
  static TreeFragmentPtr Terminal(const std::string& word);
  static TreeFragmentPtr Frontier(const std::string& label);
  static TreeFragmentPtr Internal(const std::string& label,
                                  const std::vector<TreeFragmentPtr>& children);
  // throws std::runtime_error if tree is not well formed
  static TreeFragmentPtr FromString(const std::string& tree);

  const std::string& label() const { return label_; }
  const std::vector<TreeFragmentPtr>& children() const { return children_; }
  bool IsTerminal() const { return terminal_; }
  bool IsFrontier() const { return !terminal_ && children_.empty(); }

  std::string ToString() const;
  void Print(std::ostream* out) const;

  // labels of the frontier sites, left to right
  std::vector<std::string> NonterminalYield() const;
  std::vector<std::string> Terminals() const;
  int NumFrontierSites() const;
  int Depth() const;

  // returns a new tree where the k-th frontier site is replaced by
  // subtrees[k]; a NULL entry leaves the site in place.
  // subtrees.size() must be NumFrontierSites()
  TreeFragmentPtr Substitute(const std::vector<TreeFragmentPtr>& subtrees) const;

 private:
  TreeFragment(const std::string& label, bool terminal) : label_(label), terminal_(terminal) {}
  void NonterminalYieldRec(std::vector<std::string>* out) const;
  void TerminalsRec(std::vector<std::string>* out) const;
  TreeFragmentPtr SubstituteRec(const std::vector<TreeFragmentPtr>& subtrees, unsigned* next) const;

  std::string label_;
  bool terminal_;
  std::vector<TreeFragmentPtr> children_;
};

std::ostream& operator<<(std::ostream& out, const TreeFragment& t);

// Tree fragments of the rules, keyed by the target side of the rule
// (as written by TRule::ETargetString, e.g. "[NP,1] said [SBAR,2]").
// Loaded once, read only afterwards.
class FragmentMap {
 public:
  // lines: <fragment> ||| <target side>
  // throws ConfigurationError
  void ReadFromFile(const std::string& filename);
  void ReadFromStream(std::istream* in, const std::string& name = "UNKNOWN");
  void Add(const std::string& target, const TreeFragmentPtr& fragment);
  // NULL if the rule has no fragment
  TreeFragmentPtr Find(const TRule& rule) const;
  size_t size() const { return fragments_.size(); }
  bool empty() const { return fragments_.empty(); }

  // tree of the application of rule to tails whose trees are ants (in
  // tail order).  The frontier site of the k-th target nonterminal receives
  // the tree of the tail that nonterminal refers to.  A rule without a
  // fragment becomes (LHS w1 ... wn).  A NULL ant leaves its site open.
  // throws IndexInconsistency if rule and fragment don't line up
  TreeFragmentPtr Apply(const TRule& rule, const std::vector<TreeFragmentPtr>& ants) const;

 private:
  std::map<std::string, TreeFragmentPtr> fragments_;
};

}  // namespace chartdec

#endif
