#include "tree_fragment.h"

#include <sstream>
#include <stdexcept>

#include "errors.h"
#include "filelib.h"
#include "stringlib.h"
#include "tdict.h"
#include "trule.h"
#include "verbose.h"

using namespace std;

namespace chartdec {

TreeFragmentPtr TreeFragment::Terminal(const string& word) {
  return TreeFragmentPtr(new TreeFragment(word, true));
}

TreeFragmentPtr TreeFragment::Frontier(const string& label) {
  return TreeFragmentPtr(new TreeFragment(label, false));
}

TreeFragmentPtr TreeFragment::Internal(const string& label, const vector<TreeFragmentPtr>& children) {
  TreeFragment* t = new TreeFragment(label, false);
  t->children_ = children;
  return TreeFragmentPtr(t);
}

namespace {

struct TreeReader {
  explicit TreeReader(const string& t) : tree(t), cp(0) {}

  void Fail(const string& what) const {
    ostringstream os;
    os << "Badly formed tree, " << what << " at column " << (cp + 1) << " in: " << tree;
    throw runtime_error(os.str());
  }
  void SkipWS() {
    while (cp < tree.size() && (tree[cp] == ' ' || tree[cp] == '\t')) ++cp;
  }
  bool AtEnd() const { return cp >= tree.size(); }
  string Token() {
    const size_t start = cp;
    while (cp < tree.size() && tree[cp] != ' ' && tree[cp] != '\t'
           && tree[cp] != '(' && tree[cp] != ')' && tree[cp] != '"') ++cp;
    if (cp == start) Fail("expected a label");
    return tree.substr(start, cp - start);
  }
  string Quoted() {
    ++cp;  // opening quote
    const size_t start = cp;
    while (cp < tree.size() && tree[cp] != '"') ++cp;
    if (AtEnd()) Fail("unterminated terminal");
    const string word = tree.substr(start, cp - start);
    ++cp;
    if (word.empty()) Fail("empty terminal");
    return word;
  }

  // cp is at '(' of a constituent
  TreeFragmentPtr ParseRec() {
    if (AtEnd() || tree[cp] != '(') Fail("expected (");
    ++cp;
    SkipWS();
    const string label = Token();
    vector<TreeFragmentPtr> children;
    SkipWS();
    while (true) {
      if (AtEnd()) Fail("missing )");
      const char c = tree[cp];
      if (c == ')') break;
      if (c == '(') {
        children.push_back(ParseRec());
      } else if (c == '"') {
        children.push_back(TreeFragment::Terminal(Quoted()));
      } else {
        children.push_back(TreeFragment::Frontier(Token()));
      }
      SkipWS();
    }
    ++cp;
    if (children.empty()) Fail("constituent without children");
    return TreeFragment::Internal(label, children);
  }

  const string& tree;
  size_t cp;
};

}  // namespace

TreeFragmentPtr TreeFragment::FromString(const string& tree) {
  TreeReader reader(tree);
  reader.SkipWS();
  TreeFragmentPtr res = reader.ParseRec();
  reader.SkipWS();
  if (!reader.AtEnd()) reader.Fail("trailing characters");
  return res;
}

void TreeFragment::Print(ostream* out) const {
  if (terminal_) {
    *out << '"' << label_ << '"';
    return;
  }
  if (children_.empty()) {
    *out << label_;
    return;
  }
  *out << '(' << label_;
  for (unsigned i = 0; i < children_.size(); ++i) {
    *out << ' ';
    children_[i]->Print(out);
  }
  *out << ')';
}

string TreeFragment::ToString() const {
  ostringstream os;
  Print(&os);
  return os.str();
}

ostream& operator<<(ostream& out, const TreeFragment& t) {
  t.Print(&out);
  return out;
}

void TreeFragment::NonterminalYieldRec(vector<string>* out) const {
  if (IsFrontier()) out->push_back(label_);
  for (unsigned i = 0; i < children_.size(); ++i)
    children_[i]->NonterminalYieldRec(out);
}

vector<string> TreeFragment::NonterminalYield() const {
  vector<string> res;
  NonterminalYieldRec(&res);
  return res;
}

void TreeFragment::TerminalsRec(vector<string>* out) const {
  if (terminal_) out->push_back(label_);
  for (unsigned i = 0; i < children_.size(); ++i)
    children_[i]->TerminalsRec(out);
}

vector<string> TreeFragment::Terminals() const {
  vector<string> res;
  TerminalsRec(&res);
  return res;
}

int TreeFragment::NumFrontierSites() const {
  if (IsFrontier()) return 1;
  int n = 0;
  for (unsigned i = 0; i < children_.size(); ++i)
    n += children_[i]->NumFrontierSites();
  return n;
}

int TreeFragment::Depth() const {
  int d = 0;
  for (unsigned i = 0; i < children_.size(); ++i)
    d = max(d, children_[i]->Depth());
  return d + 1;
}

TreeFragmentPtr TreeFragment::SubstituteRec(const vector<TreeFragmentPtr>& subtrees, unsigned* next) const {
  if (IsFrontier()) {
    const TreeFragmentPtr& sub = subtrees[(*next)++];
    return sub ? sub : Frontier(label_);
  }
  if (terminal_) return Terminal(label_);
  vector<TreeFragmentPtr> children(children_.size());
  for (unsigned i = 0; i < children_.size(); ++i)
    children[i] = children_[i]->SubstituteRec(subtrees, next);
  return Internal(label_, children);
}

TreeFragmentPtr TreeFragment::Substitute(const vector<TreeFragmentPtr>& subtrees) const {
  if (static_cast<int>(subtrees.size()) != NumFrontierSites()) {
    ostringstream os;
    os << "tree " << *this << " has " << NumFrontierSites() << " frontier sites, got "
       << subtrees.size() << " subtrees";
    throw IndexInconsistency(os.str());
  }
  unsigned next = 0;
  return SubstituteRec(subtrees, &next);
}

void FragmentMap::ReadFromFile(const string& filename) {
  ReadFile rf(filename);
  ReadFromStream(rf.stream(), filename);
}

void FragmentMap::ReadFromStream(istream* in, const string& name) {
  string line;
  int lc = 0;
  vector<string> fields;
  while (getline(*in, line)) {
    ++lc;
    if (Trim(line).empty()) continue;
    SplitOnTripleBar(line, &fields);
    if (fields.size() != 2 || fields[0].empty() || fields[1].empty()) {
      ostringstream os;
      os << name << ":" << lc << ": expected <fragment> ||| <target>";
      throw ConfigurationError(os.str());
    }
    try {
      Add(fields[1], TreeFragment::FromString(fields[0]));
    } catch (const runtime_error& e) {
      ostringstream os;
      os << name << ":" << lc << ": " << e.what();
      throw ConfigurationError(os.str());
    }
  }
  if (!SILENT) cerr << "  " << name << ": " << fragments_.size() << " tree fragments" << endl;
}

void FragmentMap::Add(const string& target, const TreeFragmentPtr& fragment) {
  fragments_[target] = fragment;
}

TreeFragmentPtr FragmentMap::Find(const TRule& rule) const {
  if (fragments_.empty()) return TreeFragmentPtr();
  map<string, TreeFragmentPtr>::const_iterator it = fragments_.find(rule.ETargetString());
  if (it == fragments_.end()) return TreeFragmentPtr();
  return it->second;
}

namespace {

void LogMismatch(const TRule& rule, const vector<TreeFragmentPtr>& ants, const TreeFragmentPtr& partial) {
  cerr << "Tree fragment does not fit rule " << rule.AsString() << endl;
  cerr << "  fragment: " << (partial ? partial->ToString() : string("NONE")) << endl;
  for (unsigned i = 0; i < ants.size(); ++i)
    cerr << "  tail " << i << ": " << (ants[i] ? ants[i]->ToString() : string("NONE")) << endl;
}

}

TreeFragmentPtr FragmentMap::Apply(const TRule& rule, const vector<TreeFragmentPtr>& ants) const {
  if (static_cast<int>(ants.size()) != rule.Arity()) {
    LogMismatch(rule, ants, TreeFragmentPtr());
    ostringstream os;
    os << "rule of arity " << rule.Arity() << " applied to " << ants.size() << " tails";
    throw IndexInconsistency(os.str());
  }
  const vector<WordID>& e = rule.e();
  const TreeFragmentPtr fragment = Find(rule);
  if (!fragment) {
    vector<TreeFragmentPtr> children;
    for (unsigned i = 0; i < e.size(); ++i) {
      if (e[i] < 0) {
        const int t = -(e[i] + 1);
        children.push_back(ants[t] ? ants[t] : TreeFragment::Frontier(TD::Convert(rule.NonterminalCategory(t))));
      } else {
        children.push_back(TreeFragment::Terminal(TD::Convert(e[i])));
      }
    }
    if (children.empty()) children.push_back(TreeFragment::Terminal("<eps>"));
    return TreeFragment::Internal(TD::Convert(-rule.GetLHS()), children);
  }

  vector<TreeFragmentPtr> subtrees;
  for (unsigned i = 0; i < e.size(); ++i)
    if (e[i] < 0) subtrees.push_back(ants[-(e[i] + 1)]);
  if (static_cast<int>(subtrees.size()) != fragment->NumFrontierSites()) {
    LogMismatch(rule, ants, fragment);
    ostringstream os;
    os << "fragment " << *fragment << " has " << fragment->NumFrontierSites()
       << " frontier sites, the rule has " << subtrees.size() << " nonterminals";
    throw IndexInconsistency(os.str());
  }
  return fragment->Substitute(subtrees);
}

}  // namespace chartdec
