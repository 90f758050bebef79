#include "chart.h"

#include <algorithm>
#include <deque>
#include <map>
#include <set>
#include <sstream>
#include <unordered_set>

#include <boost/functional/hash.hpp>

#include "array2d.h"
#include "constraint.h"
#include "errors.h"
#include "fdict.h"
#include "ffset.h"
#include "hg.h"
#include "sentence_metadata.h"
#include "stringlib.h"
#include "tdict.h"
#include "verbose.h"

using namespace std;

namespace {

typedef vector<int> JVector;

// all the nodes of one (span, label)
struct SuperNode {
  SuperNode() : cat(0), pops(0) {}
  WordID cat;
  vector<int> nodes;    // best first, once the span is finished
  map<FFState, int> state2node;
  int pops;
};

typedef map<WordID, SuperNode> Cell;

// rules sharing a label x the antecedents they are applied to.
// axis 0 is the rule, axis k the nodes of the k-th antecedent
struct Cube {
  Cube() : rules(NULL), lattice_cost() {}
  const vector<TRulePtr>* rules;
  vector<const vector<int>*> tails;
  double lattice_cost;
};

typedef map<WordID, vector<Cube> > Label2Cubes;

// life cycle: a candidate is created when it is first reached from a
// neighbour in the cube, scored immediately and put on the heap of its
// label.  Once popped it becomes an edge of the forest, attached to the
// node that has its state.
struct Candidate {
  Candidate(const Cube* c, const JVector& j, int seq) :
    cube_(c), j_(j), seq_(seq), vit_score_(kNO_SCORE), est_score_(kNO_SCORE) {}

  const Cube* cube_;
  const JVector j_;
  const int seq_;              // creation order, breaks ties
  HG::Edge out_edge_;
  FFState state_;
  double vit_score_;
  double est_score_;           // vit_score_ + future cost estimate
};

struct HeapCandCompare {
  bool operator()(const Candidate* l, const Candidate* r) const {
    if (l->est_score_ != r->est_score_)
      return l->est_score_ < r->est_score_;
    return l->seq_ > r->seq_;
  }
};

struct CandidateUniquenessHash {
  size_t operator()(const Candidate* c) const {
    size_t x = boost::hash_value(c->cube_);
    boost::hash_combine(x, boost::hash_range(c->j_.begin(), c->j_.end()));
    return x;
  }
};

struct CandidateUniquenessEquals {
  bool operator()(const Candidate* a, const Candidate* b) const {
    return (a->cube_ == b->cube_) && (a->j_ == b->j_);
  }
};

typedef unordered_set<const Candidate*, CandidateUniquenessHash, CandidateUniquenessEquals> UniqueCandidateSet;
typedef vector<Candidate*> CandidateHeap;

// what the constraints of a sentence say about one span
struct SpanFilter {
  SpanFilter() : hard(false) {}
  bool hard;
  set<WordID> labels;                // allowed labels, empty = any
  set<string> targets;               // allowed target strings of lexical rules, empty = any
  map<WordID, vector<TRulePtr> > rules;

  // a hard span with rules of its own is covered by those rules only
  bool ReplacesGrammars() const {
    return hard && !rules.empty();
  }
  bool AllowsLabel(WordID lhs) const {
    return labels.empty() || labels.count(lhs);
  }
  bool AllowsRule(const TRule& r) const {
    return targets.empty() || r.Arity() > 0 || targets.count(r.ETargetString());
  }
};

class ActiveChart {
 public:
  ActiveChart(int size, const Array2D<Cell>& psv_chart, WordID eps) :
    act_chart_(size, size), psv_chart_(psv_chart), eps_(eps) {}

  struct ActiveItem {
    ActiveItem(const GrammarIter* g, const vector<const SuperNode*>& a, double lcost) :
      gptr_(g), ants_(a), lattice_cost(lcost) {}
    explicit ActiveItem(const GrammarIter* g) :
      gptr_(g), ants_(), lattice_cost(0.0) {}

    void ExtendTerminal(WordID symbol, double src_cost, WordID eps, vector<ActiveItem>* out_cell) const {
      if (symbol == eps) {
        out_cell->push_back(ActiveItem(gptr_, ants_, lattice_cost + src_cost));
      } else {
        const GrammarIter* ni = gptr_->Extend(symbol);
        if (ni)
          out_cell->push_back(ActiveItem(ni, ants_, lattice_cost + src_cost));
      }
    }
    void ExtendNonTerminal(const SuperNode* sn, vector<ActiveItem>* out_cell) const {
      const GrammarIter* ni = gptr_->Extend(sn->cat);
      if (!ni) return;
      vector<const SuperNode*> na(ants_);
      na.push_back(sn);
      out_cell->push_back(ActiveItem(ni, na, lattice_cost));
    }

    const GrammarIter* gptr_;
    vector<const SuperNode*> ants_;
    double lattice_cost;
  };

  const vector<ActiveItem>& operator()(int i, int j) const { return act_chart_(i, j); }

  void SeedActiveChart(const Grammar& g) {
    const int size = act_chart_.width();
    for (int i = 0; i < size; ++i)
      if (g.HasRuleForSpan(i, i, 0))
        act_chart_(i, i).push_back(ActiveItem(g.GetRoot()));
  }

  void ExtendActiveItems(int i, int k, int j) {
    vector<ActiveItem>& cell = act_chart_(i, j);
    const vector<ActiveItem>& icell = act_chart_(i, k);
    const Cell& passive = psv_chart_(k, j);
    for (vector<ActiveItem>::const_iterator di = icell.begin(); di != icell.end(); ++di)
      for (Cell::const_iterator ni = passive.begin(); ni != passive.end(); ++ni)
        if (!ni->second.nodes.empty())
          di->ExtendNonTerminal(&ni->second, &cell);
  }

  void AdvanceDotsForAllItemsInCell(int i, int j, const Lattice& input) {
    for (int k = i + 1; k < j; ++k)
      ExtendActiveItems(i, k, j);

    const vector<LatticeArc>& out_arcs = input[j - 1];
    for (vector<LatticeArc>::const_iterator ai = out_arcs.begin(); ai != out_arcs.end(); ++ai) {
      const vector<ActiveItem>& ec = act_chart_(i, j - 1);
      vector<ActiveItem>* dest = &act_chart_(i, j + ai->dist2next - 1);
      for (vector<ActiveItem>::const_iterator di = ec.begin(); di != ec.end(); ++di)
        di->ExtendTerminal(ai->label, ai->cost, eps_, dest);
    }
  }

 private:
  Array2D<vector<ActiveItem> > act_chart_;
  const Array2D<Cell>& psv_chart_;
  const WordID eps_;
};

}  // namespace

class ChartImpl {
 public:
  ChartImpl(const vector<GrammarPtr>& grammars,
            const ModelSet& models,
            const SentenceMetadata& smeta,
            const ChartConfiguration& config,
            Hypergraph* forest);
  ~ChartImpl();

  bool Expand();
  int GetGoalIndex() const { return goal_idx_; }
  bool Cancelled() const { return cancelled_; }
  vector<int> NodesForSpan(int i, int j) const;
  const PassThroughGrammar& oov_grammar() const { return *oov_; }

 private:
  void AddOOVRules();
  void ReadConstraints();
  void ProcessSpan(int i, int j);
  void AddCubes(const SpanFilter* filter,
                WordID lhs,
                const vector<TRulePtr>& rules,
                const vector<const vector<int>*>& tails,
                double lattice_cost,
                Label2Cubes* cubes);
  void SearchLabel(int i, int j, const vector<Cube>& cubes, SuperNode* sn);
  void CubePrune(int i, int j, const vector<Cube>& cubes, SuperNode* sn);
  void ExhaustiveSearch(int i, int j, const vector<Cube>& cubes, SuperNode* sn);
  void InitializeCandidate(int i, int j, Candidate* cand) const;
  void PushSucc(int i, int j, const Candidate& item, deque<Candidate>* pool,
                CandidateHeap* cand, UniqueCandidateSet* cs);
  void IncorporateIntoForest(int i, int j, const Candidate& item, SuperNode* sn);
  bool Derives(int from, int target) const;
  void FinishPass(int i, int j, int first_node);
  void ConnectGoal();

  vector<GrammarPtr> grammars_;
  boost::shared_ptr<PassThroughGrammar> oov_;
  const ModelSet& models_;
  const SentenceMetadata& smeta_;
  const ChartConfiguration config_;
  const Lattice& input_;
  Hypergraph* forest_;
  Array2D<Cell> chart_;
  vector<ActiveChart*> act_chart_;
  map<Span, SpanFilter> filters_;
  deque<vector<TRulePtr> > filtered_rules_;   // rule lists narrowed by RHS constraints
  const WordID goal_cat_;
  TRulePtr goal_rule_;
  int goal_idx_;
  bool cancelled_;
  int next_seq_;
  int num_cycles_;
  int span_first_node_;       // first node of the span being built
  const int lc_fid_;
};

ChartImpl::ChartImpl(const vector<GrammarPtr>& grammars,
                     const ModelSet& models,
                     const SentenceMetadata& smeta,
                     const ChartConfiguration& config,
                     Hypergraph* forest) :
    grammars_(grammars),
    oov_(new PassThroughGrammar(config.default_nt)),
    models_(models),
    smeta_(smeta),
    config_(config),
    input_(smeta.GetSourceLattice()),
    forest_(forest),
    chart_(input_.size() + 1, input_.size() + 1),
    goal_cat_(TD::Convert(config.goal) * -1),
    goal_rule_(new TRule("[Goal] ||| [" + config.goal + ",1] ||| [1]")),
    goal_idx_(-1),
    cancelled_(false),
    next_seq_(0),
    num_cycles_(0),
    span_first_node_(0),
    lc_fid_(FD::Convert("LatticeCost")) {
  ReadConstraints();
  AddOOVRules();
  grammars_.push_back(oov_);
  const WordID eps = TD::Convert("*EPS*");
  for (unsigned gi = 0; gi < grammars_.size(); ++gi)
    act_chart_.push_back(new ActiveChart(input_.size() + 1, chart_, eps));
}

ChartImpl::~ChartImpl() {
  for (unsigned i = 0; i < act_chart_.size(); ++i)
    delete act_chart_[i];
}

void ChartImpl::ReadConstraints() {
  const vector<ConstraintSpan>& spans = smeta_.GetConstraints();
  if (spans.empty()) return;
  const int num_feats = grammars_.empty() ? 0 : grammars_.front()->NumDenseFeatures();
  const int n = input_.size();
  for (unsigned s = 0; s < spans.size(); ++s) {
    const ConstraintSpan& cs = spans[s];
    if (cs.start < 0 || cs.end > n || cs.start >= cs.end) {
      cerr << "  Ignoring constraint span [" << cs.start << ',' << cs.end
           << ") of sentence " << smeta_.GetSentenceId() << " (length " << n << ')' << endl;
      continue;
    }
    SpanFilter& filter = filters_[Span(cs.start, cs.end)];
    filter.hard = filter.hard || cs.is_hard;
    for (unsigned r = 0; r < cs.rules.size(); ++r) {
      const ConstraintRule& cr = cs.rules[r];
      switch (cr.type) {
        case ConstraintRule::LHS:
          filter.labels.insert(-TD::Convert(StripNonterminalBrackets(cr.lhs)));
          break;
        case ConstraintRule::RHS:
          filter.targets.insert(cr.native_rhs);
          break;
        case ConstraintRule::RULE: {
          if (static_cast<int>(cr.features.size()) != num_feats) {
            ostringstream os;
            os << "constraint rule [" << cr.lhs << "] ||| " << cr.foreign_rhs << " ||| " << cr.native_rhs
               << " of sentence " << smeta_.GetSentenceId() << " has " << cr.features.size()
               << " feature values, the grammar has " << num_feats;
            throw LookupInconsistency(os.str());
          }
          vector<WordID> f, e;
          TD::ConvertSentence(cr.foreign_rhs, &f);
          TD::ConvertSentence(cr.native_rhs, &e);
          TRulePtr rule(new TRule(e, f, -TD::Convert(StripNonterminalBrackets(cr.lhs))));
          for (unsigned k = 0; k < cr.features.size(); ++k)
            rule->scores_.set_value(DenseFeatureId(k), cr.features[k]);
          rule->dense_features_ = cr.features.size();
          filter.rules[rule->GetLHS()].push_back(rule);
          break;
        }
      }
    }
  }
  // constraint rules compete like grammar rules: best estimate first
  for (map<Span, SpanFilter>::iterator it = filters_.begin(); it != filters_.end(); ++it) {
    for (map<WordID, vector<TRulePtr> >::iterator ri = it->second.rules.begin();
         ri != it->second.rules.end(); ++ri) {
      vector<pair<double, int> > order(ri->second.size());
      for (unsigned k = 0; k < order.size(); ++k)
        order[k] = make_pair(-models_.EstimateRuleScore(*ri->second[k]), k);
      stable_sort(order.begin(), order.end());
      vector<TRulePtr> sorted(order.size());
      for (unsigned k = 0; k < order.size(); ++k)
        sorted[k] = ri->second[order[k].second];
      ri->second.swap(sorted);
    }
  }
}

void ChartImpl::AddOOVRules() {
  const WordID eps = TD::Convert("*EPS*");
  for (unsigned i = 0; i < input_.size(); ++i) {
    const vector<LatticeArc>& arcs = input_[i];
    for (unsigned a = 0; a < arcs.size(); ++a) {
      const WordID w = arcs[a].label;
      if (w == eps || oov_->HasOOVRule(w)) continue;
      bool known = false;
      for (unsigned gi = 0; gi < grammars_.size() && !known; ++gi)
        known = grammars_[gi]->GetRoot()->Extend(w) != NULL;
      if (!known) {
        if (!SILENT) cerr << "  OOV: " << TD::Convert(w) << endl;
        oov_->AddOOVRule(w);
      }
    }
  }
}

void ChartImpl::AddCubes(const SpanFilter* filter,
                         WordID lhs,
                         const vector<TRulePtr>& rules,
                         const vector<const vector<int>*>& tails,
                         double lattice_cost,
                         Label2Cubes* cubes) {
  if (rules.empty()) return;
  if (filter && !filter->AllowsLabel(lhs)) return;
  const vector<TRulePtr>* applicable = &rules;
  if (filter && !filter->targets.empty()) {
    filtered_rules_.push_back(vector<TRulePtr>());
    vector<TRulePtr>& kept = filtered_rules_.back();
    for (unsigned k = 0; k < rules.size(); ++k)
      if (filter->AllowsRule(*rules[k])) kept.push_back(rules[k]);
    if (kept.empty()) return;
    applicable = &kept;
  }
  vector<Cube>& label_cubes = (*cubes)[lhs];
  label_cubes.push_back(Cube());
  label_cubes.back().rules = applicable;
  label_cubes.back().tails = tails;
  label_cubes.back().lattice_cost = lattice_cost;
}

void ChartImpl::InitializeCandidate(int i, int j, Candidate* cand) const {
  const Cube& cube = *cand->cube_;
  HG::Edge& edge = cand->out_edge_;
  edge.rule_ = (*cube.rules)[cand->j_[0]];
  edge.i_ = i;
  edge.j_ = j;
  edge.tail_nodes_.resize(cube.tails.size());
  double ant_score = 0;
  for (unsigned t = 0; t < cube.tails.size(); ++t) {
    edge.tail_nodes_[t] = (*cube.tails[t])[cand->j_[t + 1]];
    ant_score += forest_->nodes_[edge.tail_nodes_[t]].best_score_;
  }
  if (cube.lattice_cost && lc_fid_)
    edge.feature_values_.set_value(lc_fid_, cube.lattice_cost);
  double future = 0;
  models_.AddFeaturesToEdge(smeta_, *forest_, &edge, &cand->state_, &future);
  cand->vit_score_ = edge.transition_score_ + ant_score;
  cand->est_score_ = cand->vit_score_ + future;
}

void ChartImpl::PushSucc(int i, int j, const Candidate& item, deque<Candidate>* pool,
                         CandidateHeap* cand, UniqueCandidateSet* cs) {
  const Cube& cube = *item.cube_;
  for (unsigned k = 0; k < item.j_.size(); ++k) {
    JVector jv = item.j_;
    ++jv[k];
    const int limit = (k == 0) ? cube.rules->size() : cube.tails[k - 1]->size();
    if (jv[k] >= limit) continue;
    const Candidate query_unique(item.cube_, jv, -1);
    if (cs->count(&query_unique)) continue;
    pool->push_back(Candidate(item.cube_, jv, next_seq_++));
    Candidate* new_cand = &pool->back();
    InitializeCandidate(i, j, new_cand);
    cand->push_back(new_cand);
    push_heap(cand->begin(), cand->end(), HeapCandCompare());
    cs->insert(new_cand);
  }
}

void ChartImpl::IncorporateIntoForest(int i, int j, const Candidate& item, SuperNode* sn) {
  map<FFState, int>::const_iterator found = sn->state2node.find(item.state_);
  int head = -1;
  if (found == sn->state2node.end()) {
    HG::Node* node = forest_->AddNode(sn->cat);
    node->i_ = i;
    node->j_ = j;
    node->state_ = item.state_;
    head = node->id_;
    sn->state2node[item.state_] = head;
    sn->nodes.push_back(head);
  } else {
    head = found->second;
    const TailNodeVector& tail = item.out_edge_.tail_nodes_;
    for (unsigned t = 0; t < tail.size(); ++t) {
      if (Derives(tail[t], head)) {
        ++num_cycles_;
        return;
      }
    }
  }
  HG::Edge* new_edge = forest_->AddEdge(item.out_edge_);
  forest_->ConnectEdgeToHeadNode(new_edge->id_, head);
}

// true if target is a node of some derivation of from (or is from itself).
// Only nodes of the current span can be reached from below.
bool ChartImpl::Derives(int from, int target) const {
  if (from == target) return true;
  if (from < span_first_node_ || target < span_first_node_) return false;
  vector<bool> seen(forest_->nodes_.size() - span_first_node_, false);
  vector<int> stack(1, from);
  seen[from - span_first_node_] = true;
  while (!stack.empty()) {
    const HG::Node& node = forest_->nodes_[stack.back()];
    stack.pop_back();
    for (unsigned k = 0; k < node.in_edges_.size(); ++k) {
      const TailNodeVector& tail = forest_->edges_[node.in_edges_[k]].tail_nodes_;
      for (unsigned t = 0; t < tail.size(); ++t) {
        const int ni = tail[t];
        if (ni == target) return true;
        if (ni < span_first_node_ || seen[ni - span_first_node_]) continue;
        seen[ni - span_first_node_] = true;
        stack.push_back(ni);
      }
    }
  }
  return false;
}

void ChartImpl::CubePrune(int i, int j, const vector<Cube>& cubes, SuperNode* sn) {
  deque<Candidate> pool;
  CandidateHeap cand;
  UniqueCandidateSet unique_cands;
  cand.reserve(cubes.size());
  for (unsigned c = 0; c < cubes.size(); ++c) {
    pool.push_back(Candidate(&cubes[c], JVector(cubes[c].tails.size() + 1, 0), next_seq_++));
    InitializeCandidate(i, j, &pool.back());
    cand.push_back(&pool.back());
    unique_cands.insert(&pool.back());
  }
  make_heap(cand.begin(), cand.end(), HeapCandCompare());
  while (!cand.empty() && sn->pops < config_.pop_limit) {
    pop_heap(cand.begin(), cand.end(), HeapCandCompare());
    Candidate* item = cand.back();
    cand.pop_back();
    PushSucc(i, j, *item, &pool, &cand, &unique_cands);
    IncorporateIntoForest(i, j, *item, sn);
    ++sn->pops;
  }
}

void ChartImpl::ExhaustiveSearch(int i, int j, const vector<Cube>& cubes, SuperNode* sn) {
  for (unsigned c = 0; c < cubes.size(); ++c) {
    const Cube& cube = cubes[c];
    JVector jv(cube.tails.size() + 1, 0);
    while (true) {
      Candidate cand(&cube, jv, next_seq_++);
      InitializeCandidate(i, j, &cand);
      IncorporateIntoForest(i, j, cand, sn);
      ++sn->pops;
      // odometer over all the axes of the cube
      unsigned k = 0;
      for (; k < jv.size(); ++k) {
        const int limit = (k == 0) ? cube.rules->size() : cube.tails[k - 1]->size();
        if (++jv[k] < limit) break;
        jv[k] = 0;
      }
      if (k == jv.size()) break;
    }
  }
}

void ChartImpl::SearchLabel(int i, int j, const vector<Cube>& cubes, SuperNode* sn) {
  if (config_.algorithm == FULL)
    ExhaustiveSearch(i, j, cubes, sn);
  else
    CubePrune(i, j, cubes, sn);
}

namespace {
struct BestScoreSorter {
  explicit BestScoreSorter(const Hypergraph& hg) : hg_(hg) {}
  bool operator()(int a, int b) const {
    const double sa = hg_.nodes_[a].best_score_;
    const double sb = hg_.nodes_[b].best_score_;
    return sa > sb || (sa == sb && a < b);
  }
  const Hypergraph& hg_;
};
}

void ChartImpl::FinishPass(int i, int j, int first_node) {
  // unary edges may point at nodes created before their tails
  vector<int> reloc;
  if (!forest_->TopologicallySortNodes(first_node, &reloc)) {
    ostringstream os;
    os << "unary edges form a cycle in span " << Span(i, j);
    throw IndexInconsistency(os.str());
  }
  forest_->ComputeBestScores(first_node);
  Cell& cell = chart_(i, j);
  for (Cell::iterator it = cell.begin(); it != cell.end(); ) {
    SuperNode& sn = it->second;
    if (sn.nodes.empty()) {
      cell.erase(it++);
      continue;
    }
    for (unsigned k = 0; k < sn.nodes.size(); ++k)
      sn.nodes[k] = reloc[sn.nodes[k]];
    for (map<FFState, int>::iterator si = sn.state2node.begin(); si != sn.state2node.end(); ++si)
      si->second = reloc[si->second];
    sort(sn.nodes.begin(), sn.nodes.end(), BestScoreSorter(*forest_));
    ++it;
  }
}

void ChartImpl::ProcessSpan(int i, int j) {
  const int first_node = forest_->nodes_.size();
  span_first_node_ = first_node;
  const int distance = input_.Distance(i, j);
  map<Span, SpanFilter>::const_iterator fi = filters_.find(Span(i, j));
  const SpanFilter* filter = (fi == filters_.end()) ? NULL : &fi->second;
  const bool use_grammars = !(filter && filter->ReplacesGrammars());

  Label2Cubes cubes;
  set<WordID> unary_lhs;
  for (unsigned gi = 0; gi < grammars_.size(); ++gi) {
    const Grammar& g = *grammars_[gi];
    if (!g.HasRuleForSpan(i, j, distance)) continue;
    act_chart_[gi]->AdvanceDotsForAllItemsInCell(i, j, input_);
    if (!use_grammars) continue;
    const vector<TRulePtr>& unaries = g.GetAllUnaryRules();
    for (unsigned u = 0; u < unaries.size(); ++u)
      unary_lhs.insert(unaries[u]->GetLHS());
    const vector<ActiveChart::ActiveItem>& cell = (*act_chart_[gi])(i, j);
    for (unsigned a = 0; a < cell.size(); ++a) {
      const ActiveChart::ActiveItem& ai = cell[a];
      const RuleBin* rules = ai.gptr_->GetRules();
      if (!rules) continue;
      vector<const vector<int>*> tails(ai.ants_.size());
      for (unsigned k = 0; k < tails.size(); ++k)
        tails[k] = &ai.ants_[k]->nodes;
      const RuleGroups& groups = rules->GetSortedRules(models_);
      for (unsigned r = 0; r < groups.size(); ++r)
        AddCubes(filter, groups[r].lhs, groups[r].rules, tails, ai.lattice_cost, &cubes);
    }
  }
  if (filter) {
    const vector<const vector<int>*> no_tails;
    for (map<WordID, vector<TRulePtr> >::const_iterator ri = filter->rules.begin();
         ri != filter->rules.end(); ++ri)
      AddCubes(filter, ri->first, ri->second, no_tails, 0.0, &cubes);
  }

  Cell& cell = chart_(i, j);
  for (Label2Cubes::const_iterator it = cubes.begin(); it != cubes.end(); ++it) {
    SuperNode& sn = cell[it->first];
    sn.cat = it->first;
    SearchLabel(i, j, it->second, &sn);
  }
  FinishPass(i, j, first_node);

  // one level of unary rules over the nodes found so far
  if (use_grammars && !unary_lhs.empty()) {
    map<WordID, vector<int> > rhs_nodes;
    for (Cell::const_iterator it = cell.begin(); it != cell.end(); ++it)
      rhs_nodes[it->first] = it->second.nodes;
    deque<vector<TRulePtr> > groups;
    Label2Cubes unary_cubes;
    for (unsigned gi = 0; gi < grammars_.size(); ++gi) {
      const Grammar& g = *grammars_[gi];
      if (!g.HasRuleForSpan(i, j, distance)) continue;
      for (map<WordID, vector<int> >::const_iterator ri = rhs_nodes.begin(); ri != rhs_nodes.end(); ++ri) {
        const vector<TRulePtr>& unaries = g.GetUnaryRulesForRHS(ri->first);
        if (unaries.empty()) continue;
        map<WordID, vector<TRulePtr> > by_lhs;
        for (unsigned u = 0; u < unaries.size(); ++u)
          if (unaries[u]->GetLHS() != ri->first)
            by_lhs[unaries[u]->GetLHS()].push_back(unaries[u]);
        const vector<const vector<int>*> tail(1, &ri->second);
        for (map<WordID, vector<TRulePtr> >::iterator li = by_lhs.begin(); li != by_lhs.end(); ++li) {
          groups.push_back(vector<TRulePtr>());
          groups.back().swap(li->second);
          AddCubes(filter, li->first, groups.back(), tail, 0.0, &unary_cubes);
        }
      }
    }
    for (Label2Cubes::const_iterator it = unary_cubes.begin(); it != unary_cubes.end(); ++it) {
      SuperNode& sn = cell[it->first];
      sn.cat = it->first;
      SearchLabel(i, j, it->second, &sn);
    }
    FinishPass(i, j, first_node);
  }
  filtered_rules_.clear();

  // nonterminals that were just proved
  for (unsigned gi = 0; gi < grammars_.size(); ++gi)
    if (grammars_[gi]->HasRuleForSpan(i, j, distance))
      act_chart_[gi]->ExtendActiveItems(i, i, j);
}

void ChartImpl::ConnectGoal() {
  const int n = input_.size();
  const Cell& top = chart_(0, n);
  Cell::const_iterator gs = top.find(goal_cat_);
  if (gs == top.end() || gs->second.nodes.empty()) return;
  const vector<int>& goal_cat_nodes = gs->second.nodes;
  HG::Node* goal = forest_->AddNode(goal_rule_->GetLHS());
  goal->i_ = 0;
  goal->j_ = n;
  goal_idx_ = goal->id_;
  for (unsigned k = 0; k < goal_cat_nodes.size(); ++k) {
    HG::Edge edge;
    edge.rule_ = goal_rule_;
    edge.tail_nodes_.push_back(goal_cat_nodes[k]);
    edge.i_ = 0;
    edge.j_ = n;
    models_.AddFinalFeatures(forest_->nodes_[goal_cat_nodes[k]].state_, &edge, smeta_);
    HG::Edge* new_edge = forest_->AddEdge(edge);
    forest_->ConnectEdgeToHeadNode(new_edge->id_, goal_idx_);
  }
  forest_->ComputeBestScores(goal_idx_);
}

bool ChartImpl::Expand() {
  goal_idx_ = -1;
  for (unsigned gi = 0; gi < grammars_.size(); ++gi) {
    grammars_[gi]->SortGrammar(models_);
    act_chart_[gi]->SeedActiveChart(*grammars_[gi]);
  }
  const int n = input_.size();
  if (!SILENT) cerr << "  Goal category: [" << config_.goal << ']' << endl << "    ";
  for (int l = 1; l <= n; ++l) {
    if (!SILENT) cerr << '.';
    for (int i = 0; i + l <= n; ++i) {
      if (smeta_.Cancelled()) {
        cancelled_ = true;
        if (!SILENT) cerr << endl << "  Cancelled at span [" << i << ',' << (i + l) << ')' << endl;
        return false;
      }
      ProcessSpan(i, i + l);
    }
  }
  if (!SILENT) cerr << endl;
  ConnectGoal();
  if (!SILENT) {
    if (num_cycles_)
      cerr << "  Discarded " << num_cycles_ << " unary edges that would make cycles" << endl;
    cerr << "  " << forest_->stats("chart");
    if (goal_idx_ < 0)
      cerr << "  No derivation of [" << config_.goal << "] covers the input" << endl;
  }
  return goal_idx_ >= 0;
}

vector<int> ChartImpl::NodesForSpan(int i, int j) const {
  vector<int> res;
  const Cell& cell = chart_(i, j);
  for (Cell::const_iterator it = cell.begin(); it != cell.end(); ++it)
    res.insert(res.end(), it->second.nodes.begin(), it->second.nodes.end());
  return res;
}

Chart::Chart(const vector<GrammarPtr>& grammars,
             const ModelSet& models,
             const SentenceMetadata& smeta,
             const ChartConfiguration& config,
             Hypergraph* forest) :
    pimpl_(new ChartImpl(grammars, models, smeta, config, forest)) {}

Chart::~Chart() {}

bool Chart::Expand() {
  return pimpl_->Expand();
}

int Chart::GetGoalIndex() const {
  return pimpl_->GetGoalIndex();
}

bool Chart::Cancelled() const {
  return pimpl_->Cancelled();
}

vector<int> Chart::NodesForSpan(int i, int j) const {
  return pimpl_->NodesForSpan(i, j);
}

const PassThroughGrammar& Chart::oov_grammar() const {
  return pimpl_->oov_grammar();
}
