#ifndef CHART_H_
#define CHART_H_

#include <string>
#include <vector>

#include <boost/shared_ptr.hpp>

#include "grammar.h"
#include "lattice.h"

class Hypergraph;
class ModelSet;
class SentenceMetadata;
class ChartImpl;

enum IntersectionAlgorithm {
  FULL,
  CUBE
};

struct ChartConfiguration {
  ChartConfiguration() :
    algorithm(CUBE),
    pop_limit(200),
    goal("S"),
    default_nt("X") {}
  IntersectionAlgorithm algorithm;
  // maximal number of candidates popped per (span, label) in CUBE mode
  int pop_limit;
  std::string goal;
  // label of the rules made for unknown words
  std::string default_nt;
};

// Bottom-up chart parser that builds the scored forest of one sentence.
// Each node of the forest is a (span, label, state) equivalence class;
// edges are found by cube pruning (or exhaustively, for FULL) and
// scored by the models as they are built.
//
// The grammars are shared with other sentences and are never modified.
// Unknown words get rules in a grammar owned by the chart.
class Chart {
 public:
  // throws LookupInconsistency if a constraint rule of the sentence
  // doesn't have as many feature values as the first grammar
  Chart(const std::vector<GrammarPtr>& grammars,
        const ModelSet& models,
        const SentenceMetadata& smeta,
        const ChartConfiguration& config,
        Hypergraph* forest);
  ~Chart();

  // fills the forest.  returns false if no derivation of the goal
  // category covers the sentence (or the decode was cancelled)
  bool Expand();
  // the goal node, -1 if there is none
  int GetGoalIndex() const;
  bool Cancelled() const;
  // node ids of the span, grouped by label
  std::vector<int> NodesForSpan(int i, int j) const;
  const PassThroughGrammar& oov_grammar() const;

 private:
  boost::shared_ptr<ChartImpl> pimpl_;
};

#endif
