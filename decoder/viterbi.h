#ifndef _VITERBI_H_
#define _VITERBI_H_

#include <algorithm>
#include <vector>
#include "hg.h"
#include "wordid.h"

// best derivation of every node, bottom up in node order, and a value built
// from it by Traversal.  Ties go to the in edge that was added first.
// Traversal must implement:
//  typedef T Result;
//  void operator()(HG::Edge const& e, const vector<const Result*>& ants, Result* result) const;
// Returns the score of the goal node (the last one), kNO_SCORE for an empty forest.
template<class Traversal>
double Viterbi(const Hypergraph& hg,
               typename Traversal::Result* result,
               const Traversal& traverse = Traversal()) {
  typedef typename Traversal::Result T;
  const int num_nodes = hg.nodes_.size();
  if (num_nodes == 0) return kNO_SCORE;
  std::vector<T> vit_result(num_nodes);
  std::vector<double> vit_score(num_nodes, kNO_SCORE);

  for (int i = 0; i < num_nodes; ++i) {
    const HG::Node& node = hg.nodes_[i];
    if (node.in_edges_.empty()) {
      vit_score[i] = 0;
      continue;
    }
    const HG::Edge* best = NULL;
    for (unsigned k = 0; k < node.in_edges_.size(); ++k) {
      const HG::Edge& edge = hg.edges_[node.in_edges_[k]];
      double score = edge.transition_score_;
      for (unsigned t = 0; t < edge.tail_nodes_.size(); ++t)
        score += vit_score[edge.tail_nodes_[t]];
      if (!best || vit_score[i] < score) {
        vit_score[i] = score;
        best = &edge;
      }
    }
    std::vector<const T*> ants(best->tail_nodes_.size());
    for (unsigned t = 0; t < ants.size(); ++t)
      ants[t] = &vit_result[best->tail_nodes_[t]];
    traverse(*best, ants, &vit_result[i]);
  }
  std::swap(*result, vit_result.back());
  return vit_score.back();
}

// target yield of the derivation
struct ESentenceTraversal {
  typedef std::vector<WordID> Result;
  void operator()(const HG::Edge& edge,
                  const std::vector<const Result*>& ants,
                  Result* result) const {
    edge.rule_->ESubstitute(ants, result);
  }
};

double ViterbiESentence(const Hypergraph& hg, std::vector<WordID>* result);

#endif
