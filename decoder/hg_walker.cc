#include "hg_walker.h"

#include <boost/bind.hpp>

using namespace std;

void ForestWalker::Walk(const Hypergraph& hg, int root, const NodeVisitor& visitor) const {
  vector<bool> visited(hg.nodes_.size(), false);
  WalkRec(hg, root, -1, &visited, visitor);
}

void ForestWalker::Walk(const Hypergraph& hg, const NodeVisitor& visitor) const {
  if (hg.empty()) return;
  Walk(hg, hg.GoalNode(), visitor);
}

void ForestWalker::WalkRec(const Hypergraph& hg, int node, int tail_index,
                           vector<bool>* visited, const NodeVisitor& visitor) const {
  if ((*visited)[node]) return;
  (*visited)[node] = true;
  const HG::Node& n = hg.nodes_[node];
  if (order_ == PREORDER) visitor(n, tail_index);

  if (mode_ == BEST_EDGE) {
    if (n.best_edge_ >= 0) {
      const HG::Edge& edge = hg.edges_[n.best_edge_];
      for (unsigned k = 0; k < edge.tail_nodes_.size(); ++k)
        WalkRec(hg, edge.tail_nodes_[k], k, visited, visitor);
    }
  } else {
    for (unsigned i = 0; i < n.in_edges_.size(); ++i) {
      const HG::Edge& edge = hg.edges_[n.in_edges_[i]];
      for (unsigned k = 0; k < edge.tail_nodes_.size(); ++k)
        WalkRec(hg, edge.tail_nodes_[k], k, visited, visitor);
    }
  }

  if (order_ == POSTORDER) visitor(n, tail_index);
}

void AllSpansWalker::VisitSpan(const NodeVisitor& visitor, const HG::Node& node, int tail_index) {
  if (node.i_ < 0 || node.j_ <= node.i_) return;
  if (visited_spans_.insert(node.span()).second)
    visitor(node, tail_index);
}

void AllSpansWalker::Walk(const Hypergraph& hg, int root, const NodeVisitor& visitor) {
  walker_.Walk(hg, root, boost::bind(&AllSpansWalker::VisitSpan, this, boost::cref(visitor), _1, _2));
}

void AllSpansWalker::Walk(const Hypergraph& hg, const NodeVisitor& visitor) {
  if (hg.empty()) return;
  Walk(hg, hg.GoalNode(), visitor);
}
