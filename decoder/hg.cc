#include "hg.h"

#include <algorithm>
#include <set>
#include <sstream>

using namespace std;

std::string Hypergraph::stats(std::string const& name) const
{
  ostringstream o;
  o<<name<<" (nodes/edges): "<<nodes_.size()<<'/'<<edges_.size()<<endl;
  return o.str();
}

void Hypergraph::ComputeBestScores(int first, int last) {
  if (last < 0) last = nodes_.size();
  for (int n = first; n < last; ++n) {
    Node& node = nodes_[n];
    node.best_edge_ = -1;
    node.best_score_ = kNO_SCORE;
    for (unsigned k = 0; k < node.in_edges_.size(); ++k) {
      Edge& edge = edges_[node.in_edges_[k]];
      double s = edge.transition_score_;
      for (unsigned t = 0; t < edge.tail_nodes_.size(); ++t)
        s += nodes_[edge.tail_nodes_[t]].best_score_;
      edge.best_score_ = s;
      if (node.best_edge_ < 0 || s > node.best_score_) {
        node.best_score_ = s;
        node.best_edge_ = edge.id_;
      }
    }
  }
}

namespace {
enum ColorType { WHITE, GRAY, BLACK };

struct DFSContext {
  DFSContext(int n, int e, int t) : node(n), edge_iter(e), tail_iter(t) {}
  int node;
  int edge_iter;
  int tail_iter;
};
}

bool Hypergraph::TopologicallySortNodes(int first, vector<int>* reloc_node) {
  const int num_nodes = nodes_.size();
  vector<int>& reloc = *reloc_node;
  reloc.resize(num_nodes);
  for (int i = 0; i < num_nodes; ++i) reloc[i] = i;
  if (first >= num_nodes) return true;

  // post-order DFS over the tails that are in the range; a node gets its
  // new index once all of its tails have one
  vector<ColorType> color(num_nodes - first, WHITE);
  vector<DFSContext> stack;
  int node_count = first;
  for (int root = first; root < num_nodes; ++root) {
    if (color[root - first] != WHITE) continue;
    color[root - first] = GRAY;
    stack.push_back(DFSContext(root, 0, 0));
    while (!stack.empty()) {
      DFSContext& p = stack.back();
      const Node& cur_node = nodes_[p.node];
      if (p.edge_iter == static_cast<int>(cur_node.in_edges_.size())) {
        color[p.node - first] = BLACK;
        reloc[p.node] = node_count++;
        stack.pop_back();
        continue;
      }
      const Edge& cur_edge = edges_[cur_node.in_edges_[p.edge_iter]];
      if (p.tail_iter == static_cast<int>(cur_edge.tail_nodes_.size())) {
        ++p.edge_iter;
        p.tail_iter = 0;
        continue;
      }
      const int tail_ni = cur_edge.tail_nodes_[p.tail_iter++];
      if (tail_ni < first) continue;
      const ColorType tail_color = color[tail_ni - first];
      if (tail_color == GRAY) {
        for (int i = first; i < num_nodes; ++i) reloc[i] = i;
        return false;
      }
      if (tail_color == WHITE) {
        color[tail_ni - first] = GRAY;
        stack.push_back(DFSContext(tail_ni, 0, 0));
      }
    }
  }

  bool no_op = true;
  for (int i = first; i < num_nodes && no_op; ++i)
    if (reloc[i] != i) no_op = false;
  if (no_op) return true;

  // every edge that refers to a moved node is an in or out edge of one
  set<int> touched;
  for (int i = first; i < num_nodes; ++i) {
    touched.insert(nodes_[i].in_edges_.begin(), nodes_[i].in_edges_.end());
    touched.insert(nodes_[i].out_edges_.begin(), nodes_[i].out_edges_.end());
  }
  for (set<int>::const_iterator it = touched.begin(); it != touched.end(); ++it) {
    Edge& edge = edges_[*it];
    edge.head_node_ = reloc[edge.head_node_];
    for (unsigned t = 0; t < edge.tail_nodes_.size(); ++t)
      edge.tail_nodes_[t] = reloc[edge.tail_nodes_[t]];
  }
  vector<Node> moved(nodes_.begin() + first, nodes_.end());
  for (unsigned k = 0; k < moved.size(); ++k) {
    const int ni = reloc[first + k];
    swap(nodes_[ni], moved[k]);
    nodes_[ni].id_ = ni;
  }
  return true;
}
