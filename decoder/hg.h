#ifndef _HG_H_
#define _HG_H_

#include <limits>
#include <string>
#include <vector>

#include "ffset.h"
#include "sparse_vector.h"
#include "span.h"
#include "tdict.h"
#include "trule.h"
#include "weights.h"
#include "wordid.h"

typedef std::vector<int> TailNodeVector; // indices in nodes_
typedef std::vector<int> EdgesVector; // indices in edges_

// score of something that has no derivation
const double kNO_SCORE = -std::numeric_limits<double>::infinity();

namespace HG {

  // one derivation step: rule_ applied to the derivations of tail_nodes_
  struct Edge {
    Edge() : head_node_(-1), transition_score_(), best_score_(kNO_SCORE), id_(-1), i_(-1), j_(-1) {}
    inline int Arity() const { return tail_nodes_.size(); }
    int head_node_;               // refers to a position in nodes_
    TailNodeVector tail_nodes_;   // contents refer to positions in nodes_
    TRulePtr rule_;
    SparseVector<double> feature_values_;
    double transition_score_;     // dot product of weights and feature_values_
    double best_score_;           // transition_score_ + best scores of the tails
    int id_;   // equal to this object's position in the edges_ vector
    // source span covered by the edge
    short int i_;
    short int j_;
  };

  // equivalence class of derivations sharing span, category and state
  struct Node {
    Node() : id_(), cat_(), i_(-1), j_(-1), best_edge_(-1), best_score_(kNO_SCORE) {}
    int id_; // equal to this object's position in the nodes_ vector
    WordID cat_;  // non-terminal category if <0, 0 if not set
    WordID NT() const { return -cat_; }
    short int i_;
    short int j_;
    FFState state_;
    EdgesVector in_edges_;   // an in edge is an edge with this node as its head.  (in edges come from the bottom up to us)  indices in edges_
    EdgesVector out_edges_;  // an out edge is an edge with this node as its tail.  (out edges leave us up toward the top/goal). indices in edges_
    int best_edge_;          // in edge of the best derivation, -1 if none
    double best_score_;
    Span span() const { return Span(i_, j_); }
  };

} // namespace HG

// class representing an acyclic hypergraph
//  - edges have 1 head, 0..n tails
//  - the tails of an edge always precede its head in nodes_
class Hypergraph {
public:
  Hypergraph() {}
  typedef HG::Node Node;
  typedef HG::Edge Edge;

  int GoalNode() const { return nodes_.size()-1; } // by definition, and sorting of nodes in topo order (bottom up)

  std::string stats(std::string const& name="forest") const;

  // recompute best_score_ / best_edge_ for the nodes in [first, last)
  // from the current transition scores (nodes before first are trusted)
  void ComputeBestScores(int first = 0, int last = -1);

  // renumbers the nodes in [first, end) so that tails precede heads.
  // Only edges among those nodes may break the order, e.g. unary edges of
  // one span.  Returns false (and changes nothing) if they form a cycle,
  // otherwise fills reloc_node with the new index of every node.
  bool TopologicallySortNodes(int first, std::vector<int>* reloc_node);

  // tails are already set.  all we need to do is set id and add to out_edges of tails
  Edge* AddEdge(Edge const& nedge) {
    int eid=edges_.size();
    edges_.push_back(nedge);
    Edge* edge = &edges_.back();
    edge->id_ = eid;
    index_tails(*edge);
    return edge;
  }

  Node* AddNode(const WordID& cat) {
    nodes_.push_back(Node());
    nodes_.back().cat_ = cat;
    nodes_.back().id_ = nodes_.size() - 1;
    return &nodes_.back();
  }

  void ConnectEdgeToHeadNode(const int edge_id, const int head_id) {
    edges_[edge_id].head_node_ = head_id;
    nodes_[head_id].in_edges_.push_back(edge_id);
  }

  void clear() {
    nodes_.clear();
    edges_.clear();
  }

  bool empty() const { return nodes_.empty(); }

  std::vector<Node> nodes_;
  std::vector<Edge> edges_;

private:
  void index_tails(Edge const& edge) {
    for (unsigned i = 0; i < edge.tail_nodes_.size(); ++i)
      nodes_[edge.tail_nodes_[i]].out_edges_.push_back(edge.id_);
  }
};

#endif
