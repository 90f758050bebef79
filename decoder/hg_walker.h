#ifndef HG_WALKER_H_
#define HG_WALKER_H_

#include <set>
#include <vector>

#include <boost/function.hpp>

#include "hg.h"
#include "span.h"

// visitor(node, index of node among the tails of the edge it was reached
// through); the root is visited with -1
typedef boost::function<void (const HG::Node&, int)> NodeVisitor;

// Visits every node reachable from a root exactly once, following either the
// best incoming edge of each node or all of them.
class ForestWalker {
 public:
  enum EdgeMode { BEST_EDGE, ALL_EDGES };
  enum Order { PREORDER, POSTORDER };

  explicit ForestWalker(EdgeMode mode = ALL_EDGES, Order order = PREORDER) :
    mode_(mode), order_(order) {}

  void Walk(const Hypergraph& hg, int root, const NodeVisitor& visitor) const;
  // from the goal node; nothing happens if hg is empty
  void Walk(const Hypergraph& hg, const NodeVisitor& visitor) const;

 private:
  void WalkRec(const Hypergraph& hg, int node, int tail_index,
               std::vector<bool>* visited, const NodeVisitor& visitor) const;

  const EdgeMode mode_;
  const Order order_;
};

// Calls the visitor once per distinct span; which of the nodes of a span is
// passed is whichever the underlying walk reaches first and must not be
// relied upon.
class AllSpansWalker {
 public:
  explicit AllSpansWalker(ForestWalker::EdgeMode mode = ForestWalker::ALL_EDGES) :
    walker_(mode, ForestWalker::PREORDER) {}

  void Walk(const Hypergraph& hg, int root, const NodeVisitor& visitor);
  void Walk(const Hypergraph& hg, const NodeVisitor& visitor);

 private:
  void VisitSpan(const NodeVisitor& visitor, const HG::Node& node, int tail_index);

  ForestWalker walker_;
  std::set<Span> visited_spans_;
};

#endif
