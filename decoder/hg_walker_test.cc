#include "hg_walker.h"

#define BOOST_TEST_MODULE HGWalkerTest
#include <boost/test/unit_test.hpp>
#include <vector>
#include "tdict.h"

using namespace std;

struct Recorder {
  Recorder(vector<int>* n, vector<int>* t) : nodes(n), tails(t) {}
  void operator()(const HG::Node& node, int tail_index) const {
    nodes->push_back(node.id_);
    tails->push_back(tail_index);
  }
  vector<int>* nodes;
  vector<int>* tails;
};

// n0 <0,1>, n1 <1,2>, n2 X<0,2> (two edges), n3 Y<0,2>, n4 goal <0,2>
struct WalkerTest {
  WalkerTest() {
    AddNode("X", 0, 1);
    AddNode("X", 1, 2);
    AddNode("X", 0, 2);
    AddNode("Y", 0, 2);
    AddNode("Goal", 0, 2);
    Connect(0, TailNodeVector());
    Connect(1, TailNodeVector());
    Connect(2, Tails(0, 1));
    Connect(2, Tails(1, 0));
    Connect(3, Tails(0, 1));
    Connect(4, TailNodeVector(1, 2));
    Connect(4, TailNodeVector(1, 3));
    hg.nodes_[0].best_edge_ = 0;
    hg.nodes_[1].best_edge_ = 1;
    hg.nodes_[2].best_edge_ = 3;
    hg.nodes_[3].best_edge_ = 4;
    hg.nodes_[4].best_edge_ = 5;
  }
  void AddNode(const char* cat, int i, int j) {
    HG::Node* node = hg.AddNode(-TD::Convert(cat));
    node->i_ = i;
    node->j_ = j;
  }
  static TailNodeVector Tails(int a, int b) {
    TailNodeVector t(2);
    t[0] = a;
    t[1] = b;
    return t;
  }
  void Connect(int head, const TailNodeVector& tails) {
    HG::Edge edge;
    edge.tail_nodes_ = tails;
    HG::Edge* e = hg.AddEdge(edge);
    hg.ConnectEdgeToHeadNode(e->id_, head);
  }
  Hypergraph hg;
  vector<int> nodes;
  vector<int> tails;
};

BOOST_FIXTURE_TEST_SUITE(s, WalkerTest);

BOOST_AUTO_TEST_CASE(TestPreorderAllEdges) {
  ForestWalker walker;
  walker.Walk(hg, Recorder(&nodes, &tails));
  BOOST_REQUIRE_EQUAL(nodes.size(), 5);
  const int exp_nodes[] = {4, 2, 0, 1, 3};
  const int exp_tails[] = {-1, 0, 0, 1, 0};
  for (unsigned i = 0; i < nodes.size(); ++i) {
    BOOST_CHECK_EQUAL(nodes[i], exp_nodes[i]);
    BOOST_CHECK_EQUAL(tails[i], exp_tails[i]);
  }
}

BOOST_AUTO_TEST_CASE(TestPostorder) {
  ForestWalker walker(ForestWalker::ALL_EDGES, ForestWalker::POSTORDER);
  walker.Walk(hg, Recorder(&nodes, &tails));
  BOOST_REQUIRE_EQUAL(nodes.size(), 5);
  // tails are visited before their heads
  vector<int> pos(hg.nodes_.size(), -1);
  for (unsigned i = 0; i < nodes.size(); ++i) pos[nodes[i]] = i;
  for (unsigned e = 0; e < hg.edges_.size(); ++e) {
    const HG::Edge& edge = hg.edges_[e];
    for (unsigned k = 0; k < edge.tail_nodes_.size(); ++k)
      BOOST_CHECK_LT(pos[edge.tail_nodes_[k]], pos[edge.head_node_]);
  }
  BOOST_CHECK_EQUAL(nodes.back(), 4);
  BOOST_CHECK_EQUAL(tails.back(), -1);
}

BOOST_AUTO_TEST_CASE(TestBestEdge) {
  ForestWalker walker(ForestWalker::BEST_EDGE);
  walker.Walk(hg, Recorder(&nodes, &tails));
  BOOST_REQUIRE_EQUAL(nodes.size(), 4);
  // the best edge of n2 has its tails swapped
  const int exp_nodes[] = {4, 2, 1, 0};
  const int exp_tails[] = {-1, 0, 0, 1};
  for (unsigned i = 0; i < nodes.size(); ++i) {
    BOOST_CHECK_EQUAL(nodes[i], exp_nodes[i]);
    BOOST_CHECK_EQUAL(tails[i], exp_tails[i]);
  }
}

BOOST_AUTO_TEST_CASE(TestFromInnerNode) {
  ForestWalker walker;
  walker.Walk(hg, 3, Recorder(&nodes, &tails));
  BOOST_REQUIRE_EQUAL(nodes.size(), 3);
  BOOST_CHECK_EQUAL(nodes[0], 3);
}

BOOST_AUTO_TEST_CASE(TestAllSpans) {
  AllSpansWalker walker;
  walker.Walk(hg, Recorder(&nodes, &tails));
  BOOST_REQUIRE_EQUAL(nodes.size(), 3);
  set<Span> spans;
  for (unsigned i = 0; i < nodes.size(); ++i)
    spans.insert(hg.nodes_[nodes[i]].span());
  BOOST_CHECK_EQUAL(spans.size(), 3);
  BOOST_CHECK(spans.count(Span(0, 2)));
  BOOST_CHECK(spans.count(Span(0, 1)));
  BOOST_CHECK(spans.count(Span(1, 2)));
  // walking again reports nothing new
  walker.Walk(hg, Recorder(&nodes, &tails));
  BOOST_CHECK_EQUAL(nodes.size(), 3);
}

BOOST_AUTO_TEST_CASE(TestEmpty) {
  Hypergraph empty;
  ForestWalker().Walk(empty, Recorder(&nodes, &tails));
  AllSpansWalker().Walk(empty, Recorder(&nodes, &tails));
  BOOST_CHECK(nodes.empty());
}

BOOST_AUTO_TEST_SUITE_END()
