#include "tree_fragment.h"

#define BOOST_TEST_MODULE TreeFragmentTest
#include <boost/test/unit_test.hpp>
#include <sstream>
#include <stdexcept>
#include "errors.h"
#include "stringlib.h"
#include "trule.h"

using namespace std;
using namespace chartdec;

BOOST_AUTO_TEST_CASE(TestRoundTrip) {
  const string tree = "(S (NP \"the\" \"man\") VP)";
  TreeFragmentPtr t = TreeFragment::FromString(tree);
  BOOST_CHECK_EQUAL(t->ToString(), tree);
  BOOST_CHECK_EQUAL(t->label(), "S");
  BOOST_CHECK_EQUAL(t->children().size(), 2);
  BOOST_CHECK(t->children()[0]->children()[0]->IsTerminal());
  BOOST_CHECK(t->children()[1]->IsFrontier());
  BOOST_CHECK_EQUAL(t->Depth(), 3);
  // extra whitespace is not kept
  BOOST_CHECK_EQUAL(TreeFragment::FromString("  (S  (NP  \"the\"\t\"man\" )  VP )  ")->ToString(), tree);
}

BOOST_AUTO_TEST_CASE(TestYields) {
  TreeFragmentPtr t = TreeFragment::FromString("(S (NP DT \"man\") (VP \"saw\" NP) PU)");
  vector<string> nts = t->NonterminalYield();
  BOOST_REQUIRE_EQUAL(nts.size(), 3);
  BOOST_CHECK_EQUAL(nts[0], "DT");
  BOOST_CHECK_EQUAL(nts[1], "NP");
  BOOST_CHECK_EQUAL(nts[2], "PU");
  BOOST_CHECK_EQUAL(t->NumFrontierSites(), 3);
  vector<string> words = t->Terminals();
  BOOST_REQUIRE_EQUAL(words.size(), 2);
  BOOST_CHECK_EQUAL(words[0], "man");
  BOOST_CHECK_EQUAL(words[1], "saw");
}

BOOST_AUTO_TEST_CASE(TestMalformed) {
  BOOST_CHECK_THROW(TreeFragment::FromString(""), runtime_error);
  BOOST_CHECK_THROW(TreeFragment::FromString("S"), runtime_error);
  BOOST_CHECK_THROW(TreeFragment::FromString("(S (NP \"a\")"), runtime_error);
  BOOST_CHECK_THROW(TreeFragment::FromString("(S \"a)"), runtime_error);
  BOOST_CHECK_THROW(TreeFragment::FromString("(S)"), runtime_error);
  BOOST_CHECK_THROW(TreeFragment::FromString("(S \"a\") (T \"b\")"), runtime_error);
  BOOST_CHECK_THROW(TreeFragment::FromString("(S \"\")"), runtime_error);
}

BOOST_AUTO_TEST_CASE(TestSubstitute) {
  TreeFragmentPtr t = TreeFragment::FromString("(S NP (VP \"left\"))");
  vector<TreeFragmentPtr> subs(1, TreeFragment::FromString("(NP \"she\")"));
  TreeFragmentPtr r = t->Substitute(subs);
  BOOST_CHECK_EQUAL(r->ToString(), "(S (NP \"she\") (VP \"left\"))");
  // the original is not modified
  BOOST_CHECK_EQUAL(t->ToString(), "(S NP (VP \"left\"))");
  // an empty slot stays a frontier site
  vector<TreeFragmentPtr> none(1);
  BOOST_CHECK_EQUAL(t->Substitute(none)->ToString(), "(S NP (VP \"left\"))");
  vector<TreeFragmentPtr> too_many(2, subs[0]);
  BOOST_CHECK_THROW(t->Substitute(too_many), IndexInconsistency);
}

BOOST_AUTO_TEST_CASE(TestFragmentMap) {
  FragmentMap fmap;
  istringstream in("(VP (V \"saw\") NP) ||| saw [X,1]\n"
                   "\n"
                   "(SW B A) ||| [X,2] [X,1]\n");
  fmap.ReadFromStream(&in, "test");
  BOOST_CHECK_EQUAL(fmap.size(), 2);

  TRule saw("[VP] ||| sah [X,1] ||| saw [1]");
  BOOST_REQUIRE(fmap.Find(saw));
  vector<TreeFragmentPtr> ants(1, TreeFragment::FromString("(NP \"him\")"));
  BOOST_CHECK_EQUAL(fmap.Apply(saw, ants)->ToString(), "(VP (V \"saw\") (NP \"him\"))");

  // the k-th frontier site takes the tail of the k-th target nonterminal
  TRule swap("[SW] ||| [X,1] [X,2] ||| [2] [1]");
  vector<TreeFragmentPtr> two;
  two.push_back(TreeFragment::FromString("(A \"a\")"));
  two.push_back(TreeFragment::FromString("(B \"b\")"));
  BOOST_CHECK_EQUAL(fmap.Apply(swap, two)->ToString(), "(SW (B \"b\") (A \"a\"))");

  // no fragment: flat tree over the target side
  TRule flat("[NP] ||| der [X,1] ||| the [1]");
  BOOST_CHECK(!fmap.Find(flat));
  vector<TreeFragmentPtr> one(1, TreeFragment::FromString("(N \"man\")"));
  BOOST_CHECK_EQUAL(fmap.Apply(flat, one)->ToString(), "(NP \"the\" (N \"man\"))");

  BOOST_CHECK_THROW(fmap.Apply(saw, two), IndexInconsistency);
}

BOOST_AUTO_TEST_CASE(TestFragmentMapFrontierMismatch) {
  FragmentMap fmap;
  fmap.Add("saw [X,1]", TreeFragment::FromString("(VP \"saw\" NP PP)"));
  TRule saw("[VP] ||| sah [X,1] ||| saw [1]");
  vector<TreeFragmentPtr> ants(1, TreeFragment::FromString("(NP \"him\")"));
  BOOST_CHECK_THROW(fmap.Apply(saw, ants), IndexInconsistency);
}

BOOST_AUTO_TEST_CASE(TestFragmentMapBadInput) {
  FragmentMap a;
  istringstream no_target("(S \"a\")\n");
  BOOST_CHECK_THROW(a.ReadFromStream(&no_target, "no-target"), ConfigurationError);
  FragmentMap b;
  istringstream bad_tree("(S \"a\" ||| a\n");
  BOOST_CHECK_THROW(b.ReadFromStream(&bad_tree, "bad-tree"), ConfigurationError);
  FragmentMap c;
  BOOST_CHECK_THROW(c.ReadFromFile("/nonexistent/fragments.txt"), ConfigurationError);
}
