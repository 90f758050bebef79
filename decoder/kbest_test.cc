#define BOOST_TEST_MODULE kbest_test
#include <boost/test/unit_test.hpp>
#include <boost/test/floating_point_comparison.hpp>

#include <set>
#include <sstream>
#include <string>
#include <vector>

#include "chart.h"
#include "errors.h"
#include "ff.h"
#include "ffset.h"
#include "grammar.h"
#include "hg.h"
#include "kbest.h"
#include "lattice.h"
#include "sentence_metadata.h"
#include "tdict.h"
#include "tree_fragment.h"
#include "viterbi.h"
#include "weights.h"

using namespace std;

typedef KBest::KBestDerivations<vector<WordID>, ESentenceTraversal> KBestList;
typedef KBest::KBestDerivations<vector<WordID>, ESentenceTraversal, KBest::FilterUnique> UniqueKBestList;

struct KBestTest {
  KBestTest() {
    istringstream in("PhraseModel_0 1.0\nGlue -0.1\n");
    Weights::InitFromStream(&in, &wts);
  }
  void Parse(const string& rules, const string& goal, const string& input) {
    vector<GrammarPtr> grammars;
    TextGrammar* g = new TextGrammar;
    grammars.push_back(GrammarPtr(g));
    istringstream in(rules);
    g->ReadFromStream(&in, "kbest-test");
    grammars.push_back(GrammarPtr(new GlueGrammar(goal, "X")));
    vector<const FeatureFunction*> ms;
    ModelSet models(wts, ms);
    ChartConfiguration conf;
    conf.goal = goal;
    conf.algorithm = FULL;
    Lattice lattice;
    LatticeTools::ConvertTextOrPLF(input, &lattice);
    SentenceMetadata smeta(0, lattice);
    Chart chart(grammars, models, smeta, conf, &hg);
    BOOST_REQUIRE(chart.Expand());
  }
  vector<weight_t> wts;
  Hypergraph hg;
};

static const char* kAMBIGUOUS =
  "[X] ||| a ||| A ||| 0.1\n"
  "[X] ||| a ||| AA ||| 0.3\n"
  "[X] ||| b ||| B ||| 0.2\n"
  "[X] ||| b ||| BB ||| -0.1\n"
  "[X] ||| c ||| C ||| 0.0\n"
  "[X] ||| a b ||| AB ||| 0.2\n"
  "[X] ||| [X,1] [X,2] ||| [2] [1] ||| -0.2\n"
  "[X] ||| [X,1] [X,2] ||| [1] [2] ||| 0.0\n";

BOOST_FIXTURE_TEST_SUITE( s, KBestTest );

BOOST_AUTO_TEST_CASE(ScoresAreNonIncreasing) {
  Parse(kAMBIGUOUS, "S", "a b c a");
  const int goal = hg.GoalNode();
  KBestList kbest(hg, 100);
  double prev = 0;
  int n = 0;
  for (unsigned i = 0; i < 100; ++i) {
    const KBestList::Derivation* d = kbest.LazyKthBest(goal, i);
    if (!d) break;
    if (i == 0) {
      BOOST_CHECK_CLOSE(d->score, hg.nodes_[goal].best_score_, 1e-9);
      vector<WordID> vit;
      ViterbiESentence(hg, &vit);
      BOOST_CHECK_EQUAL(TD::GetString(d->yield), TD::GetString(vit));
    } else {
      BOOST_CHECK_LE(d->score, prev + 1e-12);
    }
    // the score breakdown adds up to the score
    BOOST_CHECK_CLOSE(d->feature_values.dot(wts) + 10, d->score + 10, 1e-9);
    prev = d->score;
    ++n;
  }
  BOOST_CHECK_EQUAL(n, 100);
}

BOOST_AUTO_TEST_CASE(PrefixIsStable) {
  Parse(kAMBIGUOUS, "S", "a b c a b");
  const int goal = hg.GoalNode();
  for (unsigned k = 1; k < 30; k += 7) {
    KBestList small(hg, k);
    KBestList large(hg, k + 1);
    for (unsigned i = 0; i < k; ++i) {
      const KBestList::Derivation* a = small.LazyKthBest(goal, i);
      const KBestList::Derivation* b = large.LazyKthBest(goal, i);
      BOOST_REQUIRE(a && b);
      BOOST_CHECK_EQUAL(a->score, b->score);
      BOOST_CHECK_EQUAL(a->edge, b->edge);
      BOOST_CHECK(a->j == b->j);
      BOOST_CHECK(a->yield == b->yield);
    }
    BOOST_CHECK(large.LazyKthBest(goal, k));
  }
  // asking again returns the cached derivation
  KBestList kbest(hg, 10);
  const KBestList::Derivation* third = kbest.LazyKthBest(goal, 2);
  kbest.LazyKthBest(goal, 9);
  BOOST_CHECK_EQUAL(kbest.LazyKthBest(goal, 2), third);
}

BOOST_AUTO_TEST_CASE(UniqueStrings) {
  Parse(kAMBIGUOUS, "S", "a b c");
  const int goal = hg.GoalNode();
  unsigned prev_count = 0;
  for (unsigned k = 1; k <= 64; k *= 2) {
    UniqueKBestList kbest(hg, k);
    set<vector<WordID> > seen;
    unsigned count = 0;
    for (unsigned i = 0; i < k; ++i) {
      const UniqueKBestList::Derivation* d = kbest.LazyKthBest(goal, i);
      if (!d) break;
      BOOST_CHECK(seen.insert(d->yield).second);
      ++count;
    }
    BOOST_CHECK_GE(count, prev_count);
    prev_count = count;
  }
  // the derivation lists contain duplicates, the unique list does not
  KBestList all(hg, 200);
  set<vector<WordID> > strings;
  unsigned derivations = 0;
  for (unsigned i = 0; i < 200; ++i) {
    const KBestList::Derivation* d = all.LazyKthBest(goal, i);
    if (!d) break;
    strings.insert(d->yield);
    ++derivations;
  }
  BOOST_CHECK_GT(derivations, strings.size());
  BOOST_CHECK_EQUAL(prev_count, min<size_t>(64, strings.size()));
}

BOOST_AUTO_TEST_CASE(RunsOutOfDerivations) {
  Parse("[X] ||| a ||| A ||| 0.1\n[X] ||| a ||| AA ||| 0.3\n", "S", "a");
  KBestList kbest(hg, 10);
  BOOST_CHECK(kbest.LazyKthBest(hg.GoalNode(), 0));
  BOOST_CHECK(kbest.LazyKthBest(hg.GoalNode(), 1));
  BOOST_CHECK(kbest.LazyKthBest(hg.GoalNode(), 2) == NULL);
  BOOST_CHECK(kbest.LazyKthBest(hg.GoalNode(), 5) == NULL);
}

BOOST_AUTO_TEST_CASE(BuildTree) {
  Parse("[X] ||| a ||| A ||| 1\n[S] ||| [X,1] b ||| [1] B ||| 1\n", "S", "a b");
  chartdec::FragmentMap fmap;
  istringstream in("(S (NP X) (VP \"B\")) ||| [X,1] B\n");
  fmap.ReadFromStream(&in, "fragments");
  KBestList kbest(hg, 1);
  const KBestList::Derivation* d = kbest.LazyKthBest(hg.GoalNode(), 0);
  BOOST_REQUIRE(d);
  BOOST_CHECK_EQUAL(TD::GetString(d->yield), "A B");
  BOOST_CHECK_EQUAL(kbest.BuildTree(*d, fmap)->ToString(), "(S (NP (X \"A\")) (VP \"B\"))");
  // without fragments, flat trees
  chartdec::FragmentMap none;
  BOOST_CHECK_EQUAL(kbest.BuildTree(*d, none)->ToString(), "(S (X \"A\") \"B\")");
  // depth limit leaves frontier sites
  BOOST_CHECK_EQUAL(kbest.BuildTree(*d, fmap, 1)->ToString(), "(S (NP X) (VP \"B\"))");

  chartdec::FragmentMap bad;
  istringstream bin("(S X (VP Y)) ||| [X,1] B\n");
  bad.ReadFromStream(&bin, "bad-fragments");
  BOOST_CHECK_THROW(kbest.BuildTree(*d, bad), IndexInconsistency);
}

BOOST_AUTO_TEST_CASE(TiedDerivationsKeepTheirOrder) {
  Parse("[X] ||| a ||| P ||| 1\n"
        "[X] ||| a ||| Q ||| 1\n"
        "[X] ||| b ||| R ||| 1\n"
        "[X] ||| b ||| S ||| 1\n"
        "[X] ||| [X,1] [X,2] ||| [1] [2] ||| 0\n"
        "[X] ||| [X,1] [X,2] ||| [2] [1] ||| 0\n", "S", "a b");
  const int goal = hg.GoalNode();
  KBestList reference(hg, 100);
  vector<string> order;
  for (unsigned i = 0; i < 100; ++i) {
    const KBestList::Derivation* d = reference.LazyKthBest(goal, i);
    if (!d) break;
    // two tied rules per word and two tied binary rules, then the glued ones
    BOOST_CHECK_CLOSE(d->score, i < 8 ? 2.0 : 1.9, 1e-9);
    order.push_back(TD::GetString(d->yield));
  }
  BOOST_REQUIRE_EQUAL(order.size(), 12);
  BOOST_CHECK_EQUAL(order[0], "P R");
  for (unsigned k = 1; k <= order.size(); ++k) {
    KBestList kbest(hg, k);
    for (unsigned i = 0; i < k; ++i) {
      const KBestList::Derivation* d = kbest.LazyKthBest(goal, i);
      BOOST_REQUIRE(d);
      BOOST_CHECK_EQUAL(TD::GetString(d->yield), order[i]);
    }
  }
}

BOOST_AUTO_TEST_SUITE_END()
