#define BOOST_TEST_MODULE g_test
#include <boost/test/unit_test.hpp>
#include <boost/test/floating_point_comparison.hpp>
#include <boost/thread/thread.hpp>

#include <iostream>
#include <sstream>
#include <vector>
#include "trule.h"
#include "tdict.h"
#include "fdict.h"
#include "grammar.h"
#include "ff.h"
#include "ffset.h"
#include "weights.h"

using namespace std;

struct GrammarTest {
  GrammarTest() : models(wts, ms) {
    istringstream in("PhraseModel_0 1.0\nPhraseModel_1 -1.0\n");
    Weights::InitFromStream(&in, &wts);
  }
  vector<weight_t> wts;
  vector<const FeatureFunction*> ms;
  ModelSet models;
};

BOOST_FIXTURE_TEST_SUITE( s, GrammarTest );

BOOST_AUTO_TEST_CASE(TestTextGrammar) {
  TextGrammar g;
  TRulePtr r1(new TRule("[X] ||| a b c ||| A B C ||| 0.1 0.2 0.3"));
  TRulePtr r2(new TRule("[X] ||| a b c ||| 1 2 3 ||| 0.9 0.3"));
  TRulePtr r3(new TRule("[X] ||| a b c d ||| A B C D ||| 0.1 0.2"));
  TRulePtr r4(new TRule("[Y] ||| a b c ||| y ||| 0.5 0.0"));
  g.AddRule(r1);
  g.AddRule(r2);
  g.AddRule(r3);
  g.AddRule(r4);
  BOOST_CHECK_EQUAL(g.GetNumRules(), 4);
  BOOST_CHECK_EQUAL(g.NumDenseFeatures(), 3);

  const GrammarIter* gi = g.GetRoot();
  BOOST_REQUIRE(gi);
  BOOST_CHECK(gi->Extend(TD::Convert("b")) == NULL);
  gi = gi->Extend(TD::Convert("a"));
  BOOST_REQUIRE(gi);
  BOOST_CHECK(gi->GetRules() == NULL);
  gi = gi->Extend(TD::Convert("b"))->Extend(TD::Convert("c"));
  BOOST_REQUIRE(gi && gi->GetRules());
  const RuleBin* rb = gi->GetRules();
  BOOST_CHECK_EQUAL(rb->GetNumRules(), 3);
  BOOST_CHECK_EQUAL(rb->Arity(), 0);

  BOOST_CHECK(!g.IsSorted());
  g.SortGrammar(models);
  BOOST_CHECK(g.IsSorted());
  BOOST_CHECK(rb->IsSorted());
  const RuleGroups& groups = rb->GetSortedRules(models);
  BOOST_REQUIRE_EQUAL(groups.size(), 2u);
  BOOST_CHECK_EQUAL(groups[0].lhs, -TD::Convert("X"));
  BOOST_REQUIRE_EQUAL(groups[0].rules.size(), 2u);
  // 0.9 - 0.3 beats 0.1 - 0.2
  BOOST_CHECK(groups[0].rules[0] == r2);
  BOOST_CHECK(groups[0].rules[1] == r1);
  BOOST_CHECK(groups[1].rules[0] == r4);
}

BOOST_AUTO_TEST_CASE(TestUnaryRules) {
  TextGrammar g;
  TRulePtr u(new TRule("[S] ||| [NP,1] ||| [1]"));
  g.AddRule(u);
  g.AddRule(TRulePtr(new TRule("[NP] ||| [DT,1] [NN,2] ||| [1] [2]")));
  BOOST_CHECK_EQUAL(g.GetAllUnaryRules().size(), 1u);
  BOOST_CHECK_EQUAL(g.GetUnaryRulesForRHS(-TD::Convert("NP")).size(), 1u);
  BOOST_CHECK(g.GetUnaryRulesForRHS(-TD::Convert("VP")).empty());
  BOOST_CHECK(g.GetRoot()->Extend(-TD::Convert("DT")) != NULL);
}

BOOST_AUTO_TEST_CASE(TestReadFromStream) {
  istringstream in("[X] ||| le ||| the ||| 0.5\n"
                   "# comment\n"
                   "this is not a rule\n"
                   "[X] ||| chat ||| cat ||| 0.2\n");
  TextGrammar g(&in);
  BOOST_CHECK_EQUAL(g.GetNumRules(), 2);
  BOOST_CHECK(g.GetRoot()->Extend(TD::Convert("chat")) != NULL);
  g.SetGrammarName("main");
  g.AddRule(TRulePtr(new TRule("[X] ||| chien ||| dog")));
  const RuleBin* rb = g.GetRoot()->Extend(TD::Convert("chien"))->GetRules();
  BOOST_CHECK_EQUAL(rb->GetIthRule(0)->GetOwner(), g.GetOwner());
}

BOOST_AUTO_TEST_CASE(TestSpanRestrictions) {
  TextGrammar g;
  g.SetMaxSpan(3);
  BOOST_CHECK(g.HasRuleForSpan(2, 5, 3));
  BOOST_CHECK(!g.HasRuleForSpan(2, 6, 4));
  GlueGrammar glue("S", "X");
  BOOST_CHECK(glue.HasRuleForSpan(0, 20, 20));
  BOOST_CHECK(!glue.HasRuleForSpan(1, 2, 1));
  BOOST_CHECK_EQUAL(glue.GetNumRules(), 2);
  BOOST_CHECK_EQUAL(glue.GetUnaryRulesForRHS(-TD::Convert("X")).size(), 1u);
}

BOOST_AUTO_TEST_CASE(TestOOVRules) {
  PassThroughGrammar g("X");
  const WordID w = TD::Convert("zorglub");
  g.AddOOVRule(w);
  g.AddOOVRule(w);
  BOOST_CHECK_EQUAL(g.GetNumRules(), 1);
  BOOST_CHECK(g.HasOOVRule(w));
  const GrammarIter* gi = g.GetRoot()->Extend(w);
  BOOST_REQUIRE(gi && gi->GetRules());
  BOOST_CHECK_EQUAL(gi->GetRules()->GetIthRule(0)->AsString(), "[X] ||| zorglub ||| zorglub ||| PassThrough=1");
}

namespace {
struct SortWorker {
  SortWorker(Grammar* g, const ModelSet* m) : g_(g), m_(m) {}
  void operator()() { g_->SortGrammar(*m_); }
  Grammar* g_;
  const ModelSet* m_;
};
}

BOOST_AUTO_TEST_CASE(TestConcurrentSort) {
  TextGrammar g;
  for (int i = 0; i < 200; ++i) {
    ostringstream os;
    os << "[X] ||| w ||| t" << i << " ||| " << (i % 7) << " 0";
    g.AddRule(TRulePtr(new TRule(os.str())));
  }
  boost::thread_group threads;
  for (int i = 0; i < 8; ++i)
    threads.create_thread(SortWorker(&g, &models));
  threads.join_all();
  BOOST_CHECK(g.IsSorted());
  const RuleGroups& groups = g.GetRoot()->Extend(TD::Convert("w"))->GetRules()->GetSortedRules(models);
  BOOST_REQUIRE_EQUAL(groups.size(), 1u);
  BOOST_REQUIRE_EQUAL(groups[0].rules.size(), 200u);
  for (unsigned i = 1; i < groups[0].rules.size(); ++i)
    BOOST_CHECK(models.EstimateRuleScore(*groups[0].rules[i-1]) >= models.EstimateRuleScore(*groups[0].rules[i]));
}

BOOST_AUTO_TEST_SUITE_END()
