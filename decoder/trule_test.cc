#include "trule.h"

#define BOOST_TEST_MODULE TRuleTest
#include <boost/test/unit_test.hpp>
#include <boost/test/floating_point_comparison.hpp>
#include <iostream>
#include <stdexcept>
#include "fdict.h"
#include "tdict.h"

using namespace std;

BOOST_AUTO_TEST_CASE(TestESubstitute) {
  TRule r1("[X] ||| ob [X,1] [X,2] sah . ||| whether [X,1] saw [X,2] . ||| 0.99");
  TRule r2("[X] ||| ich ||| i ||| 1.0");
  TRule r3("[X] ||| ihn ||| him ||| 1.0");
  vector<const vector<WordID>*> ants;
  vector<WordID> res2;
  r2.ESubstitute(ants, &res2);
  BOOST_CHECK_EQUAL(TD::GetString(res2), "i");
  vector<WordID> res3;
  r3.ESubstitute(ants, &res3);
  BOOST_CHECK_EQUAL(TD::GetString(res3), "him");
  ants.push_back(&res2);
  ants.push_back(&res3);
  vector<WordID> res;
  r1.ESubstitute(ants, &res);
  BOOST_CHECK_EQUAL(TD::GetString(res), "whether i saw him .");
}

BOOST_AUTO_TEST_CASE(TestRuleR) {
  TRule t6;
  BOOST_REQUIRE(t6.ReadFromString("[X] ||| den [X,1] sah [X,2] . ||| [X,2] saw the [X,1] . ||| 0.12321 0.23232 0.121"));
  BOOST_CHECK_EQUAL(t6.Arity(), 2);
  // second tail first on the target side
  BOOST_CHECK_EQUAL(t6.e_[0], -2);
  BOOST_CHECK_EQUAL(t6.e_[3], -1);
  BOOST_CHECK_EQUAL(t6.dense_features_, 3);
  BOOST_CHECK_CLOSE(t6.scores_.value(DenseFeatureId(1)), 0.23232, 1e-6);
  BOOST_CHECK_EQUAL(t6.AsString(false), "[X] ||| den [X,1] sah [X,2] . ||| [2] saw the [1] .");
}

BOOST_AUTO_TEST_CASE(TestNamedFeatures) {
  TRule t("[NP] ||| [DT,1] [NN,2] ||| [2] [1] ||| Feature1=0.23 Foo=-1");
  BOOST_CHECK_EQUAL(t.scores_.size(), 2);
  BOOST_CHECK_EQUAL(t.dense_features_, 0);
  BOOST_CHECK_CLOSE(t.scores_.value(FD::Convert("Feature1")), 0.23, 1e-6);
  BOOST_CHECK_EQUAL(TD::Convert(-t.GetLHS()), "NP");
  BOOST_CHECK_EQUAL(TD::Convert(t.NonterminalCategory(1)), "NN");
  BOOST_CHECK_EQUAL(t.ETargetString(), "[NN,2] [DT,1]");
}

BOOST_AUTO_TEST_CASE(TestLexical) {
  TRule t("[X] ||| a b ||| a b ||| Cost=1");
  BOOST_CHECK_EQUAL(t.Arity(), 0);
  BOOST_CHECK_EQUAL(t.EWords(), 2);
  BOOST_CHECK_EQUAL(t.FWords(), 2);
  BOOST_CHECK(!t.IsUnary());
  BOOST_CHECK_EQUAL(t.ETargetString(), "a b");
}

BOOST_AUTO_TEST_CASE(TestMalformed) {
  TRule t;
  BOOST_CHECK(!t.ReadFromString("[X] ||| only source"));
  BOOST_CHECK(!t.ReadFromString("[X] ||| a [X,1] ||| [X,2] b"));
  BOOST_CHECK(!t.ReadFromString("[X] ||| a ||| b ||| Cost=oops"));
  BOOST_CHECK_THROW(TRule("X ||| a ||| b"), runtime_error);
  TRule* r = TRule::CreateRuleSynchronous("[X] ||| a ||| b ||| 1");
  BOOST_REQUIRE(r != NULL);
  delete r;
}

BOOST_AUTO_TEST_CASE(TestPassThrough) {
  const WordID w = TD::Convert("zebra");
  TRulePtr r = TRule::CreatePassThroughRule(TD::Convert("X"), w);
  BOOST_CHECK_EQUAL(r->AsString(), "[X] ||| zebra ||| zebra ||| PassThrough=1");
  BOOST_CHECK_EQUAL(r->Arity(), 0);
}

BOOST_AUTO_TEST_CASE(TestEquality) {
  TRule a("[X] ||| a [X,1] ||| [1] b ||| A=1");
  TRule b("[X] ||| a [X,1] ||| [1] b ||| A=2");
  BOOST_CHECK(a == b);
  BOOST_CHECK_EQUAL(hash_value(a), hash_value(b));
}
