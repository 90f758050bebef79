#define BOOST_TEST_MODULE ConstraintTest
#include <boost/test/unit_test.hpp>
#include <sstream>
#include "constraint.h"
#include "errors.h"
#include "verbose.h"

using namespace std;

BOOST_AUTO_TEST_CASE(TestRead) {
  istringstream in(
    "3 0 2 hard\n"
    "RULE ||| NP ||| le chat ||| the cat ||| 0.5 -1\n"
    "LHS ||| [NP]\n"
    "\n"
    "# comment\n"
    "3 2 3 soft\n"
    "RHS ||| sat\n"
    "\n"
    "7 1 4 soft\n");
  SentenceConstraints c;
  ReadConstraints(&in, &c);
  BOOST_REQUIRE_EQUAL(c.size(), 2);
  const vector<ConstraintSpan>& s3 = c[3];
  BOOST_REQUIRE_EQUAL(s3.size(), 2);
  BOOST_CHECK(s3[0].is_hard);
  BOOST_CHECK_EQUAL(s3[0].start, 0);
  BOOST_CHECK_EQUAL(s3[0].end, 2);
  BOOST_REQUIRE_EQUAL(s3[0].rules.size(), 2);
  BOOST_CHECK_EQUAL(s3[0].rules[0].type, ConstraintRule::RULE);
  BOOST_CHECK_EQUAL(s3[0].rules[0].lhs, "NP");
  BOOST_CHECK_EQUAL(s3[0].rules[0].foreign_rhs, "le chat");
  BOOST_CHECK_EQUAL(s3[0].rules[0].native_rhs, "the cat");
  BOOST_REQUIRE_EQUAL(s3[0].rules[0].features.size(), 2);
  BOOST_CHECK_EQUAL(s3[0].rules[0].features[1], -1.0);
  BOOST_CHECK_EQUAL(s3[0].rules[1].type, ConstraintRule::LHS);
  BOOST_CHECK_EQUAL(s3[0].rules[1].lhs, "[NP]");
  BOOST_CHECK(!s3[1].is_hard);
  BOOST_CHECK_EQUAL(s3[1].rules[0].type, ConstraintRule::RHS);
  BOOST_CHECK_EQUAL(s3[1].rules[0].native_rhs, "sat");
  BOOST_CHECK(c[7][0].rules.empty());
}

BOOST_AUTO_TEST_CASE(TestMalformed) {
  const char* bad[] = {
    "0 1 hard\n",
    "0 2 1 soft\n",
    "0 0 1 maybe\n",
    "0 0 1 soft\nSPAN ||| X\n",
    "0 0 1 soft\nRULE ||| X ||| a\n",
    "0 0 1 soft\nLHS\n",
    "abc 0 2 hard\n",
    "0 0 2x soft\n",
    "0 0 2 soft\nRULE ||| X ||| a b ||| Q ||| 1.5 oops\n"
  };
  for (unsigned i = 0; i < sizeof(bad) / sizeof(bad[0]); ++i) {
    istringstream in(bad[i]);
    SentenceConstraints c;
    BOOST_CHECK_THROW(ReadConstraints(&in, &c), ConfigurationError);
  }
  // the message names the line
  istringstream in("0 0 2 soft\nLHS ||| X\n\n1 0 1 soft\nRULE ||| X ||| a ||| Q ||| 1.5 oops\n");
  SentenceConstraints bad_feature;
  try {
    ReadConstraints(&in, &bad_feature);
    BOOST_ERROR("malformed feature value was accepted");
  } catch (const ConfigurationError& e) {
    BOOST_CHECK(string(e.what()).find("line 5") != string::npos);
    BOOST_CHECK(string(e.what()).find("oops") != string::npos);
  }
  SetSilent(true);
  SentenceConstraints c;
  BOOST_CHECK_THROW(ReadConstraintsFromFile("/nonexistent/constraints", &c), ConfigurationError);
}
