#define BOOST_TEST_MODULE WeightsTest
#include <boost/test/unit_test.hpp>
#include <boost/test/floating_point_comparison.hpp>
#include <sstream>
#include "errors.h"
#include "fdict.h"
#include "sparse_vector.h"
#include "weights.h"

using namespace std;

BOOST_AUTO_TEST_CASE(Load) {
  istringstream in("# comment\nLanguageModel 1.5\nWordPenalty=-2\n\nGlue\t0.25\n");
  vector<weight_t> v;
  vector<string> names;
  Weights::InitFromStream(&in, &v, &names);
  BOOST_CHECK_EQUAL(names.size(), 3u);
  BOOST_CHECK_CLOSE(v[FD::Convert("LanguageModel")], 1.5, 1e-9);
  BOOST_CHECK_CLOSE(v[FD::Convert("WordPenalty")], -2.0, 1e-9);
  BOOST_CHECK_CLOSE(v[FD::Convert("Glue")], 0.25, 1e-9);
}

BOOST_AUTO_TEST_CASE(LeadingWhitespaceIsAnError) {
  istringstream in(" Bad 1\n");
  vector<weight_t> v;
  BOOST_CHECK_THROW(Weights::InitFromStream(&in, &v), ConfigurationError);
}

BOOST_AUTO_TEST_CASE(UpdateFromString) {
  vector<weight_t> v;
  Weights::UpdateFromString("A=1 B=-0.5", v);
  BOOST_CHECK_CLOSE(v[FD::Convert("A")], 1.0, 1e-9);
  BOOST_CHECK_CLOSE(v[FD::Convert("B")], -0.5, 1e-9);
  BOOST_CHECK_THROW(Weights::UpdateFromString("C", v), ConfigurationError);
}

BOOST_AUTO_TEST_CASE(Dot) {
  SparseVector<double> x;
  SparseVector<double> y;
  x.set_value(1,0.8);
  y.set_value(1,5);
  x.set_value(2,-2);
  y.set_value(2,1);
  x.set_value(3,80);
  BOOST_CHECK_CLOSE(x.dot(y), 2.0, 1e-9);
  vector<weight_t> w(3, 1.0);
  // feature 3 lies outside the weight vector
  BOOST_CHECK_CLOSE(x.dot(w), -1.2, 1e-9);
}

BOOST_AUTO_TEST_CASE(Equality) {
  SparseVector<double> x;
  SparseVector<double> y;
  x.set_value(1,-1);
  y.set_value(1,-1);
  BOOST_CHECK(x == y);
  x += y;
  BOOST_CHECK(x != y);
  BOOST_CHECK_CLOSE(x.value(1), -2.0, 1e-9);
}
