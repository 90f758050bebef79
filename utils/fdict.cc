#include "fdict.h"

#include <string>

using namespace std;

Dict FD::dict_;
bool FD::frozen_ = false;

string FD::Convert(vector<WordID> const& v) {
  string r;
  for (unsigned i = 0; i < v.size(); ++i) {
    if (i) r += ' ';
    r += FD::Convert(v[i]);
  }
  return r;
}

string FD::Escape(const string& s) {
  string x = s;
  for (unsigned i = 0; i < x.size(); ++i) {
    const char c = x[i];
    if (c == '=' || c == ';' || c == ' ' || c == '\t')
      x[i] = '_';
  }
  return x;
}
