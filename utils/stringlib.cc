#include "stringlib.h"

using namespace std;

void SplitOnTripleBar(const string& in, vector<string>* fields) {
  fields->clear();
  size_t start = 0;
  while (true) {
    const size_t bar = in.find("|||", start);
    if (bar == string::npos) {
      fields->push_back(Trim(in.substr(start)));
      break;
    }
    fields->push_back(Trim(in.substr(start, bar - start)));
    start = bar + 3;
  }
}

string StripNonterminalBrackets(const string& s) {
  if (s.size() < 3 || s[0] != '[' || s[s.size() - 1] != ']')
    return s;
  string r = s.substr(1, s.size() - 2);
  const size_t comma = r.rfind(',');
  if (comma != string::npos) r.resize(comma);
  return r;
}
