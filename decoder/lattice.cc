#include "lattice.h"

#include <cstdlib>
#include <stdexcept>
#include <string>

#include "tdict.h"

using namespace std;

static const int kUNREACHABLE = 99999999;

void Lattice::ComputeDistances() {
  const int n = this->size() + 1;
  dist_.resize(n, n, kUNREACHABLE);
  dist_.fill(kUNREACHABLE);
  for (int i = 0; i < static_cast<int>(this->size()); ++i) {
    const vector<LatticeArc>& alts = (*this)[i];
    for (unsigned j = 0; j < alts.size(); ++j)
      dist_(i, i + alts[j].dist2next) = 1;
  }
  for (int k = 0; k < n; ++k) {
    for (int i = 0; i < n; ++i) {
      for (int j = 0; j < n; ++j) {
        const int dp = dist_(i,k) + dist_(k,j);
        if (dist_(i,j) > dp)
          dist_(i,j) = dp;
      }
    }
  }

  for (int i = 0; i < n; ++i) {
    int latest = kUNREACHABLE;
    for (int j = n-1; j >= 0; --j) {
      const int c = dist_(i,j);
      if (c < kUNREACHABLE)
        latest = c;
      else
        dist_(i,j) = latest;
    }
  }
}

bool LatticeTools::LooksLikePLF(const string &line) {
  return (line.size() > 5) && (line.substr(0,4) == "((('");
}

void LatticeTools::ConvertTextToLattice(const string& text, Lattice* pl) {
  Lattice& l = *pl;
  vector<WordID> ids;
  TD::ConvertSentence(text, &ids);
  l.clear();
  l.resize(ids.size());
  for (unsigned i = 0; i < l.size(); ++i)
    l[i].push_back(LatticeArc(ids[i], 0.0, 1));
}

namespace {

struct PLFReader {
  explicit PLFReader(const string& s) : in(s), c(0) {}
  void Fail(const string& what) const {
    throw runtime_error("Bad PLF at position " + to_string(c) + ": " + what + " in " + in);
  }
  void SkipWS() { while (c < in.size() && (in[c] == ' ' || in[c] == '\t')) ++c; }
  bool Peek(char x) { SkipWS(); return c < in.size() && in[c] == x; }
  void Expect(char x) {
    if (!Peek(x)) Fail(string("expected '") + x + "'");
    ++c;
  }
  void OptionalComma() { if (Peek(',')) ++c; }
  string ReadQuoted() {
    SkipWS();
    if (c >= in.size() || (in[c] != '\'' && in[c] != '"')) Fail("expected quoted word");
    const char q = in[c++];
    string w;
    while (c < in.size() && in[c] != q) {
      if (in[c] == '\\' && c + 1 < in.size()) ++c;
      w += in[c++];
    }
    if (c >= in.size()) Fail("unterminated word");
    ++c;
    return w;
  }
  double ReadNumber() {
    SkipWS();
    const char* start = in.c_str() + c;
    char* end = NULL;
    const double v = strtod(start, &end);
    if (end == start) Fail("expected number");
    c += end - start;
    return v;
  }
  void ReadArc(vector<LatticeArc>* alts) {
    Expect('(');
    const WordID w = TD::Convert(ReadQuoted());
    Expect(',');
    const double cost = ReadNumber();
    Expect(',');
    const double dist = ReadNumber();
    Expect(')');
    if (dist < 1) Fail("distance to next node must be positive");
    alts->push_back(LatticeArc(w, cost, static_cast<int>(dist)));
  }
  void Read(Lattice* pl) {
    pl->clear();
    Expect('(');
    while (!Peek(')')) {
      Expect('(');
      pl->push_back(vector<LatticeArc>());
      while (!Peek(')')) {
        ReadArc(&pl->back());
        OptionalComma();
      }
      Expect(')');
      OptionalComma();
    }
    Expect(')');
    for (unsigned i = 0; i < pl->size(); ++i)
      for (unsigned j = 0; j < (*pl)[i].size(); ++j)
        if (i + (*pl)[i][j].dist2next > pl->size()) Fail("arc jumps past the final node");
  }
  const string& in;
  size_t c;
};

}

void LatticeTools::ConvertPLFToLattice(const string& plf, Lattice* pl) {
  PLFReader(plf).Read(pl);
}

void LatticeTools::ConvertTextOrPLF(const string& text_or_plf, Lattice* pl) {
  if (LooksLikePLF(text_or_plf))
    ConvertPLFToLattice(text_or_plf, pl);
  else
    ConvertTextToLattice(text_or_plf, pl);
  pl->ComputeDistances();
}
