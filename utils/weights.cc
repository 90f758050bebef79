#include "weights.h"

#include <cmath>
#include <cstdlib>
#include <sstream>

#include "errors.h"
#include "fdict.h"
#include "filelib.h"
#include "stringlib.h"
#include "verbose.h"

using namespace std;

void Weights::InitFromFile(const string& filename,
                           vector<weight_t>* pweights,
                           vector<string>* feature_list) {
  if (!SILENT) cerr << "Reading weights from " << filename << endl;
  ReadFile in_file(filename);
  InitFromStream(in_file.stream(), pweights, feature_list);
}

void Weights::InitFromStream(istream* pin,
                             vector<weight_t>* pweights,
                             vector<string>* feature_list) {
  istream& in = *pin;
  vector<weight_t>& weights = *pweights;
  int weight_count = 0;
  string buf;
  while (getline(in, buf)) {
    if (buf.size() == 0) continue;
    if (buf[0] == '#') continue;
    if (buf[0] == ' ')
      throw ConfigurationError("Weights file lines may not start with whitespace: " + buf);
    for (int i = buf.size() - 1; i > 0; --i)
      if (buf[i] == '=' || buf[i] == '\t') { buf[i] = ' '; break; }
    unsigned end = 0;
    while(end < buf.size() && buf[end] != ' ') ++end;
    const string name = buf.substr(0, end);
    while(end < buf.size() && buf[end] == ' ') ++end;
    if (end == buf.size())
      throw ConfigurationError("Missing value for weight " + name);
    const double val = strtod(&buf.c_str()[end], NULL);
    if (std::isnan(val))
      throw ConfigurationError(name + " has weight NaN!");
    const unsigned fid = FD::Convert(name);
    if (feature_list) { feature_list->push_back(name); }
    if (weights.size() <= fid)
      weights.resize(fid + 1);
    weights[fid] = val;
    ++weight_count;
  }
  if (!SILENT) cerr << "Loaded " << weight_count << " feature weights\n";
}

void Weights::InitSparseVector(const vector<weight_t>& dv,
                               SparseVector<weight_t>* sv) {
  sv->clear();
  for (unsigned i = 1; i < dv.size(); ++i) {
    if (dv[i]) sv->set_value(i, dv[i]);
  }
}

void Weights::SanityCheck(const vector<weight_t>& w) {
  for (unsigned i = 1; i < w.size(); ++i) {
    if (std::isnan(w[i]) || std::isinf(w[i])) {
      ostringstream os;
      os << FD::Convert(i) << " has bad weight: " << w[i];
      throw ConfigurationError(os.str());
    }
  }
}

string Weights::GetString(const vector<weight_t>& w,
                          bool hide_zero_value_features) {
  ostringstream os;
  os.precision(17);
  const unsigned nf = FD::NumFeats();
  for (unsigned i = 1; i < nf; i++) {
    weight_t val = (i < w.size() ? w[i] : 0.0);
    if (hide_zero_value_features && val == 0.0) {
      continue;
    }
    os << ' ' << FD::Convert(i) << '=' << val;
  }
  const string s = os.str();
  return s.empty() ? s : s.substr(1);
}

void Weights::UpdateFromString(const string& w_string,
                               vector<weight_t>& w) {
  vector<string> tok = SplitOnWhitespace(w_string);
  for (vector<string>::iterator i = tok.begin(); i != tok.end(); i++) {
    const size_t delim = i->find('=');
    if (delim == string::npos)
      throw ConfigurationError("Expected name=value in weight string: " + *i);
    const unsigned fid = FD::Convert(i->substr(0, delim));
    if (w.size() <= fid) w.resize(fid + 1);
    w[fid] = strtod(i->substr(delim + 1).c_str(), NULL);
  }
}
