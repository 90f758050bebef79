#include "constraint.h"

#include <sstream>

#include <boost/lexical_cast.hpp>

#include "errors.h"
#include "filelib.h"
#include "stringlib.h"
#include "verbose.h"

using namespace std;

ConstraintRule ConstraintRule::Rule(const string& lhs,
                                    const string& foreign_rhs,
                                    const string& native_rhs,
                                    const vector<double>& features) {
  ConstraintRule r;
  r.type = RULE;
  r.lhs = lhs;
  r.foreign_rhs = foreign_rhs;
  r.native_rhs = native_rhs;
  r.features = features;
  return r;
}

ConstraintRule ConstraintRule::Lhs(const string& lhs) {
  ConstraintRule r;
  r.type = LHS;
  r.lhs = lhs;
  return r;
}

ConstraintRule ConstraintRule::Rhs(const string& native_rhs) {
  ConstraintRule r;
  r.type = RHS;
  r.native_rhs = native_rhs;
  return r;
}

static void ConstraintError(int lc, const string& line, const string& what) {
  ostringstream os;
  os << "Constraint line " << lc << ": " << what << ": " << line;
  throw ConfigurationError(os.str());
}

void ReadConstraints(istream* in, SentenceConstraints* constraints) {
  string line;
  int lc = 0;
  ConstraintSpan* cur = NULL;
  while (getline(*in, line)) {
    ++lc;
    line = Trim(line);
    if (line.empty()) { cur = NULL; continue; }
    if (line[0] == '#') continue;
    if (!cur) {
      vector<string> toks = SplitOnWhitespace(line);
      if (toks.size() != 4)
        ConstraintError(lc, line, "expected <sent_id> <start> <end> hard|soft");
      int sent_id = 0, start = 0, end = 0;
      try {
        sent_id = boost::lexical_cast<int>(toks[0]);
        start = boost::lexical_cast<int>(toks[1]);
        end = boost::lexical_cast<int>(toks[2]);
      } catch (const boost::bad_lexical_cast&) {
        ConstraintError(lc, line, "sentence id and span must be integers");
      }
      if (start < 0 || end <= start)
        ConstraintError(lc, line, "bad span");
      if (toks[3] != "hard" && toks[3] != "soft")
        ConstraintError(lc, line, "span must be hard or soft");
      vector<ConstraintSpan>& spans = (*constraints)[sent_id];
      spans.push_back(ConstraintSpan(start, end, toks[3] == "hard"));
      cur = &spans.back();
      continue;
    }
    vector<string> fields;
    SplitOnTripleBar(line, &fields);
    if (fields[0] == "RULE") {
      if (fields.size() < 4)
        ConstraintError(lc, line, "RULE needs lhs, foreign and native sides");
      vector<double> feats;
      if (fields.size() > 4) {
        const vector<string> vals = SplitOnWhitespace(fields[4]);
        for (unsigned i = 0; i < vals.size(); ++i) {
          try {
            feats.push_back(boost::lexical_cast<double>(vals[i]));
          } catch (const boost::bad_lexical_cast&) {
            ConstraintError(lc, line, "bad feature value " + vals[i]);
          }
        }
      }
      cur->rules.push_back(ConstraintRule::Rule(fields[1], fields[2], fields[3], feats));
    } else if (fields[0] == "LHS" && fields.size() == 2) {
      cur->rules.push_back(ConstraintRule::Lhs(fields[1]));
    } else if (fields[0] == "RHS" && fields.size() == 2) {
      cur->rules.push_back(ConstraintRule::Rhs(fields[1]));
    } else {
      ConstraintError(lc, line, "unknown constraint type");
    }
  }
}

void ReadConstraintsFromFile(const string& filename, SentenceConstraints* constraints) {
  if (!SILENT) cerr << "Reading constraints from " << filename << endl;
  ReadFile in(filename);
  ReadConstraints(in.stream(), constraints);
}
