#ifndef CHARTDEC_STRINGLIB_H_
#define CHARTDEC_STRINGLIB_H_

#include <cctype>
#include <string>
#include <vector>

inline std::string Trim(const std::string& str, const std::string& dropChars = " \t") {
  std::string::size_type b = str.find_first_not_of(dropChars);
  if (b == std::string::npos) return "";
  std::string::size_type e = str.find_last_not_of(dropChars);
  return str.substr(b, e - b + 1);
}

inline void Tokenize(const std::string& str, char delimiter, std::vector<std::string>* res) {
  std::string s = str;
  unsigned last = 0;
  res->clear();
  for (unsigned i=0; i < s.size(); ++i)
    if (s[i] == delimiter) {
      s[i]=0;
      if (last != i) {
        res->push_back(&s[last]);
      }
      last = i + 1;
    }
  if (last != s.size())
    res->push_back(&s[last]);
}

inline int SplitOnWhitespace(const std::string& in, std::vector<std::string>* out) {
  out->clear();
  unsigned i = 0;
  unsigned start = 0;
  std::string cur;
  while(i < in.size()) {
    if (in[i] == ' ' || in[i] == '\t') {
      if (i - start > 0)
        out->push_back(cur);
      cur.clear();
      start = i + 1;
    } else {
      cur += in[i];
    }
    ++i;
  }
  if (i - start > 0)
    out->push_back(cur);
  return out->size();
}

inline std::vector<std::string> SplitOnWhitespace(std::string const& in)
{
  std::vector<std::string> r;
  SplitOnWhitespace(in,&r);
  return r;
}

// splits "a ||| b ||| c" into its trimmed fields
void SplitOnTripleBar(const std::string& in, std::vector<std::string>* fields);

inline void SplitCommandAndParam(const std::string& in, std::string* cmd, std::string* param) {
  cmd->clear();
  param->clear();
  std::vector<std::string> x;
  SplitOnWhitespace(in, &x);
  if (x.size() == 0) return;
  *cmd = x[0];
  for (unsigned i = 1; i < x.size(); ++i) {
    if (i > 1) { *param += " "; }
    *param += x[i];
  }
}

inline std::string LowercaseString(const std::string& in) {
  std::string res(in.size(),' ');
  for (unsigned i = 0; i < in.size(); ++i)
    res[i] = tolower(in[i]);
  return res;
}

// "[NP]" and "[NP,1]" both give "NP"; anything else is returned unchanged
std::string StripNonterminalBrackets(const std::string& s);

#endif
