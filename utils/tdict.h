#ifndef _TDICT_H_
#define _TDICT_H_

#include <string>
#include <vector>
#include "wordid.h"
#include "dict.h"

// process-wide vocabulary for source and target words and nonterminal labels
struct TD {
  static void ConvertSentence(std::string const& sent, std::vector<WordID>* ids);
  static void GetWordIDs(const std::vector<std::string>& strings, std::vector<WordID>* ids);
  static std::string GetString(const std::vector<WordID>& str);
  static std::string GetString(WordID const* i,WordID const* e);
  static unsigned int NumWords() {
    return dict_.max();
  }
  static WordID Convert(const std::string& s) {
    return dict_.Convert(s);
  }
  static WordID Convert(char const* s) {
    return dict_.Convert(std::string(s));
  }
  static const std::string& Convert(WordID w) {
    return dict_.Convert(w);
  }
 private:
  static Dict dict_;
};

#endif
