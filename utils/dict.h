#ifndef DICT_H_
#define DICT_H_

#include <cassert>

#include <deque>
#include <string>
#include <vector>

#include <boost/thread/mutex.hpp>

#include "hash.h"
#include "wordid.h"

// String interning table. Ids start at 1; 0 is reserved for "no word".
// Safe to use from several decoding threads: lookups and insertions are
// serialized, and returned strings stay valid for the lifetime of the Dict.
class Dict {
  typedef HASH_MAP<std::string, WordID> Map;
 public:
  Dict() : b0_("<bad0>") {}

  inline int max() const {
    boost::mutex::scoped_lock lock(mutex_);
    return words_.size();
  }

  static bool is_ws(char x) {
    return (x == ' ' || x == '\t');
  }

  void ConvertWhitespaceDelimitedLine(const std::string& line, std::vector<int>* out) {
    size_t cur = 0;
    size_t last = 0;
    int state = 0;
    out->clear();
    while(cur < line.size()) {
      if (is_ws(line[cur++])) {
        if (state == 0) continue;
        out->push_back(Convert(line.substr(last, cur - last - 1)));
        state = 0;
      } else {
        if (state == 1) continue;
        last = cur - 1;
        state = 1;
      }
    }
    if (state == 1)
      out->push_back(Convert(line.substr(last, cur - last)));
  }

  WordID Convert(const std::string& word, bool frozen = false) {
    boost::mutex::scoped_lock lock(mutex_);
    Map::iterator i = d_.find(word);
    if (i != d_.end()) return i->second;
    if (frozen) return 0;
    words_.push_back(word);
    const WordID id = words_.size();
    d_[word] = id;
    return id;
  }

  const std::string& Convert(const WordID& id) const {
    if (id == 0) return b0_;
    boost::mutex::scoped_lock lock(mutex_);
    assert(id > 0 && id <= (int)words_.size());
    return words_[id-1];
  }

  void clear() {
    boost::mutex::scoped_lock lock(mutex_);
    words_.clear();
    d_.clear();
  }

 private:
  const std::string b0_;
  // deque: growing never moves existing strings
  std::deque<std::string> words_;
  Map d_;
  mutable boost::mutex mutex_;
};

#endif
