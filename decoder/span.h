#ifndef SPAN_H_
#define SPAN_H_

#include <cassert>
#include <cstddef>
#include <iostream>

#include <boost/functional/hash.hpp>

// half-open range [i,j) of input positions
struct Span {
  int i, j;
  Span(int ii, int jj) : i(ii), j(jj) {
    assert(j > i && i >= 0);
  }
  int size() const { return j - i; }
  bool operator==(const Span& o) const { return i == o.i && j == o.j; }
  bool operator!=(const Span& o) const { return !(*this == o); }
  bool operator<(const Span& o) const {
    return i < o.i || (i == o.i && j < o.j);
  }
  friend inline std::ostream& operator<<(std::ostream& o, const Span& s) {
    return o << '<' << s.i << ',' << s.j << '>';
  }
};

inline std::size_t hash_value(const Span& s) {
  std::size_t h = 0;
  boost::hash_combine(h, s.i);
  boost::hash_combine(h, s.j);
  return h;
}

#endif
