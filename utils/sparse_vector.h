#ifndef _SPARSE_VECTOR_H_
#define _SPARSE_VECTOR_H_

#include <iostream>
#include <map>
#include <vector>

#include "fdict.h"

// Sparse feature vector keyed by feature id (see FD). Iteration is in
// increasing id order, which keeps printed feature lists stable.
template <typename T>
class SparseVector {
  typedef std::map<int, T> Map;
 public:
  typedef typename Map::const_iterator const_iterator;
  typedef typename Map::iterator iterator;

  SparseVector() {}

  const T value(int index) const {
    typename Map::const_iterator found = values_.find(index);
    if (found == values_.end())
      return T(0);
    else
      return found->second;
  }
  T get(int index) const { return value(index); }

  void set_value(int index, const T& value) {
    values_[index] = value;
  }

  T add_value(int index, const T& value) {
    return values_[index] += value;
  }

  void erase(int index) { values_.erase(index); }

  // dense weight vectors shorter than the feature space count as zero
  template <typename S>
  S dot(const std::vector<S>& weights) const {
    S sum = S();
    for (const_iterator it = values_.begin(); it != values_.end(); ++it) {
      if (it->first >= 0 && it->first < static_cast<int>(weights.size()))
        sum += it->second * weights[it->first];
    }
    return sum;
  }

  T dot(const SparseVector<T>& vec) const {
    T sum = T();
    for (const_iterator it = values_.begin(); it != values_.end(); ++it)
      sum += it->second * vec.value(it->first);
    return sum;
  }

  SparseVector<T>& operator+=(const SparseVector<T>& other) {
    for (const_iterator it = other.values_.begin(); it != other.values_.end(); ++it)
      values_[it->first] += it->second;
    return *this;
  }

  SparseVector<T>& operator-=(const SparseVector<T>& other) {
    for (const_iterator it = other.values_.begin(); it != other.values_.end(); ++it)
      values_[it->first] -= it->second;
    return *this;
  }

  SparseVector<T>& operator*=(const T& x) {
    for (iterator it = values_.begin(); it != values_.end(); ++it)
      it->second *= x;
    return *this;
  }

  SparseVector<T> operator+(const SparseVector<T>& other) const {
    SparseVector<T> result = *this;
    return result += other;
  }

  bool operator==(const SparseVector<T>& other) const {
    return values_ == other.values_;
  }
  bool operator!=(const SparseVector<T>& other) const {
    return !(*this == other);
  }

  const_iterator begin() const { return values_.begin(); }
  const_iterator end() const { return values_.end(); }
  int size() const { return values_.size(); }
  bool empty() const { return values_.empty(); }
  void clear() { values_.clear(); }
  void swap(SparseVector<T>& other) { values_.swap(other.values_); }

 private:
  Map values_;
};

template <class O, typename T>
inline void print(O &o,const SparseVector<T>& v, const char* kvsep="=",const char* pairsep=" ",const char* pre="",const char* post="") {
  o << pre;
  bool first=true;
  for (typename SparseVector<T>::const_iterator i=v.begin(),e=v.end();i!=e;++i) {
    if (first)
      first=false;
    else
      o<<pairsep;
    o<<FD::Convert(i->first)<<kvsep<<i->second;
  }
  o << post;
}

template <typename T>
inline std::ostream& operator<<(std::ostream& out, const SparseVector<T>& v) {
  print(out, v);
  return out;
}

#endif
