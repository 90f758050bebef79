#ifndef ARRAY2D_H_
#define ARRAY2D_H_

#include <iostream>
#include <vector>
#include <cassert>

template<typename T>
class Array2D {
 public:
  typedef typename std::vector<T>::reference reference;
  typedef typename std::vector<T>::const_reference const_reference;
  typedef typename std::vector<T>::iterator iterator;
  typedef typename std::vector<T>::const_iterator const_iterator;
  Array2D() : width_(0), height_(0) {}
  Array2D(int w, int h, const T& d = T()) :
    width_(w), height_(h), data_(w*h, d) {}
  Array2D(const Array2D& rhs) :
    width_(rhs.width_), height_(rhs.height_), data_(rhs.data_) {}
  bool empty() const { return data_.empty(); }
  void resize(int w, int h, const T& d = T()) {
    data_.resize(w * h, d);
    width_ = w;
    height_ = h;
  }
  const Array2D& operator=(const Array2D& rhs) {
    data_ = rhs.data_;
    width_ = rhs.width_;
    height_ = rhs.height_;
    return *this;
  }
  void fill(const T& v) { data_.assign(data_.size(), v); }
  int width() const { return width_; }
  int height() const { return height_; }
  reference operator()(int i, int j) {
    assert(i >= 0 && i < width_);
    assert(j >= 0 && j < height_);
    return data_[i + j*width_];
  }
  const_reference operator()(int i, int j) const {
    assert(i >= 0 && i < width_);
    assert(j >= 0 && j < height_);
    return data_[i + j*width_];
  }
  iterator begin() { return data_.begin(); }
  iterator end() { return data_.end(); }
  const_iterator begin() const { return data_.begin(); }
  const_iterator end() const { return data_.end(); }

 private:
  int width_;
  int height_;
  std::vector<T> data_;
};

template <typename T>
std::ostream& operator<<(std::ostream& os, const Array2D<T>& m) {
  for (int i=0; i<m.width(); ++i) {
    for (int j=0; j<m.height(); ++j)
      os << '\t' << m(i,j);
    os << '\n';
  }
  return os;
}

#endif
