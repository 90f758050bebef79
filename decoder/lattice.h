#ifndef LATTICE_H_
#define LATTICE_H_

#include <string>
#include <vector>
#include "wordid.h"
#include "array2d.h"

class Lattice;
struct LatticeTools {
  static bool LooksLikePLF(const std::string &line);
  static void ConvertTextToLattice(const std::string& text, Lattice* pl);
  // PLF: ((('a',0.5,1),('b',0.0,2),),(('c',0.0,1),),)
  // throws std::runtime_error on malformed input
  static void ConvertPLFToLattice(const std::string& plf, Lattice* pl);
  static void ConvertTextOrPLF(const std::string& text_or_plf, Lattice* pl);
};

struct LatticeArc {
  WordID label;
  double cost;
  int dist2next;
  LatticeArc() : label(), cost(), dist2next() {}
  LatticeArc(WordID w, double c, int i) : label(w), cost(c), dist2next(i) {}
};

class Lattice : public std::vector<std::vector<LatticeArc> > {
  friend void LatticeTools::ConvertTextOrPLF(const std::string& text_or_plf, Lattice* pl);
 public:
  Lattice() {}
  explicit Lattice(size_t t, const std::vector<LatticeArc>& v = std::vector<LatticeArc>()) :
   std::vector<std::vector<LatticeArc> >(t, v) {}
  // number of arcs on the shortest path from node from to node to
  int Distance(int from, int to) const {
    if (dist_.empty())
      return (to - from);
    return dist_(from, to);
  }
  void ComputeDistances();
 private:
  Array2D<int> dist_;
};

inline bool IsSentence(const Lattice& in) {
  bool res = true;
  for (auto& alt : in)
    if (alt.size() > 1) { res = false; break; }
  return res;
}

#endif
