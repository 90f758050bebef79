#ifndef _HG_KBEST_H_
#define _HG_KBEST_H_

#include <algorithm>
#include <string>
#include <vector>
#include <utility>
#include <unordered_set>

#include <boost/functional/hash.hpp>
#include <boost/type_traits.hpp>

#include "wordid.h"
#include "hg.h"
#include "tree_fragment.h"

namespace KBest {
  // default, don't filter any derivations from the k-best list
  template<typename Dummy>
  struct NoFilter {
    bool operator()(const Dummy&) {
      return false;
    }
  };

  // optional, filter unique yield strings
  struct FilterUnique {
    std::unordered_set<std::vector<WordID>, boost::hash<std::vector<WordID> > > unique;

    bool operator()(const std::vector<WordID>& yield) {
      return !unique.insert(yield).second;
    }
  };

  // utility class to lazily create the k-best derivations from a forest, uses
  // the lazy k-best algorithm (Algorithm 3) from Huang and Chiang (IWPT 2005).
  // Scores add up along a derivation (edge transition scores), higher is better.
  // Everything computed is cached in the object, per (node, rank), so asking
  // for the k+1-th derivation never changes the first k.
  template<typename T,  // yield type (returned by Traversal)
           typename Traversal,
           typename DerivationFilter = NoFilter<T> >
  struct KBestDerivations {
    KBestDerivations(const Hypergraph& hg,
                     const size_t k,
                     const Traversal& tf = Traversal()) :
      traverse(tf), g(hg), nds(g.nodes_.size()), k_prime(k) {}

    ~KBestDerivations() {
      for (unsigned i = 0; i < freelist.size(); ++i)
        delete freelist[i];
    }

    struct Derivation {
      Derivation(const HG::Edge& e,
                 const std::vector<int>& jv,
                 double s,
                 const SparseVector<double>& f) :
        edge(&e),
        j(jv),
        score(s),
        feature_values(f) {}

      // dummy constructor, just for query
      Derivation(const HG::Edge& e,
                 const std::vector<int>& jv) : edge(&e), j(jv), score(kNO_SCORE) {}

      T yield;
      const HG::Edge* const edge;
      const std::vector<int> j;     // rank of the derivation used for each tail
      const double score;
      const SparseVector<double> feature_values;
    };
    // lower score first; equal scores are ordered by edge, then by rank
    // vector, so the order doesn't depend on how many derivations are asked for
    static bool Worse(const Derivation* a, const Derivation* b) {
      if (a->score != b->score) return a->score < b->score;
      if (a->edge->id_ != b->edge->id_) return a->edge->id_ > b->edge->id_;
      return a->j > b->j;
    }
    struct HeapCompare {
      bool operator()(const Derivation* a, const Derivation* b) const {
        return Worse(a, b);
      }
    };
    struct DerivationCompare {
      bool operator()(const Derivation* a, const Derivation* b) const {
        return Worse(b, a);
      }
    };

    // bracketed tree of d, rules are mapped to tree fragments by fmap.
    // Subtrees deeper than max_depth are left as frontier sites.
    // throws IndexInconsistency
    chartdec::TreeFragmentPtr BuildTree(const Derivation& d,
                                        const chartdec::FragmentMap& fmap,
                                        int max_depth = 100) const {
      const HG::Edge& edge = *d.edge;
      std::vector<chartdec::TreeFragmentPtr> ants(edge.Arity());
      if (max_depth > 0) {
        for (unsigned i = 0; i < ants.size(); ++i)
          ants[i] = BuildTree(*nds[edge.tail_nodes_[i]].D[d.j[i]], fmap, max_depth - 1);
      }
      if (edge.rule_->IsGoal() && ants.size() == 1 && ants[0])
        return ants[0];
      return fmap.Apply(*edge.rule_, ants);
    }

    struct DerivationUniquenessHash {
      size_t operator()(const Derivation* d) const {
        size_t x = 5381;
        x = ((x << 5) + x) ^ d->edge->id_;
        for (unsigned i = 0; i < d->j.size(); ++i)
          x = ((x << 5) + x) ^ d->j[i];
        return x;
      }
    };
    struct DerivationUniquenessEquals {
      bool operator()(const Derivation* a, const Derivation* b) const {
        return (a->edge == b->edge) && (a->j == b->j);
      }
    };
    typedef std::vector<Derivation*> CandidateHeap;
    typedef std::vector<Derivation*> DerivationList;
    typedef std::unordered_set<
       const Derivation*, DerivationUniquenessHash, DerivationUniquenessEquals> UniqueDerivationSet;

    struct NodeDerivationState {
      CandidateHeap cand;
      DerivationList D;
      DerivationFilter filter;
      UniqueDerivationSet ds;
      bool initialized;
      explicit NodeDerivationState(const DerivationFilter& f = DerivationFilter()) :
        filter(f), initialized(false) {}
    };

    // the k-th (from 0) best derivation of node v, NULL if v has fewer
    Derivation* LazyKthBest(unsigned v, unsigned k) {
      NodeDerivationState& s = GetCandidates(v);
      CandidateHeap& cand = s.cand;
      DerivationList& D = s.D;
      DerivationFilter& filter = s.filter;
      bool add_next = true;
      while (D.size() <= k) {
        if (add_next && D.size() > 0) {
          const Derivation* d = D.back();
          LazyNext(d, &cand, &s.ds);
        }
        add_next = false;

        while (!add_next && cand.size() > 0) {
          std::pop_heap(cand.begin(), cand.end(), HeapCompare());
          Derivation* d = cand.back();
          cand.pop_back();
          std::vector<const T*> ants(d->edge->Arity());
          for (unsigned j = 0; j < ants.size(); ++j)
            ants[j] = &LazyKthBest(d->edge->tail_nodes_[j], d->j[j])->yield;
          traverse(*d->edge, ants, &d->yield);
          if (!filter(d->yield)) {
            D.push_back(d);
            add_next = true;
          } else {
            // a filtered derivation still has successors that may not be
            LazyNext(d, &cand, &s.ds);
          }
        }
        if (!add_next)
          break;
      }
      if (k < D.size()) return D[k]; else return NULL;
    }

  private:
    // creates a derivation object with all fields set but the yield
    // the yield is computed in LazyKthBest before the derivation is added to D
    // returns NULL if j refers to derivation numbers larger than the
    // antecedent structure define
    Derivation* CreateDerivation(const HG::Edge& e, const std::vector<int>& j) {
      double score = e.transition_score_;
      SparseVector<double> feats = e.feature_values_;
      for (int i = 0; i < e.Arity(); ++i) {
        const Derivation* ant = LazyKthBest(e.tail_nodes_[i], j[i]);
        if (!ant) { return NULL; }
        score += ant->score;
        feats += ant->feature_values;
      }
      freelist.push_back(new Derivation(e, j, score, feats));
      return freelist.back();
    }

    NodeDerivationState& GetCandidates(unsigned v) {
      NodeDerivationState& s = nds[v];
      if (s.initialized) return s;
      s.initialized = true;

      const Hypergraph::Node& node = g.nodes_[v];
      for (unsigned i = 0; i < node.in_edges_.size(); ++i) {
        const HG::Edge& edge = g.edges_[node.in_edges_[i]];
        std::vector<int> jv(edge.Arity(), 0);
        Derivation* d = CreateDerivation(edge, jv);
        if (d) {
          s.cand.push_back(d);
          s.ds.insert(d);
        }
      }

      unsigned effective_k = s.cand.size();
      if (boost::is_same<DerivationFilter,NoFilter<T> >::value) {
        // if there's no filter you can use this optimization
        effective_k = std::min(k_prime, s.cand.size());
      }
      const typename CandidateHeap::iterator kth = s.cand.begin() + effective_k;
      std::nth_element(s.cand.begin(), kth, s.cand.end(), DerivationCompare());
      s.cand.resize(effective_k);
      std::make_heap(s.cand.begin(), s.cand.end(), HeapCompare());

      return s;
    }

    void LazyNext(const Derivation* d, CandidateHeap* cand, UniqueDerivationSet* ds) {
      for (unsigned i = 0; i < d->j.size(); ++i) {
        std::vector<int> j = d->j;
        ++j[i];
        const Derivation* ant = LazyKthBest(d->edge->tail_nodes_[i], j[i]);
        if (ant) {
          Derivation query_unique(*d->edge, j);
          if (ds->count(&query_unique) == 0) {
            Derivation* new_d = CreateDerivation(*d->edge, j);
            if (new_d) {
              cand->push_back(new_d);
              std::push_heap(cand->begin(), cand->end(), HeapCompare());
              ds->insert(new_d);
            }
          }
        }
      }
    }

    KBestDerivations(const KBestDerivations&);
    void operator=(const KBestDerivations&);

    const Traversal traverse;
    const Hypergraph& g;
    std::vector<NodeDerivationState> nds;
    std::vector<Derivation*> freelist;
    const size_t k_prime;
  };
}

#endif
