#ifndef SENTENCE_METADATA_H_
#define SENTENCE_METADATA_H_

#include <atomic>
#include <vector>

#include "constraint.h"
#include "lattice.h"

class SentenceMetadata {
 public:
  SentenceMetadata(int id, const Lattice& src) :
    sent_id_(id),
    src_lattice_(src),
    constraints_(NULL),
    cancel_(NULL) {}

  int GetSentenceId() const { return sent_id_; }
  int GetSourceLength() const { return src_lattice_.size(); }
  const Lattice& GetSourceLattice() const { return src_lattice_; }

  void SetConstraints(const std::vector<ConstraintSpan>* c) { constraints_ = c; }
  const std::vector<ConstraintSpan>& GetConstraints() const {
    static const std::vector<ConstraintSpan> kNONE;
    return constraints_ ? *constraints_ : kNONE;
  }

  // the flag is owned by the caller and may be set from another thread
  void SetCancelFlag(const std::atomic<bool>* c) { cancel_ = c; }
  bool Cancelled() const { return cancel_ && cancel_->load(); }

 private:
  const int sent_id_;
  const Lattice& src_lattice_;
  const std::vector<ConstraintSpan>* constraints_;
  const std::atomic<bool>* cancel_;
};

#endif
