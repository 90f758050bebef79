#include <boost/shared_ptr.hpp>

#include "ff.h"
#include "ff_basic.h"
#include "ff_factory.h"
#include "ff_label_substitution.h"
#include "ff_register.h"
#include "ff_target_bigram.h"

void register_feature_functions() {
  static bool registered = false;
  if (registered) return;
  registered = true;

  RegisterFF<WordPenalty>();
  RegisterFF<SourceWordPenalty>();
  RegisterFF<ArityPenalty>();
  RegisterFF<TargetBigram>();
  RegisterFF<LabelSubstitution>();
}
