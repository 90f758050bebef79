#ifndef _DECODER_H_
#define _DECODER_H_

#include <atomic>
#include <iostream>
#include <string>
#include <vector>
#include <boost/shared_ptr.hpp>
#include <boost/program_options/variables_map.hpp>

#include "constraint.h"
#include "sparse_vector.h"
#include "weights.h"  // weight_t
#include "wordid.h"

class DecoderImpl;

enum DecodeStatus {
  DECODE_OK,
  NO_DERIVATION,   // the source words are returned as the translation
  CANCELLED,
  FAILED           // see DecodeResult::error
};

struct Hypothesis {
  Hypothesis() : score() {}
  std::vector<WordID> words;
  SparseVector<double> features;
  double score;
  std::string tree;  // only filled in with show_tree_structure or a fragment map
};

struct DecodeResult {
  DecodeResult() : sent_id(-1), status(FAILED), num_nodes(), num_edges() {}
  int sent_id;
  DecodeStatus status;
  std::string error;
  std::vector<Hypothesis> kbest;  // best first
  int num_nodes;
  int num_edges;
};

const char* StatusName(DecodeStatus s);

// id ||| translation ||| feature=value ... ||| score [||| tree]
// one line per hypothesis
void WriteKBest(const DecodeResult& result, bool show_trees, std::ostream* out);

// Translates sentences with the grammars, feature functions and weights
// given by its configuration.  Everything the decoder holds is read only
// while decoding, so Decode may be called from several threads at once.
class Decoder {
 public:
  // throws ConfigurationError (bad options, missing files, unknown
  // feature functions); grammar read errors are not caught
  Decoder(int argc, char** argv);
  explicit Decoder(std::istream* config_file);
  ~Decoder();

  // decodes one sentence (plain text or PLF lattice).  Errors only affect
  // this sentence: they are logged and reported as FAILED.
  // If constraints is NULL, the constraints read from the constraints
  // file (if any) for sent_id are used.
  DecodeResult Decode(const std::string& input,
                      int sent_id,
                      const std::vector<ConstraintSpan>* constraints = NULL,
                      const std::atomic<bool>* cancel = NULL) const;

  // decodes inputs[i] as sentence first_id + i, using the configured
  // number of threads; results are in input order
  void DecodeBatch(const std::vector<std::string>& inputs,
                   int first_id,
                   std::vector<DecodeResult>* results,
                   const std::atomic<bool>* cancel = NULL) const;

  const std::vector<weight_t>& CurrentWeightVector() const;
  const boost::program_options::variables_map& GetConf() const { return conf; }
  int NumThreads() const;
  bool ShowTrees() const;

 private:
  boost::program_options::variables_map conf;
  boost::shared_ptr<DecoderImpl> pimpl_;
};

#endif
