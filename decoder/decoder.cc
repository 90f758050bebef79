#include "decoder.h"

#ifdef _OPENMP
#include <omp.h>
#endif

#include <cstdlib>
#include <sstream>
#include <stdexcept>

#include <boost/program_options.hpp>
#include <boost/program_options/variables_map.hpp>

#include "chart.h"
#include "errors.h"
#include "ff.h"
#include "ff_factory.h"
#include "ff_register.h"
#include "ffset.h"
#include "filelib.h"
#include "grammar.h"
#include "hg.h"
#include "kbest.h"
#include "lattice.h"
#include "sentence_metadata.h"
#include "stringlib.h"
#include "tdict.h"
#include "tree_fragment.h"
#include "verbose.h"
#include "viterbi.h"
#include "weights.h"

using namespace std;
namespace po = boost::program_options;

inline void ShowBanner() {
  cerr << "chartdec: SCFG chart decoder\n";
}

inline string str(char const* name,po::variables_map const& conf) {
  return conf[name].as<string>();
}

template <class V>
inline bool store_conf(po::variables_map const& conf,std::string const& name,V *v) {
  if (conf.count(name)) {
    *v=conf[name].as<V>();
    return true;
  }
  return false;
}

inline boost::shared_ptr<FeatureFunction> make_ff(string const& ffp) {
  string ff, param;
  SplitCommandAndParam(ffp, &ff, &param);
  if (!SILENT) {
    cerr << "feature: " << ff;
    if (param.size() > 0) cerr << " (with config parameters '" << param << "')\n";
    else cerr << " (no config parameters)\n";
  }
  boost::shared_ptr<FeatureFunction> pf = ff_registry.Create(ff, param);
  if (!SILENT && pf->IsStateful())
    cerr << "State is " << pf->StateSize() << " bytes for feature " << ffp << endl;
  return pf;
}

const char* StatusName(DecodeStatus s) {
  switch (s) {
    case DECODE_OK: return "OK";
    case NO_DERIVATION: return "NO_DERIVATION";
    case CANCELLED: return "CANCELLED";
    case FAILED: return "FAILED";
  }
  return "UNKNOWN";
}

void WriteKBest(const DecodeResult& result, bool show_trees, ostream* out) {
  for (unsigned i = 0; i < result.kbest.size(); ++i) {
    const Hypothesis& h = result.kbest[i];
    *out << result.sent_id << " ||| " << TD::GetString(h.words) << " ||| " << h.features
         << " ||| " << h.score;
    if (show_trees) *out << " ||| " << h.tree;
    *out << '\n';
  }
  out->flush();
}

class DecoderImpl {
 public:
  DecoderImpl(po::variables_map& conf, int argc, char** argv, istream* cfg);
  DecodeResult Decode(const string& input, int sent_id,
                      const vector<ConstraintSpan>* constraints,
                      const atomic<bool>* cancel) const;

  template <class Filter>
  void ExtractKBest(const Hypergraph& forest, DecodeResult* res) const;
  void PassThrough(const Lattice& lattice, DecodeResult* res) const;

  po::variables_map& conf;
  vector<GrammarPtr> grammars;
  vector<weight_t> weights;
  vector<boost::shared_ptr<FeatureFunction> > pffs;
  boost::shared_ptr<ModelSet> models;
  ChartConfiguration chart_conf;
  chartdec::FragmentMap fragments;
  SentenceConstraints file_constraints;
  int kbest;
  bool unique_kbest;
  bool show_trees;
  int tree_max_depth;
  int threads;
};

DecoderImpl::DecoderImpl(po::variables_map& conf, int argc, char** argv, istream* cfg) : conf(conf) {
  register_feature_functions();
  vector<string> cfg_files;

  po::options_description opts("Configuration options");
  opts.add_options()
        ("formalism,f",po::value<string>()->default_value("scfg"),"Decoding formalism; only scfg is supported")
        ("input,i",po::value<string>()->default_value("-"),"Source file (chartdec only)")
        ("grammar,g",po::value<vector<string> >()->composing(),"SCFG grammar file(s)")
        ("list_feature_functions,L","List available feature functions")
        ("weights,w",po::value<string>(),"Feature weights file")
        ("feature_function,F",po::value<vector<string> >()->composing(), "Additional feature function(s) (-L for list)")
        ("intersection_strategy,I",po::value<string>()->default_value("cube_pruning"), "Intersection strategy for incorporating stateful features; values include Cube_pruning, Full")
        ("cubepruning_pop_limit,K",po::value<int>()->default_value(200), "Max number of pops from the candidate heap of each span and category")
        ("k_best,k",po::value<int>()->default_value(1),"Extract the k best derivations")
        ("unique_k_best,r", "Unique k-best translation list")
        ("goal",po::value<string>()->default_value("S"),"Goal symbol")
        ("scfg_no_hiero_glue_grammar,n", "No Hiero glue grammar (nb. by default the SCFG decoder adds Hiero glue rules)")
        ("scfg_default_nt,d",po::value<string>()->default_value("X"),"Default non-terminal symbol in SCFG")
        ("scfg_max_span_limit,S",po::value<int>()->default_value(10),"Maximum non-terminal span limit (except \"glue\" grammar)")
        ("threads,j",po::value<int>()->default_value(1),"Number of sentences decoded in parallel")
        ("fragment_map",po::value<string>(),"Tree fragments of the rules (lines: fragment ||| target side)")
        ("tree_max_depth",po::value<int>()->default_value(100),"Derivation trees deeper than this are cut off")
        ("constraints",po::value<string>(),"Constraint spans of the input sentences")
        ("show_tree_structure", "Show the derivation tree of each hypothesis")
        ("quiet", "Disable verbose output");

  po::options_description clo("Command line options");
  clo.add_options()
        ("config,c", po::value<vector<string> >(&cfg_files), "Configuration file(s) - latest has priority")
        ("help,?", "Print this help message and exit")
        ("usage,u", po::value<string>(), "Describe a feature function type");

  po::options_description dconfig_options, dcmdline_options;
  dconfig_options.add(opts);
  dcmdline_options.add(dconfig_options).add(clo);
  try {
    if (argc) {
      po::store(parse_command_line(argc, argv, dcmdline_options), conf);
      if (conf.count("quiet"))
        SetSilent(true);
      if (!SILENT) ShowBanner();
    }
    if (conf.count("config") && !cfg) {
      typedef vector<string> Cs;
      Cs cs=conf["config"].as<Cs>();
      for (unsigned i=0;i<cs.size();++i) {
        string cfg=cs[i];
        if (!SILENT) cerr << "Configuration file: " << cfg << endl;
        ReadFile conff(cfg);
        po::store(po::parse_config_file(*conff.stream(), dconfig_options), conf);
      }
    }
    if (cfg) po::store(po::parse_config_file(*cfg, dconfig_options), conf);
    po::notify(conf);
  } catch (const po::error& e) {
    throw ConfigurationError(string("Bad configuration: ") + e.what());
  }
  if (conf.count("quiet"))
    SetSilent(true);

  if (conf.count("list_feature_functions")) {
    cerr << "Available feature functions (specify with -F; describe with -u FeatureName):\n";
    ff_registry.DisplayList();
    cerr << endl;
    exit(0);
  }
  if (conf.count("usage")) {
    ff_usage(str("usage",conf));
    exit(0);
  }
  if (conf.count("help")) {
    cout << dcmdline_options << endl;
    exit(0);
  }

  if (LowercaseString(str("formalism",conf)) != "scfg")
    throw ConfigurationError("--formalism takes only 'scfg'");
  if (conf.count("grammar") == 0)
    throw ConfigurationError("No grammar file(s) specified (--grammar)");

  if (conf.count("weights")) {
    Weights::InitFromFile(str("weights",conf), &weights);
  } else if (!SILENT) {
    cerr << "No weights file given, all features have weight 0" << endl;
  }

  vector<const FeatureFunction*> ffs;
  if (conf.count("feature_function")) {
    vector<string> add_ffs;
    store_conf(conf,"feature_function",&add_ffs);
    for (unsigned i = 0; i < add_ffs.size(); ++i) {
      pffs.push_back(make_ff(add_ffs[i]));
      ffs.push_back(pffs.back().get());
    }
  }
  models.reset(new ModelSet(weights, ffs));

  const string isn = LowercaseString(str("intersection_strategy",conf));
  if (isn == "full") {
    chart_conf.algorithm = FULL;
  } else if (isn == "cube_pruning") {
    chart_conf.algorithm = CUBE;
  } else {
    throw ConfigurationError("--intersection_strategy takes 'cube_pruning' or 'full', not " + isn);
  }
  chart_conf.pop_limit = conf["cubepruning_pop_limit"].as<int>();
  if (chart_conf.pop_limit < 1)
    throw ConfigurationError("--cubepruning_pop_limit must be at least 1");
  chart_conf.goal = str("goal",conf);
  chart_conf.default_nt = str("scfg_default_nt",conf);
  if (!SILENT) {
    cerr << "Intersection: " << (chart_conf.algorithm == FULL ? "full" : "cube pruning");
    if (chart_conf.algorithm == CUBE) cerr << " (pop limit " << chart_conf.pop_limit << ")";
    cerr << endl;
  }

  const int max_span_limit = conf["scfg_max_span_limit"].as<int>();
  vector<string> gfiles = conf["grammar"].as<vector<string> >();
  for (unsigned i = 0; i < gfiles.size(); ++i) {
    if (!SILENT) cerr << "Reading SCFG grammar from " << gfiles[i] << endl;
    TextGrammar* g = new TextGrammar(gfiles[i]);
    g->SetMaxSpan(max_span_limit);
    grammars.push_back(GrammarPtr(g));
  }
  if (!conf.count("scfg_no_hiero_glue_grammar")) {
    GlueGrammar* g = new GlueGrammar(chart_conf.goal, chart_conf.default_nt);
    grammars.push_back(GrammarPtr(g));
    if (!SILENT) cerr << "Adding glue grammar for default nonterminal " << chart_conf.default_nt
                      << " and goal nonterminal " << chart_conf.goal << endl;
  }

  if (conf.count("fragment_map"))
    fragments.ReadFromFile(str("fragment_map",conf));
  if (conf.count("constraints"))
    ReadConstraintsFromFile(str("constraints",conf), &file_constraints);

  kbest = conf["k_best"].as<int>();
  if (kbest < 1)
    throw ConfigurationError("--k_best must be at least 1");
  unique_kbest = conf.count("unique_k_best");
  show_trees = conf.count("show_tree_structure");
  tree_max_depth = conf["tree_max_depth"].as<int>();
  threads = conf["threads"].as<int>();
  if (threads < 1)
    throw ConfigurationError("--threads must be at least 1");
#ifndef _OPENMP
  if (threads > 1 && !SILENT)
    cerr << "Built without OpenMP, decoding with 1 thread" << endl;
#endif
}

void DecoderImpl::PassThrough(const Lattice& lattice, DecodeResult* res) const {
  static const WordID kEPS = TD::Convert("*EPS*");
  Hypothesis h;
  unsigned pos = 0;
  while (pos < lattice.size() && !lattice[pos].empty()) {
    const LatticeArc& arc = lattice[pos][0];
    if (arc.label != kEPS) h.words.push_back(arc.label);
    if (arc.dist2next < 1) break;
    pos += arc.dist2next;
  }
  res->kbest.push_back(h);
}

template <class Filter>
void DecoderImpl::ExtractKBest(const Hypergraph& forest, DecodeResult* res) const {
  typedef KBest::KBestDerivations<vector<WordID>, ESentenceTraversal, Filter> KBestList;
  KBestList kb(forest, kbest);
  const int goal = forest.GoalNode();
  for (int i = 0; i < kbest; ++i) {
    const typename KBestList::Derivation* d = kb.LazyKthBest(goal, i);
    if (!d) break;
    Hypothesis h;
    h.words = d->yield;
    h.features = d->feature_values;
    h.score = d->score;
    if (show_trees || !fragments.empty())
      h.tree = kb.BuildTree(*d, fragments, tree_max_depth)->ToString();
    res->kbest.push_back(h);
  }
}

DecodeResult DecoderImpl::Decode(const string& input, int sent_id,
                                 const vector<ConstraintSpan>* constraints,
                                 const atomic<bool>* cancel) const {
  DecodeResult res;
  res.sent_id = sent_id;
  try {
    Lattice lattice;
    LatticeTools::ConvertTextOrPLF(input, &lattice);
    if (!SILENT) cerr << "  " << sent_id << ": " << lattice.size() << " input positions" << endl;
    SentenceMetadata smeta(sent_id, lattice);
    if (!constraints) {
      SentenceConstraints::const_iterator it = file_constraints.find(sent_id);
      if (it != file_constraints.end()) constraints = &it->second;
    }
    smeta.SetConstraints(constraints);
    smeta.SetCancelFlag(cancel);

    Hypergraph forest;
    Chart chart(grammars, *models, smeta, chart_conf, &forest);
    const bool found = chart.Expand();
    res.num_nodes = forest.nodes_.size();
    res.num_edges = forest.edges_.size();
    if (chart.Cancelled()) {
      res.status = CANCELLED;
      if (!SILENT) cerr << "  " << sent_id << ": cancelled" << endl;
      return res;
    }
    if (!found) {
      res.status = NO_DERIVATION;
      cerr << "  " << sent_id << ": NO PARSE FOUND, passing the source through" << endl;
      PassThrough(lattice, &res);
      return res;
    }
    if (unique_kbest)
      ExtractKBest<KBest::FilterUnique>(forest, &res);
    else
      ExtractKBest<KBest::NoFilter<vector<WordID> > >(forest, &res);
    res.status = DECODE_OK;
  } catch (const std::exception& e) {
    cerr << "  " << sent_id << ": decoding failed: " << e.what() << endl;
    res.status = FAILED;
    res.error = e.what();
    res.kbest.clear();
  }
  return res;
}

Decoder::Decoder(istream* cfg) { pimpl_.reset(new DecoderImpl(conf,0,0,cfg)); }
Decoder::Decoder(int argc, char** argv) { pimpl_.reset(new DecoderImpl(conf,argc, argv, 0)); }
Decoder::~Decoder() {}

DecodeResult Decoder::Decode(const string& input, int sent_id,
                             const vector<ConstraintSpan>* constraints,
                             const atomic<bool>* cancel) const {
  return pimpl_->Decode(input, sent_id, constraints, cancel);
}

void Decoder::DecodeBatch(const vector<string>& inputs, int first_id,
                          vector<DecodeResult>* results,
                          const atomic<bool>* cancel) const {
  const int n = inputs.size();
  results->clear();
  results->resize(n);
#ifdef _OPENMP
#pragma omp parallel for schedule(dynamic) num_threads(pimpl_->threads)
#endif
  for (int i = 0; i < n; ++i)
    (*results)[i] = pimpl_->Decode(inputs[i], first_id + i, NULL, cancel);
}

const vector<weight_t>& Decoder::CurrentWeightVector() const { return pimpl_->weights; }
int Decoder::NumThreads() const { return pimpl_->threads; }
bool Decoder::ShowTrees() const { return pimpl_->show_trees; }
