#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

#include "decoder.h"
#include "filelib.h"
#include "ff_register.h"
#include "verbose.h"

using namespace std;

int main(int argc, char** argv) {
  try {
    register_feature_functions();
    Decoder decoder(argc, argv);

    const string input = decoder.GetConf()["input"].as<string>();
    if (!SILENT) cerr << "Reading input from " << ((input == "-") ? "STDIN" : input.c_str()) << endl;
    ReadFile in_read(input);
    istream *in = in_read.stream();

    // sentences are decoded in batches so the threads have work to share
    const unsigned batch_size = decoder.NumThreads() > 1 ? 64 * decoder.NumThreads() : 1;
    const bool show_trees = decoder.ShowTrees();
    vector<string> batch;
    vector<DecodeResult> results;
    int sent_id = 0;
    int failed = 0;
    string buf;
    while (true) {
      const bool more = static_cast<bool>(getline(*in, buf));
      if (more && !buf.empty()) batch.push_back(buf);
      if (batch.empty() || (more && batch.size() < batch_size)) {
        if (!more) break;
        continue;
      }
      decoder.DecodeBatch(batch, sent_id, &results);
      for (unsigned i = 0; i < results.size(); ++i) {
        if (results[i].status == FAILED) ++failed;
        WriteKBest(results[i], show_trees, &cout);
      }
      sent_id += batch.size();
      batch.clear();
      if (!more) break;
    }
    if (!SILENT) cerr << "Decoded " << sent_id << " sentences, " << failed << " failed" << endl;
  } catch (const std::exception& e) {
    cerr << "chartdec: " << e.what() << endl;
    return 1;
  }
  return 0;
}
