#include "filelib.h"

#include <sys/stat.h>

using namespace std;

namespace {
struct null_deleter {
  void operator()(void*) const {}
};
}

bool FileExists(const std::string& fn) {
  struct stat info;
  return (stat(fn.c_str(), &info) == 0);
}

void ReadFile::Init(const std::string& filename) {
  filename_ = filename;
  if (is_std()) {
    ps_.reset(&std::cin, null_deleter());
    return;
  }
  if (!FileExists(filename))
    throw ConfigurationError("File " + filename + " - couldn't read nonexistent file.");
  ps_.reset(new std::ifstream(filename.c_str()));
  if (!*ps_)
    throw ConfigurationError("File " + filename + " - open for reading failed.");
}
