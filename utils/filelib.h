#ifndef _FILELIB_H_
#define _FILELIB_H_

#include <fstream>
#include <iostream>
#include <string>

#include <boost/shared_ptr.hpp>

#include "errors.h"

bool FileExists(const std::string& file_name);

// reads from standard in if filename is -
// otherwise, reads from a normal file
class ReadFile {
 public:
  ReadFile() {}
  explicit ReadFile(const std::string& filename) {
    Init(filename);
  }
  void Init(const std::string& filename);
  bool is_std() const { return filename_ == "-"; }
  std::istream* stream() { return ps_.get(); }
  std::istream& get() const { return *ps_; }
  const std::string& filename() const { return filename_; }

 private:
  std::string filename_;
  boost::shared_ptr<std::istream> ps_;
};

#endif
