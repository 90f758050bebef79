#ifndef _ERRORS_H_
#define _ERRORS_H_

#include <stdexcept>
#include <string>

// bad options, malformed feature function arguments, missing resources.
// Raised while a decoder is being constructed.
struct ConfigurationError : public std::runtime_error {
  explicit ConfigurationError(const std::string& what) : std::runtime_error(what) {}
};

// a per-sentence resource disagrees with the grammar it is combined with
struct LookupInconsistency : public std::runtime_error {
  explicit LookupInconsistency(const std::string& what) : std::runtime_error(what) {}
};

// tail nodes do not line up with the nonterminals of the rule that uses them
struct IndexInconsistency : public std::runtime_error {
  explicit IndexInconsistency(const std::string& what) : std::runtime_error(what) {}
};

#endif
