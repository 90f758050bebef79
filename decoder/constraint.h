#ifndef CONSTRAINT_H_
#define CONSTRAINT_H_

#include <iostream>
#include <map>
#include <string>
#include <vector>

// One directive attached to a constraint span.
//  RULE: lhs -> foreign_rhs / native_rhs, usable only on the span
//  LHS:  the span may only be covered by nodes labelled lhs
//  RHS:  only rules whose target side is native_rhs may cover the span
struct ConstraintRule {
  enum Type { RULE, LHS, RHS };

  ConstraintRule() : type(RULE) {}
  static ConstraintRule Rule(const std::string& lhs,
                             const std::string& foreign_rhs,
                             const std::string& native_rhs,
                             const std::vector<double>& features);
  static ConstraintRule Lhs(const std::string& lhs);
  static ConstraintRule Rhs(const std::string& native_rhs);

  Type type;
  std::string lhs;
  std::string native_rhs;
  std::string foreign_rhs;
  std::vector<double> features;
};

struct ConstraintSpan {
  ConstraintSpan() : start(0), end(0), is_hard(false) {}
  ConstraintSpan(int s, int e, bool hard) : start(s), end(e), is_hard(hard) {}
  int start;
  int end;
  bool is_hard;
  std::vector<ConstraintRule> rules;
};

typedef std::map<int, std::vector<ConstraintSpan> > SentenceConstraints;

// Blocks separated by blank lines:
//   <sent_id> <start> <end> hard|soft
//   RULE ||| <lhs> ||| <foreign> ||| <native> ||| <f1 f2 ...>
//   LHS ||| <label>
//   RHS ||| <native>
// throws ConfigurationError on malformed input
void ReadConstraints(std::istream* in, SentenceConstraints* constraints);
void ReadConstraintsFromFile(const std::string& filename, SentenceConstraints* constraints);

#endif
