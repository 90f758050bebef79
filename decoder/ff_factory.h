#ifndef _FF_FACTORY_H_
#define _FF_FACTORY_H_

#include <iostream>
#include <string>
#include <map>

#include <boost/shared_ptr.hpp>

#include "errors.h"

class FeatureFunction;

class UntypedFactory {
 public:
  virtual ~UntypedFactory();
  virtual std::string usage(bool params,bool verbose) const = 0;
};

template <class FF>
class FactoryBase : public UntypedFactory {
 public:
  typedef FF F;
  typedef boost::shared_ptr<F> FP;

  virtual FP Create(std::string param) const = 0;
};

/* see chartdec_ff.cc for example usage: this create concrete factories to be registered */
template<class FF>
class FFFactory : public FactoryBase<FeatureFunction> {
 public:
  FP Create(std::string param) const {
    FF *ret=new FF(param);
    return FP(ret);
  }
  virtual std::string usage(bool params,bool verbose) const {
    return FF::usage(params,verbose);
  }
};

// registration happens once, at start up, before any decoding thread runs;
// afterwards the registry is only read
struct UntypedFactoryRegistry {
  std::string usage(std::string const& ffname,bool params=true,bool verbose=true) const;
  bool have(std::string const& ffname) const;
  void DisplayList(std::ostream& out=std::cerr) const;
  // throws ConfigurationError if ffname is already registered
  void Register(const std::string& ffname, UntypedFactory* factory);
  // registered under the name given by factory->usage(false,false)
  void Register(UntypedFactory* factory);
  void clear();
 protected:
  typedef boost::shared_ptr<UntypedFactory> FactoryP;
  typedef std::map<std::string, FactoryP > Factmap;
  Factmap reg_;
};

template <class Feat>
struct FactoryRegistry : public UntypedFactoryRegistry {
  typedef Feat F;
  typedef boost::shared_ptr<F> FP;
  typedef FactoryBase<F> FB;

  // throws ConfigurationError for unknown names and bad parameters
  FP Create(const std::string& ffname, std::string param) const {
    Factmap::const_iterator it = reg_.find(ffname);
    if (it == reg_.end())
      throw ConfigurationError("I don't know how to create feature "+ffname);
    FP res = dynamic_cast<FB const&>(*it->second).Create(param);
    res->name_ = ffname;
    return res;
  }
};

typedef FactoryRegistry<FeatureFunction> FFRegistry;

extern FFRegistry ff_registry;
inline FFRegistry& global_ff_registry() { return ff_registry; }

void ff_usage(std::string const& name,std::ostream& out=std::cerr);

#endif
