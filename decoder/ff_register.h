#ifndef FF_REGISTER_H
#define FF_REGISTER_H

#include "ff_factory.h"

template <class Impl>
inline void RegisterFF() {
  ff_registry.Register(new FFFactory<Impl>);
}

// registers every feature function of the decoder; later calls do nothing.
// Call it before any decoder is created.
void register_feature_functions();

#endif
