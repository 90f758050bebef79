#ifndef CHARTDEC_HASH_H
#define CHARTDEC_HASH_H

#include <unordered_map>
#include <unordered_set>

#include <boost/functional/hash.hpp>

#define HASH_MAP std::unordered_map
#define HASH_SET std::unordered_set

#endif
