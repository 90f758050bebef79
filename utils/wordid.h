#ifndef _WORD_ID_H_
#define _WORD_ID_H_

#include <limits>

typedef int WordID;
const int kMAX_WORD_ID = std::numeric_limits<WordID>::max();

#endif
