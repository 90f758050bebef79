#include "verbose.h"

bool SILENT = false;
