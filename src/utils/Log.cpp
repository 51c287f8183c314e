#include "utils/Log.h"

bool Log::Verbose = false;
