#define CHRONICLE_IMPLEMENTATION
#include <chronicle/chronicle.hpp>
