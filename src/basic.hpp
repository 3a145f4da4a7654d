#ifndef _basic_hpp
#define _basic_hpp

#include <stdlib.h>
#include <stdint.h>
#include <string.h>
#include <string>

#define PROJECT wamcore

namespace PROJECT {

// Storage unit for cells, flag sets and hash map buckets.
typedef uint64_t NativeType;

}

#endif
