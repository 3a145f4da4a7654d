#ifndef _Growing_hpp
#define _Growing_hpp

#include <assert.h>
#include <memory.h>
#include "basic.hpp"

namespace PROJECT {

//
// GrowingAllocator. A contiguous array of T that doubles its capacity
// when full. Elements are addressed by relative index, where index 0
// is reserved as the NULL index and the first element lives at 1.
// Relative indices stay valid when the array is moved by growing,
// absolute pointers do not.
//
// T must be trivially copyable; growing copies the elements with memcpy.
//
template<typename T> class GrowingAllocator {
public:
    typedef size_t size_type;
    typedef T * pointer;
    typedef const T * const_pointer;

    GrowingAllocator(size_t initialCapacity = 4096)
    {
	if (initialCapacity < 2) {
	    initialCapacity = 2;
	}
	thisCapacity = initialCapacity;
	thisSize = 0;
	thisBase = new T [thisCapacity];
	thisData = &thisBase[1];
    }

    // Copying transfers the storage (the source is left empty.)
    GrowingAllocator(const GrowingAllocator &other)
	: thisBase(NULL)
    {
	moveFrom(const_cast<GrowingAllocator &>(other));
    }

    ~GrowingAllocator()
    {
	delete [] thisBase;
    }

    void operator = (const GrowingAllocator &other)
    {
	moveFrom(const_cast<GrowingAllocator &>(other));
    }

    inline size_t getNum(size_t bytes)
    {
	return (bytes + sizeof(T) - 1) / sizeof(T);
    }

    inline pointer allocate(size_type num)
    {
	ensureCapacity(num);
	T *r = &thisData[thisSize];
	thisSize += num;
	return r;
    }

    inline void trim(size_type num)
    {
	assert(num <= thisSize);
	thisSize = num;
    }

    inline size_t toRelative(const T *p) const
    {
	if (p == NULL) {
	    return 0;
	} else {
	    return static_cast<size_t>(p - thisBase);
	}
    }

    inline T * toAbsolute(size_t rel) const
    {
	if (rel == 0) {
	    return NULL;
	} else {
	    return &thisBase[rel];
	}
    }

    inline bool isValid(size_t rel) const
    {
	return rel >= 1 && rel <= thisSize;
    }

    inline void ensureCapacity(size_t num)
    {
	if (thisSize + num > thisCapacity - 1) {
	    grow(num);
	}
    }

    inline size_t getSize() const
    {
	return thisSize;
    }

    inline size_t getCapacity() const
    {
	return thisCapacity;
    }

    void grow(size_t num)
    {
	while (thisSize + num > thisCapacity-1) {
	    thisCapacity *= 2;
	}
	T *newBase = new T [thisCapacity];
	T *newData = &newBase[1];
	memcpy(newData, thisData, sizeof(T)*thisSize);
	delete [] thisBase;
	thisBase = newBase;
	thisData = newData;
    }

private:
    void moveFrom(GrowingAllocator &other)
    {
	if (&other == this) {
	    return;
	}
	if (thisBase != NULL) {
	    delete [] thisBase;
	}
	thisCapacity = other.thisCapacity;
	thisSize = other.thisSize;
	thisBase = other.thisBase;
	thisData = other.thisData;
	other.thisCapacity = 0;
	other.thisSize = 0;
	other.thisBase = NULL;
	other.thisData = NULL;
    }

    size_t thisCapacity;
    size_t thisSize;
    T *thisBase;
    T *thisData;
};

}
#endif
