#ifndef _Stack_hpp
#define _Stack_hpp

#include "Growing.hpp"

namespace PROJECT {

//
// Stack. Used as the explicit work stack wherever we want to avoid
// native recursion (serializing, deserializing, parsing, printing and
// unifying terms.) Only for trivially copyable elements.
//
template<typename T> class Stack : public GrowingAllocator<T>
{
public:
    Stack(size_t initialCapacity = 1024)
        : GrowingAllocator<T>(initialCapacity) { }

    void push(const T &el)
    {
	T *t = GrowingAllocator<T>::allocate(1);
	*t = el;
    }

    T pop()
    {
	size_t n = GrowingAllocator<T>::getSize();
	assert(n > 0);
	T t = *GrowingAllocator<T>::toAbsolute(n);
	GrowingAllocator<T>::trim(n-1);
	return t;
    }

    T & peek(size_t rel = 0)
    {
	size_t n = GrowingAllocator<T>::getSize();
	T &t = *GrowingAllocator<T>::toAbsolute(n-rel);
	return t;
    }

    // Element 'index' counted from the bottom of the stack (0 is bottom.)
    const T & at(size_t index) const
    {
	assert(index < GrowingAllocator<T>::getSize());
	return *GrowingAllocator<T>::toAbsolute(index+1);
    }

    void clear()
    {
	GrowingAllocator<T>::trim(0);
    }

    size_t getSize() const
    {
	size_t n = GrowingAllocator<T>::getSize();
	return n;
    }

    bool isEmpty() const
    {
	return GrowingAllocator<T>::getSize() == 0;
    }
};

}

#endif
