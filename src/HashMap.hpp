#ifndef _HashMap_hpp
#define _HashMap_hpp

#include <iostream>
#include <assert.h>
#include "basic.hpp"
#include "Growing.hpp"

namespace PROJECT {

template<typename _K> struct HashOf {
    static uint32_t value(const _K &other);
};

// Fibonacci hashing (Knuth's multiplicative method) on the low 32 bits.
inline uint32_t hashWord(uint64_t w)
{
    w ^= (w >> 32);
    return static_cast<uint32_t>((w * 0x9e3779b97f4a7c15ULL) >> 32);
}

template<> struct HashOf<int32_t> {
    static uint32_t value(const int32_t &k) { return hashWord(static_cast<uint32_t>(k)); }
};

//
// HashMapEntry. Entries live in the allocator of the owning map and
// are chained by relative index (0 terminates the chain.) Keys and
// values must be trivially copyable.
//
template<typename _K, typename _V> class HashMapEntry {
public:
    typedef _K key_type;
    typedef _V value_type;

    void init(const _K &k)
    {
	thisRest = 0;
	thisKey = k;
	thisValue = _V();
    }

    void init(const _K &k, const _V &v)
    {
	thisRest = 0;
	thisKey = k;
	thisValue = v;
    }

    const _K & getKey() const {
	return thisKey;
    }

    const _V & getValue() const {
	return thisValue;
    }

    _V & getValueRef() {
	return thisValue;
    }

    void setValue(const _V &value) {
	thisValue = value;
    }

    NativeType getRest() const {
	return thisRest;
    }

    void setRest(NativeType rest) {
	thisRest = rest;
    }

private:
    NativeType thisRest;
    _K thisKey;
    _V thisValue;
};

template<typename _K, typename _V> class HashMap;

template<typename _K, typename _V> class HashMapIterator
{
public:
    typedef HashMapEntry<_K, _V> Entry;

    const Entry & operator * () const { return *thisMap->getEntry(thisCurrent); }
    const Entry * operator -> () const { return thisMap->getEntry(thisCurrent); }

    HashMapIterator & operator ++ ()
    { advance(); return *this; }

    friend bool operator == (const HashMapIterator &a, const HashMapIterator &b)
    {
	return a.thisCurrent == b.thisCurrent;
    }

    friend bool operator != (const HashMapIterator &a, const HashMapIterator &b)
    {
	return a.thisCurrent != b.thisCurrent;
    }

private:
    HashMapIterator(const HashMap<_K, _V> *map, bool atEnd)
	: thisMap(map), thisBucket(0), thisCurrent(0)
    {
	if (!atEnd) {
	    thisCurrent = map->getBucket(0);
	    skipEmpty();
	}
    }

    void skipEmpty()
    {
	while (thisCurrent == 0 && thisBucket + 1 < thisMap->thisNumBuckets) {
	    thisBucket++;
	    thisCurrent = thisMap->getBucket(thisBucket);
	}
    }

    void advance()
    {
	if (thisCurrent == 0) {
	    return;
	}
	thisCurrent = thisMap->getEntry(thisCurrent)->getRest();
	skipEmpty();
    }

    friend class HashMap<_K, _V>;

    const HashMap<_K, _V> *thisMap;
    size_t thisBucket;
    NativeType thisCurrent;
};

//
// HashMap. Separate chaining over a single GrowingAllocator. Buckets
// and entries are referred to by relative index, so nothing needs
// fixing up when the allocator grows. Entries are never freed
// individually; a rehash leaves the old chains behind.
//
template<typename _K, typename _V> class HashMap {
public:
    typedef HashMapEntry<_K,_V> _E;
    typedef _K key_type;
    typedef _V value_type;
    typedef HashMapIterator<_K, _V> iterator;

    friend class HashMapIterator<_K, _V>;

    HashMap(size_t initialCapacity = 17)
	: thisAllocator(initialCapacity*4 + 16)
    {
	thisNumEntries = 0;
	thisNumCollisions = 0;
	thisNumRehash = 0;
	allocateBuckets(initialCapacity | 1);
    }

    bool put(const _K &k, const _V &v)
    {
	size_t before = thisNumEntries;
	NativeType e = findRef(k, true);
	getEntry(e)->setValue(v);
	if (thisNumEntries > thisNumBuckets / 2) {
	    rehash(thisNumBuckets*2+1);
	}
	return before != thisNumEntries;
    }

    const _V * get(const _K &k) const
    {
	NativeType e = const_cast<HashMap<_K,_V> *>(this)->findRef(k, false);
	if (e == 0) {
	    return NULL;
	}
	return &getEntry(e)->getValue();
    }

    bool contains(const _K &k) const
    {
	return get(k) != NULL;
    }

    void rehash(size_t newNumBuckets)
    {
	++thisNumRehash;

	NativeType oldBuckets = thisBuckets;
	size_t oldNumBuckets = thisNumBuckets;

	allocateBuckets(newNumBuckets);
	thisNumEntries = 0;

	for (size_t i = 0; i < oldNumBuckets; i++) {
	    NativeType e = *thisAllocator.toAbsolute(oldBuckets + i);
	    while (e != 0) {
		_K key = getEntry(e)->getKey();
		_V value = getEntry(e)->getValue();
		NativeType next = getEntry(e)->getRest();
		NativeType ne = findRef(key, true);
		getEntry(ne)->setValue(value);
		e = next;
	    }
	}
    }

    size_t numRehash() const {
	return thisNumRehash;
    }

    size_t numCollisions() const {
	return thisNumCollisions;
    }

    size_t numEntries() const {
	return thisNumEntries;
    }

    size_t numBuckets() const {
	return thisNumBuckets;
    }

    iterator begin() const {
	return iterator(this, false);
    }

    iterator end() const {
	return iterator(this, true);
    }

    friend std::ostream & operator << (std::ostream &out, const HashMap<_K, _V> &map)
    {
	map.print(out);
	return out;
    }

    void print(std::ostream &out) const
    {
	out << "[";
	bool first = true;
	for (iterator it = begin(); it != end(); ++it) {
	    if (!first) out << ", ";
	    out << it->getKey() << ":" << it->getValue();
	    first = false;
	}
	out << "]";
    }

private:
    void allocateBuckets(size_t numBuckets)
    {
	NativeType *buckets = thisAllocator.allocate(numBuckets);
	thisBuckets = thisAllocator.toRelative(buckets);
	thisNumBuckets = numBuckets;
	for (size_t i = 0; i < thisNumBuckets; i++) {
	    buckets[i] = 0;
	}
    }

    NativeType getBucket(size_t bucketIndex) const
    {
	return *thisAllocator.toAbsolute(thisBuckets + bucketIndex);
    }

    void setBucket(size_t bucketIndex, NativeType e)
    {
	*thisAllocator.toAbsolute(thisBuckets + bucketIndex) = e;
    }

    _E * getEntry(NativeType rel) const
    {
	return reinterpret_cast<_E *>(thisAllocator.toAbsolute(rel));
    }

    NativeType findRef(const _K &k, bool doNew)
    {
	size_t index = HashOf<_K>::value(k) % thisNumBuckets;
	NativeType e = getBucket(index);
	NativeType pe = 0;

	while (e != 0) {
	    if (getEntry(e)->getKey() == k) {
		return e;
	    }
	    pe = e;
	    e = getEntry(e)->getRest();
	}
	if (!doNew) {
	    return 0;
	}
	NativeType ne = newEntry(k);
	if (pe != 0) {
	    thisNumCollisions++;
	    getEntry(pe)->setRest(ne);
	} else {
	    setBucket(index, ne);
	}
	thisNumEntries++;
	return ne;
    }

    NativeType newEntry(const _K &key)
    {
	NativeType *p = thisAllocator.allocate(thisAllocator.getNum(sizeof(_E)));
	NativeType rel = thisAllocator.toRelative(p);
	getEntry(rel)->init(key);
	return rel;
    }

    GrowingAllocator<NativeType> thisAllocator;
    size_t thisNumBuckets;
    NativeType thisBuckets;
    size_t thisNumEntries;
    size_t thisNumCollisions;
    size_t thisNumRehash;
};

}

#endif
