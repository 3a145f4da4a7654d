#ifndef _Flags_hpp
#define _Flags_hpp

#include "basic.hpp"

namespace PROJECT {

//
// Flags. A set of enum values stored as a bit mask. The parser uses
// this to track which tokens it is willing to accept next.
//
template<typename EnumType> class Flags {
private:
    typedef EnumType T;
    typedef NativeType StorageType;

public:
    Flags() { thisValue = 0; }
    Flags(const Flags<T> &other) { thisValue = other.thisValue; }
    Flags(T flag) { thisValue = (StorageType)1 << flag; }

    inline bool operator == (const Flags<T> &other) const {
	return thisValue == other.thisValue;
    }

    inline bool operator != (const Flags<T> &other) const {
	return thisValue != other.thisValue;
    }

    inline bool operator & (T flag) const {
	return (thisValue & ((StorageType)1 << flag)) != 0;
    }

    inline Flags<T> & operator = (const Flags<T> &rhs) {
	thisValue = rhs.thisValue;
	return *this;
    }

    inline Flags<T> operator | (const Flags<T> &other) const {
	return Flags<T>(thisValue | other.thisValue);
    }

    inline Flags<T> operator | (T flag) const {
	return Flags<T>(thisValue | ((StorageType)1 << flag));
    }

private:
    explicit inline Flags(StorageType value) : thisValue(value) { }

    StorageType thisValue;
};

#define DeclareFlags(EnumName, ...)		                    \
    enum EnumName { __VA_ARGS__ };                                  \
    static inline Flags<EnumName> operator | (EnumName a, EnumName b) \
    { return Flags<EnumName>(a) | b; }

}

#endif
