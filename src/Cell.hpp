#ifndef _Cell_hpp
#define _Cell_hpp

#include <iostream>
#include <assert.h>
#include "basic.hpp"
#include "HashMap.hpp"

namespace PROJECT {

//
// Cells are the values that live on the heap. A term is a graph of
// cells, built in the usual WAM fashion:
//
//   REF  <addr>    Variable. Points at itself if unbound, otherwise
//                  at the cell it is bound to.
//   RCD  <addr>    Record (compound term.) Points at a SIG cell that is
//                  immediately followed by 'arity' argument cells.
//                  For example, [1] RCD:2 [2] SIG:f/2 [3] <Arg1> [4] <Arg2>
//   INT  <int32>   Integer constant.
//   SYM  <sym>     Atom.
//   SIG  <f/n>     Functor marker. Only ever the target of a RCD cell.
//   LST  <addr>    Cons pair. Points at the car; the cdr is the
//                  next cell.
//   NIL            The empty list.
//
// Everything is packed into one 64-bit word with the tag in the lower
// three bits:
//
//   <61 bits>     [HeapIndex]     000   REF
//   <61 bits>     [HeapIndex]     001   RCD
//   <32 bits>     [int32]         010   INT
//   <61 bits>     [SymIndex]      011   SYM
//   <53 bits>     [SymIndex]      [8 bits arity] 100   SIG
//   <61 bits>     [HeapIndex]     101   LST
//   <61 bits>     [-------]       110   NIL
//
// Heap index 0 is never a valid cell; it is used as the empty reference.
//

class Index {
public:
    Index(NativeType index) { thisIndex = index; }

    inline NativeType getIndex() const { return thisIndex; }
    inline void setIndex(NativeType index) { thisIndex = index; }

    bool operator == (const Index &other) const {
	return getIndex() == other.getIndex();
    }

    bool operator != (const Index &other) const {
	return getIndex() != other.getIndex();
    }

    bool operator < (const Index &other) const {
	return getIndex() < other.getIndex();
    }

    bool operator <= (const Index &other) const {
	return getIndex() <= other.getIndex();
    }

    bool operator > (const Index &other) const {
	return getIndex() > other.getIndex();
    }

    bool operator >= (const Index &other) const {
	return getIndex() >= other.getIndex();
    }

private:
   NativeType thisIndex;
};

/*
 * CellRef. A typed index into the heap. Arithmetic is used to reach
 * the arguments of a record and the cdr of a cons pair. Nothing here
 * checks bounds; that is up to Mem.
 */
class CellRef : public Index {
public:
    inline CellRef() : Index(0) { }
    inline CellRef(NativeType index) : Index(index) { }

    inline bool isEmpty() const { return getIndex() == 0; }

    inline CellRef operator + (size_t val) const { return CellRef(getIndex()+val); }

    friend std::ostream & operator << (std::ostream &out, const CellRef &ref)
    {
	return out << ref.getIndex();
    }
};

template<> struct HashOf<CellRef> {
    static uint32_t value(const CellRef &ref)
    {
	return hashWord(ref.getIndex());
    }
};

/*
 * Sym. An interned string. Only the owning Mem can turn it back
 * into text.
 */
class Sym : public Index {
public:
    inline Sym() : Index(0) { }
    inline explicit Sym(NativeType index) : Index(index) { }

    friend std::ostream & operator << (std::ostream &out, const Sym &sym)
    {
	return out << "#" << sym.getIndex();
    }
};

template<> struct HashOf<Sym> {
    static uint32_t value(const Sym &sym)
    {
	return hashWord(sym.getIndex());
    }
};

class Functor {
public:
    static const size_t MAX_ARITY = 255;

    inline Functor() : thisSym(), thisArity(0) { }
    inline Functor(Sym sym, size_t arity)
	: thisSym(sym), thisArity(static_cast<uint8_t>(arity))
    {
	assert(arity <= MAX_ARITY);
    }

    inline Sym getSym() const { return thisSym; }
    inline size_t getArity() const { return thisArity; }

    inline bool operator == (const Functor &other) const
    { return thisSym == other.thisSym && thisArity == other.thisArity; }
    inline bool operator != (const Functor &other) const
    { return !(*this == other); }

private:
    Sym thisSym;
    uint8_t thisArity;
};

class Cell {
public:
    enum Tag { REF = 0, RCD = 1, INT = 2, SYM = 3, SIG = 4, LST = 5, NIL = 6 };

    inline Cell() : thisCell(0) { }
    inline Cell(Tag tag, CellRef ref)
	: thisCell(((NativeType)tag) | (ref.getIndex() << 3)) { }
    explicit inline Cell(NativeType rawValue) : thisCell(rawValue) { }

    static inline Cell ref(CellRef ref) { return Cell(REF, ref); }
    static inline Cell rcd(CellRef ref) { return Cell(RCD, ref); }
    static inline Cell lst(CellRef ref) { return Cell(LST, ref); }
    static inline Cell nil() { return Cell((NativeType)NIL); }

    static inline Cell int32(int32_t value)
    {
	NativeType bits = static_cast<uint32_t>(value);
	return Cell(((NativeType)INT) | (bits << 3));
    }

    static inline Cell sym(Sym sym)
    {
	return Cell(((NativeType)SYM) | (sym.getIndex() << 3));
    }

    static inline Cell sig(Functor f)
    {
	return Cell(((NativeType)SIG) | ((NativeType)f.getArity() << 3)
		    | (f.getSym().getIndex() << 11));
    }

    inline bool isNull() const { return thisCell == 0; }

    inline Tag getTag() const { return (Tag)(thisCell & 0x7); }

    inline NativeType getValue() const { return thisCell >> 3; }

    // Valid for REF, RCD and LST
    inline CellRef toCellRef() const { return CellRef(getValue()); }
    // Valid for INT
    inline int32_t toInt32() const
    { return static_cast<int32_t>(static_cast<uint32_t>(getValue())); }
    // Valid for SYM
    inline Sym toSym() const { return Sym(getValue()); }
    // Valid for SIG
    inline Functor toFunctor() const
    { return Functor(Sym(thisCell >> 11), (size_t)((thisCell >> 3) & 0xff)); }

    inline bool operator == (const Cell &other) const { return thisCell == other.thisCell; }
    inline bool operator != (const Cell &other) const { return thisCell != other.thisCell; }

private:
    NativeType thisCell;
};

}

#endif
