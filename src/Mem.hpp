#ifndef _Mem_hpp
#define _Mem_hpp

#include <iostream>
#include <string>
#include <vector>
#include "basic.hpp"
#include "Growing.hpp"
#include "HashMap.hpp"
#include "Cell.hpp"

namespace PROJECT {

//
// Mem. Owns the heap (an append-only array of cells that may be
// patched in place) and the symbol table. Cells are never removed or
// moved; the only in-place writes are the serializer patching a
// placeholder it just allocated and the unifiers binding variables.
//
// Mem also remembers the names of variables so that terms can be
// printed the way they were written.
//
class Mem {
public:
    Mem(size_t capacity = 65536);

    void setVerbosity(int verbosity) { thisVerbosity = verbosity; }
    int getVerbosity() const { return thisVerbosity; }

    inline CellRef push(Cell cell)
    {
	Cell *cellPtr = thisHeap.allocate(1);
	*cellPtr = cell;
	return CellRef(thisHeap.toRelative(cellPtr));
    }

    inline bool isValid(CellRef ref) const
    {
	return thisHeap.isValid(ref.getIndex());
    }

    // The caller guarantees that 'ref' exists.
    inline Cell cellRead(CellRef ref) const
    {
	assert(isValid(ref));
	return *thisHeap.toAbsolute(ref.getIndex());
    }

    inline bool tryCellRead(CellRef ref, Cell &cell) const
    {
	if (!isValid(ref)) {
	    return false;
	}
	cell = *thisHeap.toAbsolute(ref.getIndex());
	return true;
    }

    inline void cellWrite(CellRef ref, Cell cell)
    {
	assert(isValid(ref));
	*thisHeap.toAbsolute(ref.getIndex()) = cell;
    }

    //
    // Dereference. Follows REF cells until reaching an unbound variable
    // (returned as the self pointing REF cell) or a non-REF cell. The
    // address of the final cell is returned and the cell itself is
    // stored in 'cell'.
    //
    inline CellRef resolveRefToRefAndCell(CellRef ref, Cell &cell) const
    {
	cell = cellRead(ref);
	while (cell.getTag() == Cell::REF) {
	    CellRef next = cell.toCellRef();
	    if (next == ref) {
		return ref;
	    }
	    ref = next;
	    cell = cellRead(ref);
	}
	return ref;
    }

    inline Cell resolveRefToCell(CellRef ref) const
    {
	Cell cell;
	resolveRefToRefAndCell(ref, cell);
	return cell;
    }

    // Same as resolveRefToRefAndCell(), but for addresses we cannot
    // trust. Fails on a missing cell (then 'at' is the bad address) or
    // on a REF chain longer than the heap.
    bool tryResolveRef(CellRef ref, CellRef &at, Cell &cell) const;

    // Bind the unbound variable at 'var' to the cell at 'target'.
    void bind(CellRef var, CellRef target);

    inline size_t getHeapSize() const
    {
	return thisHeap.getSize();
    }

    inline CellRef firstCellRef() const
    {
	return CellRef(1);
    }

    // Address the next pushed cell will get.
    inline CellRef topCellRef() const
    {
	return CellRef(1+getHeapSize());
    }

    // ----------------------------------------------------------
    //  Symbols
    // ----------------------------------------------------------

    Sym internSym(const std::string &text);
    Functor internFunctor(const std::string &name, size_t arity);
    bool findSym(const std::string &text, Sym &sym) const;

    inline const std::string & getSymName(Sym sym) const
    {
	assert(sym.getIndex() < thisSymbols.size());
	return thisSymbols[sym.getIndex()];
    }

    inline size_t getNumSyms() const
    {
	return thisSymbols.size();
    }

    // ----------------------------------------------------------
    //  Variables
    // ----------------------------------------------------------

    CellRef pushVar(const std::string &name);
    CellRef pushFreshVar();
    void assignNameToVar(CellRef ref, const std::string &name);
    std::string humanReadableVarName(CellRef ref) const;
    bool findVar(const std::string &name, CellRef &ref) const;
    bool cellFromVarName(const std::string &name, Cell &cell) const;

    // ----------------------------------------------------------
    //  Printing
    // ----------------------------------------------------------

    void print(std::ostream &out, CellRef ref) const;
    std::string toString(CellRef ref) const;

    void printCell(std::ostream &out, Cell cell) const;
    std::string cellToString(Cell cell) const;

    void printRaw(std::ostream &out) const;
    void printRaw(std::ostream &out, CellRef from, CellRef to) const;
    std::string toRawString() const;
    std::string toRawString(CellRef from, CellRef to) const;

    void printStatus(std::ostream &out) const;

private:
    void printTag(std::ostream &out, Cell cell) const;
    void printFunctor(std::ostream &out, Functor f) const;

    GrowingAllocator<Cell> thisHeap;
    std::vector<std::string> thisSymbols;
    HashMap<Sym, CellRef> thisVarsByName;
    HashMap<CellRef, Sym> thisNamesByVar;
    int thisVerbosity;
};

}

#endif
