#include <sstream>
#include "Mem.hpp"
#include "Stack.hpp"

namespace PROJECT {

Mem::Mem(size_t capacity)
    : thisHeap(capacity),
      thisVerbosity(0)
{
}

bool Mem::tryResolveRef(CellRef ref, CellRef &at, Cell &cell) const
{
    size_t steps = 0;
    size_t maxSteps = getHeapSize();
    at = ref;
    if (!tryCellRead(at, cell)) {
	return false;
    }
    while (cell.getTag() == Cell::REF) {
	CellRef next = cell.toCellRef();
	if (next == at) {
	    return true;
	}
	if (++steps > maxSteps) {
	    return false;
	}
	at = next;
	if (!tryCellRead(at, cell)) {
	    return false;
	}
    }
    return true;
}

void Mem::bind(CellRef var, CellRef target)
{
    if (thisVerbosity > 1) {
	std::cout << "Mem::bind(): " << humanReadableVarName(var) << "@"
		  << var << " := " << toString(target) << "\n";
    }
    cellWrite(var, Cell::ref(target));
}

Sym Mem::internSym(const std::string &text)
{
    Sym sym;
    if (findSym(text, sym)) {
	return sym;
    }
    thisSymbols.push_back(text);
    return Sym(thisSymbols.size() - 1);
}

bool Mem::findSym(const std::string &text, Sym &sym) const
{
    for (size_t i = 0; i < thisSymbols.size(); i++) {
	if (thisSymbols[i] == text) {
	    sym = Sym(i);
	    return true;
	}
    }
    return false;
}

Functor Mem::internFunctor(const std::string &name, size_t arity)
{
    return Functor(internSym(name), arity);
}

CellRef Mem::pushVar(const std::string &name)
{
    CellRef existing;
    if (findVar(name, existing)) {
	return push(Cell::ref(existing));
    }
    CellRef ref = pushFreshVar();
    assignNameToVar(ref, name);
    return ref;
}

CellRef Mem::pushFreshVar()
{
    CellRef ref = topCellRef();
    push(Cell::ref(ref));
    return ref;
}

void Mem::assignNameToVar(CellRef ref, const std::string &name)
{
    Sym sym = internSym(name);
    thisNamesByVar.put(ref, sym);
    thisVarsByName.put(sym, ref);
}

std::string Mem::humanReadableVarName(CellRef ref) const
{
    const Sym *sym = thisNamesByVar.get(ref);
    if (sym != NULL) {
	return getSymName(*sym);
    }

    // _<addr>, unless some other variable was given that name; then
    // _<addr>_1, _<addr>_2, ...
    std::stringstream ss;
    ss << "_" << ref.getIndex();
    std::string name = ss.str();
    CellRef other;
    for (size_t n = 1; findVar(name, other); n++) {
	std::stringstream alt;
	alt << "_" << ref.getIndex() << "_" << n;
	name = alt.str();
    }
    return name;
}

bool Mem::findVar(const std::string &name, CellRef &ref) const
{
    Sym sym;
    if (!findSym(name, sym)) {
	return false;
    }
    const CellRef *found = thisVarsByName.get(sym);
    if (found == NULL) {
	return false;
    }
    ref = *found;
    return true;
}

bool Mem::cellFromVarName(const std::string &name, Cell &cell) const
{
    CellRef ref;
    if (!findVar(name, ref)) {
	return false;
    }
    CellRef at;
    return tryResolveRef(ref, at, cell);
}

//
// Printing of terms uses an explicit stack of print items. Text items
// are emitted as is, VALUE items print the term at the address and
// TAIL items continue a list whose previous cons cell has been printed.
//
namespace {

enum PrintKind { PRINT_VALUE, PRINT_TAIL, PRINT_TEXT };

struct PrintItem {
    PrintKind kind;
    CellRef ref;
    const char *text;
};

inline PrintItem printValue(CellRef ref)
{
    PrintItem item = { PRINT_VALUE, ref, NULL };
    return item;
}

inline PrintItem printTail(CellRef ref)
{
    PrintItem item = { PRINT_TAIL, ref, NULL };
    return item;
}

inline PrintItem printText(const char *text)
{
    PrintItem item = { PRINT_TEXT, CellRef(), text };
    return item;
}

}

void Mem::printFunctor(std::ostream &out, Functor f) const
{
    out << getSymName(f.getSym()) << "/" << f.getArity();
}

void Mem::print(std::ostream &out, CellRef ref) const
{
    Stack<PrintItem> stack(64);
    stack.push(printValue(ref));

    while (!stack.isEmpty()) {
	PrintItem item = stack.pop();

	if (item.kind == PRINT_TEXT) {
	    out << item.text;
	    continue;
	}

	CellRef at;
	Cell cell;
	if (!tryResolveRef(item.ref, at, cell)) {
	    out << "$bad(" << at << ")";
	    continue;
	}

	if (item.kind == PRINT_TAIL) {
	    if (cell.getTag() == Cell::NIL) {
		out << "]";
	    } else if (cell.getTag() == Cell::LST) {
		out << ", ";
		CellRef car = cell.toCellRef();
		stack.push(printTail(car + 1));
		stack.push(printValue(car));
	    } else {
		out << " | ";
		stack.push(printText("]"));
		stack.push(printValue(at));
	    }
	    continue;
	}

	switch (cell.getTag()) {
	case Cell::REF:
	    out << humanReadableVarName(at);
	    break;
	case Cell::INT:
	    out << cell.toInt32();
	    break;
	case Cell::SYM:
	    out << getSymName(cell.toSym());
	    break;
	case Cell::NIL:
	    out << "[]";
	    break;
	case Cell::SIG:
	    out << "$sig(";
	    printFunctor(out, cell.toFunctor());
	    out << ")";
	    break;
	case Cell::RCD: {
	    CellRef sigRef = cell.toCellRef();
	    Cell sig;
	    if (!tryCellRead(sigRef, sig) || sig.getTag() != Cell::SIG) {
		out << "$bad(" << sigRef << ")";
		break;
	    }
	    Functor f = sig.toFunctor();
	    out << getSymName(f.getSym()) << "(";
	    stack.push(printText(")"));
	    for (size_t i = f.getArity(); i > 0; i--) {
		stack.push(printValue(sigRef + i));
		if (i > 1) {
		    stack.push(printText(", "));
		}
	    }
	    break;
	}
	case Cell::LST: {
	    CellRef car = cell.toCellRef();
	    out << "[";
	    stack.push(printTail(car + 1));
	    stack.push(printValue(car));
	    break;
	}
	}
    }
}

std::string Mem::toString(CellRef ref) const
{
    std::stringstream ss;
    print(ss, ref);
    return ss.str();
}

void Mem::printTag(std::ostream &out, Cell cell) const
{
    switch (cell.getTag()) {
    case Cell::REF: out << "REF"; break;
    case Cell::RCD: out << "RCD"; break;
    case Cell::INT: out << "INT"; break;
    case Cell::SYM: out << "SYM"; break;
    case Cell::SIG: out << "SIG"; break;
    case Cell::LST: out << "LST"; break;
    case Cell::NIL: out << "NIL"; break;
    }
}

void Mem::printCell(std::ostream &out, Cell cell) const
{
    switch (cell.getTag()) {
    case Cell::REF:
	out << "Ref(" << humanReadableVarName(cell.toCellRef())
	    << "@" << cell.toCellRef() << ")";
	break;
    case Cell::RCD: out << "Rcd(" << cell.toCellRef() << ")"; break;
    case Cell::INT: out << "Int(" << cell.toInt32() << ")"; break;
    case Cell::SYM: out << "Sym(" << getSymName(cell.toSym()) << ")"; break;
    case Cell::SIG:
	out << "Sig(";
	printFunctor(out, cell.toFunctor());
	out << ")";
	break;
    case Cell::LST: out << "Lst(" << cell.toCellRef() << ")"; break;
    case Cell::NIL: out << "Nil"; break;
    }
}

std::string Mem::cellToString(Cell cell) const
{
    std::stringstream ss;
    printCell(ss, cell);
    return ss.str();
}

void Mem::printRaw(std::ostream &out) const
{
    printRaw(out, firstCellRef(), topCellRef());
}

void Mem::printRaw(std::ostream &out, CellRef from, CellRef to) const
{
    out << "[";
    for (CellRef i = from; i < to; i = i + 1) {
	if (i != from) out << ", ";
	Cell cell = cellRead(i);
	printTag(out, cell);
	switch (cell.getTag()) {
	case Cell::REF:
	case Cell::RCD:
	case Cell::LST:
	    out << ":" << cell.toCellRef();
	    break;
	case Cell::INT:
	    out << ":" << cell.toInt32();
	    break;
	case Cell::SYM:
	    out << ":" << getSymName(cell.toSym());
	    break;
	case Cell::SIG:
	    out << ":";
	    printFunctor(out, cell.toFunctor());
	    break;
	case Cell::NIL:
	    break;
	}
    }
    out << "]";
}

std::string Mem::toRawString() const
{
    return toRawString(firstCellRef(), topCellRef());
}

std::string Mem::toRawString(CellRef from, CellRef to) const
{
    std::stringstream ss;
    printRaw(ss, from, to);
    return ss.str();
}

void Mem::printStatus(std::ostream &out) const
{
    out << "Mem{HeapSize=" << getHeapSize()
	<< ",HeapCapacity=" << thisHeap.getCapacity()
	<< ",NumSyms=" << getNumSyms()
	<< ",NumVarNames=" << thisNamesByVar.numEntries() << "}\n";
}

}
