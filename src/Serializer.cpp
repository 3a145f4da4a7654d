#include "Serializer.hpp"

namespace PROJECT {

Serializer::Serializer(Mem &mem)
    : thisMem(mem), thisPending(256)
{
}

CellRef Serializer::serialize(const Term &term)
{
    thisPending.clear();
    CellRef root = serializeFlat(term);
    serializeRemainder();

    if (thisMem.getVerbosity() > 1) {
	std::cout << "Serializer::serialize(): " << term << " at " << root
		  << ": " << thisMem.toRawString(root, thisMem.topCellRef())
		  << "\n";
    }

    return root;
}

// Push exactly one cell for 'term'. Compound terms get a placeholder
// and are queued.
CellRef Serializer::serializeFlat(const Term &term)
{
    switch (term.getKind()) {
    case Term::INT:
	return thisMem.push(Cell::int32(term.getInt()));
    case Term::SYM:
	return thisMem.push(Cell::sym(thisMem.internSym(term.getName())));
    case Term::VAR:
	if (term.isAnonymous()) {
	    return thisMem.pushFreshVar();
	}
	return thisMem.pushVar(term.getName());
    case Term::NIL:
	return thisMem.push(Cell::nil());
    case Term::RECORD: {
	CellRef placeholder = thisMem.push(Cell::rcd(CellRef()));
	Pending p = { placeholder, &term };
	thisPending.push(p);
	return placeholder;
    }
    case Term::CONS: {
	CellRef placeholder = thisMem.push(Cell::lst(CellRef()));
	Pending p = { placeholder, &term };
	thisPending.push(p);
	return placeholder;
    }
    }
    assert(!"Unknown term kind");
    return CellRef();
}

//
// Entries are processed in the order they were queued; the ones queued
// while processing go after them, so the queue is drained one level of
// the term at a time.
//
void Serializer::serializeRemainder()
{
    for (size_t i = 0; i < thisPending.getSize(); i++) {
	Pending p = thisPending.at(i);
	const Term &term = *p.term;

	if (term.getKind() == Term::RECORD) {
	    Functor f = thisMem.internFunctor(term.getName(), term.getArity());
	    CellRef sigRef = thisMem.push(Cell::sig(f));
	    for (size_t j = 0; j < term.getArity(); j++) {
		serializeFlat(term.getArg(j));
	    }
	    thisMem.cellWrite(p.placeholder, Cell::rcd(sigRef));
	} else {
	    assert(term.getKind() == Term::CONS);
	    CellRef car = serializeFlat(term.getCar());
	    serializeFlat(term.getCdr());
	    thisMem.cellWrite(p.placeholder, Cell::lst(car));
	}
    }
    thisPending.clear();
}

CellRef serialize(const Term &term, Mem &mem)
{
    Serializer serializer(mem);
    return serializer.serialize(term);
}

}
