#include <iostream>
#include "Unify.hpp"

namespace PROJECT {

bool UnifierBase::readSig(CellRef rcdRef, Cell rcd, Functor &f)
{
    Cell sig;
    if (!thisMem.tryCellRead(rcd.toCellRef(), sig) ||
	sig.getTag() != Cell::SIG) {
	std::cerr << "Warning: RCD at " << rcdRef << " points at "
		  << rcd.toCellRef() << " which is not a SIG\n";
	return false;
    }
    f = sig.toFunctor();
    return true;
}

UnifierBase::Match UnifierBase::match(CellRef a, CellRef b,
				      CellRef &argsA, CellRef &argsB,
				      size_t &numArgs)
{
    Cell ca, cb;
    a = thisMem.resolveRefToRefAndCell(a, ca);
    b = thisMem.resolveRefToRefAndCell(b, cb);

    if (a == b) {
	return MATCH_DONE;
    }

    bool isRefA = ca.getTag() == Cell::REF;
    bool isRefB = cb.getTag() == Cell::REF;
    if (isRefA) {
	thisMem.bind(a, b);
	return MATCH_DONE;
    }
    if (isRefB) {
	thisMem.bind(b, a);
	return MATCH_DONE;
    }

    if (ca.getTag() != cb.getTag()) {
	// Different tags? Always fail...
	return MATCH_FAIL;
    }

    switch (ca.getTag()) {
    case Cell::REF:
	break;
    case Cell::INT:
	return ca.toInt32() == cb.toInt32() ? MATCH_DONE : MATCH_FAIL;
    case Cell::SYM:
	return ca.toSym() == cb.toSym() ? MATCH_DONE : MATCH_FAIL;
    case Cell::NIL:
	return MATCH_DONE;
    case Cell::SIG:
	if (thisMem.getVerbosity() > 0) {
	    std::cout << "Warning: unifying SIG cells at " << a << " and "
		      << b << "\n";
	}
	return ca.toFunctor() == cb.toFunctor() ? MATCH_DONE : MATCH_FAIL;
    case Cell::RCD: {
	Functor fa, fb;
	if (!readSig(a, ca, fa) || !readSig(b, cb, fb)) {
	    return MATCH_FAIL;
	}
	if (thisMem.getVerbosity() > 1) {
	    std::cout << "Unify: " << thisMem.cellToString(Cell::sig(fa))
		      << " vs " << thisMem.cellToString(Cell::sig(fb)) << "\n";
	}
	if (fa != fb) {
	    return MATCH_FAIL;
	}
	argsA = ca.toCellRef() + 1;
	argsB = cb.toCellRef() + 1;
	numArgs = fa.getArity();
	return MATCH_ARGS;
    }
    case Cell::LST:
	argsA = ca.toCellRef();
	argsB = cb.toCellRef();
	numArgs = 2;
	return MATCH_ARGS;
    }
    return MATCH_FAIL;
}

bool RecursiveUnifier::unify(CellRef a, CellRef b)
{
    CellRef argsA, argsB;
    size_t numArgs = 0;
    switch (match(a, b, argsA, argsB, numArgs)) {
    case MATCH_FAIL:
	return false;
    case MATCH_DONE:
	return true;
    case MATCH_ARGS:
	for (size_t i = 0; i < numArgs; i++) {
	    if (!unify(argsA + i, argsB + i)) {
		return false;
	    }
	}
	return true;
    }
    return false;
}

Unifier::Unifier(Mem &mem)
    : UnifierBase(mem), thisStack(256), thisNumSteps(0), thisFailed(false)
{
}

void Unifier::setup(CellRef a, CellRef b)
{
    thisStack.clear();
    thisNumSteps = 0;
    thisFailed = false;
    Pair p = { a, b };
    thisStack.push(p);
}

//
// Process one pair. Argument pairs are pushed in ascending order and
// popped from the top, so the last argument is looked at first.
//
Unifier::Step Unifier::step()
{
    if (thisFailed) {
	return STEP_FAILURE;
    }
    if (thisStack.isEmpty()) {
	return STEP_SUCCESS;
    }

    thisNumSteps++;

    Pair p = thisStack.pop();
    CellRef argsA, argsB;
    size_t numArgs = 0;
    switch (match(p.a, p.b, argsA, argsB, numArgs)) {
    case MATCH_FAIL:
	thisStack.clear();
	thisFailed = true;
	return STEP_FAILURE;
    case MATCH_DONE:
	break;
    case MATCH_ARGS:
	for (size_t i = 0; i < numArgs; i++) {
	    Pair q = { argsA + i, argsB + i };
	    thisStack.push(q);
	}
	break;
    }

    return thisStack.isEmpty() ? STEP_SUCCESS : STEP_CONTINUE;
}

bool Unifier::run()
{
    Step s;
    do {
	s = step();
    } while (s == STEP_CONTINUE);
    return s == STEP_SUCCESS;
}

}
