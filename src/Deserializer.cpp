#include <utility>
#include <sstream>
#include "Deserializer.hpp"

namespace PROJECT {

static std::string deserializeErrorMessage(DeserializeError::Kind kind,
					   CellRef ref)
{
    std::stringstream ss;
    ss << DeserializeError::kindName(kind) << " at " << ref;
    return ss.str();
}

DeserializeError::DeserializeError(Kind kind, CellRef ref)
    : Exception(deserializeErrorMessage(kind, ref)),
      thisKind(kind),
      thisCellRef(ref)
{
}

const char * DeserializeError::kindName(Kind kind)
{
    switch (kind) {
    case BAD_CELL_READ: return "Bad cell read";
    case EXPECTED_RCD_TO_POINT_TO_SIG: return "Expected RCD to point to SIG";
    case A_SIG_IS_NOT_A_VALUE: return "A SIG is not a value";
    }
    return "?";
}

Deserializer::Deserializer(const Mem &mem)
    : thisMem(mem), thisFrames(256)
{
}

Term Deserializer::deserialize(CellRef root)
{
    thisFrames.clear();
    thisResults.clear();

    Frame first = { VISIT, root };
    thisFrames.push(first);

    while (!thisFrames.isEmpty()) {
	Frame frame = thisFrames.pop();
	switch (frame.kind) {
	case VISIT: visit(frame.ref); break;
	case BUILD_RECORD: buildRecord(frame.ref); break;
	case BUILD_CONS: buildCons(); break;
	}
    }

    assert(thisResults.size() == 1);
    Term result;
    result.swap(thisResults.back());
    thisResults.clear();
    return result;
}

void Deserializer::visit(CellRef ref)
{
    CellRef at;
    Cell cell;
    if (!thisMem.tryResolveRef(ref, at, cell)) {
	throw DeserializeError(DeserializeError::BAD_CELL_READ, at);
    }

    switch (cell.getTag()) {
    case Cell::REF: {
	std::string name = thisMem.humanReadableVarName(at);
	if (name.empty() || name[0] == '_') {
	    thisResults.push_back(Term::newFreshVar());
	} else {
	    thisResults.push_back(Term::newVar(name));
	}
	break;
    }
    case Cell::INT:
	thisResults.push_back(Term::newInt(cell.toInt32()));
	break;
    case Cell::SYM:
	if (cell.toSym().getIndex() >= thisMem.getNumSyms()) {
	    throw DeserializeError(DeserializeError::BAD_CELL_READ, at);
	}
	thisResults.push_back(Term::newSym(thisMem.getSymName(cell.toSym())));
	break;
    case Cell::NIL:
	thisResults.push_back(Term::newNil());
	break;
    case Cell::SIG:
	throw DeserializeError(DeserializeError::A_SIG_IS_NOT_A_VALUE, at);
    case Cell::RCD: {
	CellRef sigRef = cell.toCellRef();
	Cell sig;
	if (!thisMem.tryCellRead(sigRef, sig)) {
	    throw DeserializeError(DeserializeError::BAD_CELL_READ, sigRef);
	}
	if (sig.getTag() != Cell::SIG) {
	    throw DeserializeError(DeserializeError::EXPECTED_RCD_TO_POINT_TO_SIG,
				   sigRef);
	}
	if (sig.toFunctor().getSym().getIndex() >= thisMem.getNumSyms()) {
	    throw DeserializeError(DeserializeError::BAD_CELL_READ, sigRef);
	}
	Frame build = { BUILD_RECORD, sigRef };
	thisFrames.push(build);
	for (size_t i = sig.toFunctor().getArity(); i > 0; i--) {
	    Frame arg = { VISIT, sigRef + i };
	    thisFrames.push(arg);
	}
	break;
    }
    case Cell::LST: {
	CellRef car = cell.toCellRef();
	Frame build = { BUILD_CONS, car };
	Frame cdrFrame = { VISIT, car + 1 };
	Frame carFrame = { VISIT, car };
	thisFrames.push(build);
	thisFrames.push(cdrFrame);
	thisFrames.push(carFrame);
	break;
    }
    }
}

void Deserializer::buildRecord(CellRef sigRef)
{
    Functor f = thisMem.cellRead(sigRef).toFunctor();
    size_t arity = f.getArity();
    size_t base = thisResults.size() - arity;
    std::vector<Term> args(arity);
    for (size_t i = 0; i < arity; i++) {
	args[i].swap(thisResults[base + i]);
    }
    thisResults.resize(base);
    thisResults.push_back(Term::newRecord(thisMem.getSymName(f.getSym()),
					  std::move(args)));
}

void Deserializer::buildCons()
{
    size_t base = thisResults.size() - 2;
    Term cons = Term::newCons(std::move(thisResults[base]),
			      std::move(thisResults[base + 1]));
    thisResults.resize(base);
    thisResults.push_back(std::move(cons));
}

Term deserialize(CellRef root, const Mem &mem)
{
    Deserializer deserializer(mem);
    return deserializer.deserialize(root);
}

}
