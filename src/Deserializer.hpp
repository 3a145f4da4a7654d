#ifndef _Deserializer_hpp
#define _Deserializer_hpp

#include <vector>
#include "basic.hpp"
#include "Errors.hpp"
#include "Stack.hpp"
#include "Term.hpp"
#include "Mem.hpp"

namespace PROJECT {

class DeserializeError : public Exception {
public:
    enum Kind {
	BAD_CELL_READ,
	EXPECTED_RCD_TO_POINT_TO_SIG,
	A_SIG_IS_NOT_A_VALUE
    };

    DeserializeError(Kind kind, CellRef ref);
    virtual ~DeserializeError() throw() { }

    Kind getKind() const { return thisKind; }
    CellRef getCellRef() const { return thisCellRef; }

    static const char * kindName(Kind kind);

private:
    Kind thisKind;
    CellRef thisCellRef;
};

//
// Deserializer. Reads the term rooted at a heap address back into a
// Term. Bindings are followed, so a bound variable comes back as the
// value it is bound to. Unbound variables come back named if they were
// given a name that doesn't start with '_'.
//
// The heap is not trusted: every read is checked and problems are
// reported as DeserializeError. Uses an explicit stack.
//
class Deserializer {
public:
    Deserializer(const Mem &mem);

    Term deserialize(CellRef root);

private:
    enum FrameKind { VISIT, BUILD_RECORD, BUILD_CONS };

    struct Frame {
	FrameKind kind;
	CellRef ref;
    };

    void visit(CellRef ref);
    void buildRecord(CellRef sigRef);
    void buildCons();

    const Mem &thisMem;
    Stack<Frame> thisFrames;
    std::vector<Term> thisResults;
};

Term deserialize(CellRef root, const Mem &mem);

}

#endif
