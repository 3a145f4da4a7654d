#ifndef _Serializer_hpp
#define _Serializer_hpp

#include "basic.hpp"
#include "Stack.hpp"
#include "Term.hpp"
#include "Mem.hpp"

namespace PROJECT {

//
// Serializer. Lowers a Term onto the heap of a Mem. This is done
// breadth first: the top level node goes first (the root is always the
// first cell pushed) and records and cons pairs leave a placeholder
// that is patched once their contents have been written. This way the
// arguments of a record always follow its SIG cell and the cdr of a
// cons pair always follows its car.
//
// Named variables go through Mem::pushVar(), so the same name used in
// two serialized terms denotes the same variable.
//
class Serializer {
public:
    Serializer(Mem &mem);

    CellRef serialize(const Term &term);

private:
    struct Pending {
	CellRef placeholder;
	const Term *term;
    };

    CellRef serializeFlat(const Term &term);
    void serializeRemainder();

    Mem &thisMem;
    Stack<Pending> thisPending;
};

CellRef serialize(const Term &term, Mem &mem);

}

#endif
