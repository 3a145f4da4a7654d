#ifndef _Unify_hpp
#define _Unify_hpp

#include "basic.hpp"
#include "Stack.hpp"
#include "Mem.hpp"

namespace PROJECT {

//
// Unification of two terms on the same heap. Bindings are written
// straight into the heap; there is no trail, so a failed unification
// may leave some of its bindings behind. There is no occurs check.
//
// Two strategies are provided and they agree on every input:
// RecursiveUnifier uses native recursion, Unifier uses an explicit
// stack and can be driven one step at a time.
//
class UnifierBase {
protected:
    UnifierBase(Mem &mem) : thisMem(mem) { }

    enum Match { MATCH_FAIL, MATCH_DONE, MATCH_ARGS };

    // Dereference and compare the terms at 'a' and 'b', binding
    // variables as needed. On MATCH_ARGS the 'numArgs' argument pairs
    // starting at 'argsA' and 'argsB' must unify as well.
    Match match(CellRef a, CellRef b,
		CellRef &argsA, CellRef &argsB, size_t &numArgs);

    Mem &thisMem;

private:
    bool readSig(CellRef rcdRef, Cell rcd, Functor &f);
};

class RecursiveUnifier : public UnifierBase {
public:
    RecursiveUnifier(Mem &mem) : UnifierBase(mem) { }

    bool unify(CellRef a, CellRef b);
};

class Unifier : public UnifierBase {
public:
    enum Step { STEP_CONTINUE, STEP_SUCCESS, STEP_FAILURE };

    Unifier(Mem &mem);

    void setup(CellRef a, CellRef b);
    Step step();
    bool run();

    bool unify(CellRef a, CellRef b)
    {
	setup(a, b);
	return run();
    }

    size_t getNumSteps() const { return thisNumSteps; }

private:
    struct Pair {
	CellRef a;
	CellRef b;
    };

    Stack<Pair> thisStack;
    size_t thisNumSteps;
    bool thisFailed;
};

}

#endif
