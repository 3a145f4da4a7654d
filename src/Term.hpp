#ifndef _Term_hpp
#define _Term_hpp

#include <iostream>
#include <string>
#include <vector>
#include "basic.hpp"

namespace PROJECT {

//
// Term. The tree form of a term, as produced by the parser and the
// deserializer and consumed by the serializer. Terms are plain values;
// they know nothing about any Mem.
//
// Term ::= Int | Sym | Var | Record(name, Term, ..., Term)
//        | Cons(Term, Term) | Nil
//
// A Var without a name is anonymous. Cons keeps its car and cdr as
// argument 0 and 1.
//
// Deep terms (long lists, deeply nested records) are fine to copy,
// move, compare, print and destroy; none of these recurse natively.
//
class Term {
public:
    enum Kind { INT, SYM, VAR, RECORD, CONS, NIL };

    Term();
    Term(const Term &other);
    Term(Term &&other) noexcept;
    ~Term();

    Term & operator = (const Term &other);
    Term & operator = (Term &&other) noexcept;

    static Term newInt(int32_t value);
    static Term newSym(const std::string &name);
    static Term newVar(const std::string &name);
    static Term newFreshVar();
    static Term newRecord(const std::string &name, std::vector<Term> args);
    static Term newCons(Term car, Term cdr);
    static Term newNil();

    // [e1, e2, ..., en | tail]
    static Term list(std::vector<Term> elements, Term tail = Term());

    inline Kind getKind() const { return thisKind; }

    inline int32_t getInt() const { return thisInt; }

    // Symbol text, variable name (empty if anonymous) or record name.
    inline const std::string & getName() const { return thisName; }

    inline bool isAnonymous() const
    { return thisKind == VAR && thisName.empty(); }

    inline const std::vector<Term> & getArgs() const { return thisArgs; }
    inline size_t getArity() const { return thisArgs.size(); }
    inline const Term & getArg(size_t index) const { return thisArgs[index]; }

    inline const Term & getCar() const { return thisArgs[0]; }
    inline const Term & getCdr() const { return thisArgs[1]; }

    void swap(Term &other);

    bool operator == (const Term &other) const;
    inline bool operator != (const Term &other) const
    { return !(*this == other); }

    void print(std::ostream &out) const;
    std::string toString() const;

    friend std::ostream & operator << (std::ostream &out, const Term &term)
    {
	term.print(out);
	return out;
    }

private:
    explicit Term(Kind kind) : thisKind(kind), thisInt(0) { }

    Kind thisKind;
    int32_t thisInt;
    std::string thisName;
    std::vector<Term> thisArgs;
};

}

#endif
