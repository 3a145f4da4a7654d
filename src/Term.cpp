#include <utility>
#include <sstream>
#include "Term.hpp"
#include "Stack.hpp"

namespace PROJECT {

Term::Term() : thisKind(NIL), thisInt(0)
{
}

namespace {

struct TermCopy {
    Term *to;
    const Term *from;
};

}

// Children are copied one level at a time from an explicit stack.
// Argument vectors are sized before anything is pushed, so the
// pointers on the stack stay valid.
Term::Term(const Term &other)
    : thisKind(other.thisKind),
      thisInt(other.thisInt),
      thisName(other.thisName)
{
    Stack<TermCopy> stack(64);
    TermCopy first = { this, &other };
    stack.push(first);

    while (!stack.isEmpty()) {
	TermCopy item = stack.pop();
	const std::vector<Term> &from = item.from->thisArgs;
	std::vector<Term> &to = item.to->thisArgs;
	to.resize(from.size());
	for (size_t i = 0; i < from.size(); i++) {
	    to[i].thisKind = from[i].thisKind;
	    to[i].thisInt = from[i].thisInt;
	    to[i].thisName = from[i].thisName;
	    if (!from[i].thisArgs.empty()) {
		TermCopy next = { &to[i], &from[i] };
		stack.push(next);
	    }
	}
    }
}

Term::Term(Term &&other) noexcept
    : thisKind(other.thisKind),
      thisInt(other.thisInt)
{
    thisName.swap(other.thisName);
    thisArgs.swap(other.thisArgs);
    other.thisKind = NIL;
}

Term::~Term()
{
    if (thisArgs.empty()) {
	return;
    }

    // Take the children apart one level at a time. Every term we let
    // go of has had its own children moved out first, so its
    // destructor returns immediately.
    std::vector<Term> pending;
    pending.swap(thisArgs);
    while (!pending.empty()) {
	std::vector<Term> children;
	children.swap(pending.back().thisArgs);
	pending.pop_back();
	for (size_t i = 0; i < children.size(); i++) {
	    if (!children[i].thisArgs.empty()) {
		pending.push_back(Term(children[i].thisKind));
		pending.back().thisArgs.swap(children[i].thisArgs);
	    }
	}
    }
}

Term & Term::operator = (const Term &other)
{
    if (this != &other) {
	Term copy(other);
	swap(copy);
    }
    return *this;
}

Term & Term::operator = (Term &&other) noexcept
{
    if (this != &other) {
	Term moved(std::move(other));
	swap(moved);
    }
    return *this;
}

void Term::swap(Term &other)
{
    std::swap(thisKind, other.thisKind);
    std::swap(thisInt, other.thisInt);
    thisName.swap(other.thisName);
    thisArgs.swap(other.thisArgs);
}

Term Term::newInt(int32_t value)
{
    Term t(INT);
    t.thisInt = value;
    return t;
}

Term Term::newSym(const std::string &name)
{
    Term t(SYM);
    t.thisName = name;
    return t;
}

Term Term::newVar(const std::string &name)
{
    Term t(VAR);
    t.thisName = name;
    return t;
}

Term Term::newFreshVar()
{
    return Term(VAR);
}

Term Term::newRecord(const std::string &name, std::vector<Term> args)
{
    Term t(RECORD);
    t.thisName = name;
    t.thisArgs.swap(args);
    return t;
}

Term Term::newCons(Term car, Term cdr)
{
    Term t(CONS);
    t.thisArgs.resize(2);
    t.thisArgs[0].swap(car);
    t.thisArgs[1].swap(cdr);
    return t;
}

Term Term::newNil()
{
    return Term(NIL);
}

Term Term::list(std::vector<Term> elements, Term tail)
{
    Term result;
    result.swap(tail);
    for (size_t i = elements.size(); i > 0; i--) {
	Term cell = newCons(Term(), Term());
	cell.thisArgs[0].swap(elements[i-1]);
	cell.thisArgs[1].swap(result);
	result.swap(cell);
    }
    return result;
}

namespace {

struct TermPair {
    const Term *a;
    const Term *b;
};

}

bool Term::operator == (const Term &other) const
{
    Stack<TermPair> stack(64);
    TermPair first = { this, &other };
    stack.push(first);

    while (!stack.isEmpty()) {
	TermPair p = stack.pop();
	const Term &a = *p.a;
	const Term &b = *p.b;
	if (a.thisKind != b.thisKind) {
	    return false;
	}
	switch (a.thisKind) {
	case INT:
	    if (a.thisInt != b.thisInt) return false;
	    break;
	case SYM:
	case VAR:
	    if (a.thisName != b.thisName) return false;
	    break;
	case NIL:
	    break;
	case RECORD:
	    if (a.thisName != b.thisName) return false;
	    // Fall through
	case CONS:
	    if (a.thisArgs.size() != b.thisArgs.size()) return false;
	    for (size_t i = a.thisArgs.size(); i > 0; i--) {
		TermPair q = { &a.thisArgs[i-1], &b.thisArgs[i-1] };
		stack.push(q);
	    }
	    break;
	}
    }
    return true;
}

namespace {

enum PrintKind { PRINT_TERM, PRINT_TAIL, PRINT_TEXT };

struct PrintItem {
    PrintKind kind;
    const Term *term;
    const char *text;
};

inline PrintItem printItem(PrintKind kind, const Term *term, const char *text)
{
    PrintItem item = { kind, term, text };
    return item;
}

}

void Term::print(std::ostream &out) const
{
    Stack<PrintItem> stack(64);
    stack.push(printItem(PRINT_TERM, this, NULL));

    while (!stack.isEmpty()) {
	PrintItem item = stack.pop();
	if (item.kind == PRINT_TEXT) {
	    out << item.text;
	    continue;
	}
	const Term &t = *item.term;
	if (item.kind == PRINT_TAIL) {
	    if (t.thisKind == NIL) {
		out << "]";
	    } else if (t.thisKind == CONS) {
		out << ", ";
		stack.push(printItem(PRINT_TAIL, &t.getCdr(), NULL));
		stack.push(printItem(PRINT_TERM, &t.getCar(), NULL));
	    } else {
		out << " | ";
		stack.push(printItem(PRINT_TEXT, NULL, "]"));
		stack.push(printItem(PRINT_TERM, &t, NULL));
	    }
	    continue;
	}
	switch (t.thisKind) {
	case INT:
	    out << t.thisInt;
	    break;
	case SYM:
	    out << t.thisName;
	    break;
	case VAR:
	    out << (t.thisName.empty() ? "_" : t.thisName);
	    break;
	case NIL:
	    out << "[]";
	    break;
	case RECORD:
	    out << t.thisName << "(";
	    stack.push(printItem(PRINT_TEXT, NULL, ")"));
	    for (size_t i = t.thisArgs.size(); i > 0; i--) {
		stack.push(printItem(PRINT_TERM, &t.thisArgs[i-1], NULL));
		if (i > 1) {
		    stack.push(printItem(PRINT_TEXT, NULL, ", "));
		}
	    }
	    break;
	case CONS:
	    out << "[";
	    stack.push(printItem(PRINT_TAIL, &t.getCdr(), NULL));
	    stack.push(printItem(PRINT_TERM, &t.getCar(), NULL));
	    break;
	}
    }
}

std::string Term::toString() const
{
    std::stringstream ss;
    print(ss);
    return ss.str();
}

}
