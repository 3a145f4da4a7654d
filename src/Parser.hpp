#ifndef _Parser_hpp
#define _Parser_hpp

#include <iostream>
#include <string>
#include <utility>
#include <vector>
#include "basic.hpp"
#include "Errors.hpp"
#include "Flags.hpp"
#include "Stack.hpp"
#include "Term.hpp"

namespace PROJECT {

DeclareFlags(Token, COMMA, LPAREN, RPAREN, RBRACKET, PERIOD, NECK, TERM, END);
typedef Flags<Token> Expect;

//
// Position of the next character to be read. Lines and columns start
// at 1, the offset at 0.
//
class LocationTracker {
public:
    LocationTracker() : thisLine(1), thisColumn(1), thisOffset(0) { }

    void advance(const char ch)
    {
	if (ch == '\n') {
	    newLine();
	} else {
	    nextColumn();
	}
	thisOffset++;
    }

    void newLine() { thisLine++; thisColumn = 1; }
    void nextColumn() { thisColumn++; }

    size_t getLine() const { return thisLine; }
    size_t getColumn() const { return thisColumn; }
    size_t getOffset() const { return thisOffset; }

private:
    size_t thisLine;
    size_t thisColumn;
    size_t thisOffset;
};

class ParseError : public Exception {
public:
    ParseError(const std::string &msg, const LocationTracker &loc)
	: Exception(msg), thisLocation(loc) { }
    virtual ~ParseError() throw() { }

    size_t getLine() const { return thisLocation.getLine(); }
    size_t getColumn() const { return thisLocation.getColumn(); }
    size_t getOffset() const { return thisLocation.getOffset(); }

    const LocationTracker & getLocation() const { return thisLocation; }

private:
    LocationTracker thisLocation;
};

//
// Clause. A head record and zero or more body goals.
//
class Clause {
public:
    Clause(Term head, std::vector<Term> body = std::vector<Term>());

    const Term & getHead() const { return thisHead; }
    const std::vector<Term> & getBody() const { return thisBody; }

    const std::string & getName() const { return thisHead.getName(); }
    size_t getArity() const { return thisHead.getArity(); }

    bool isFact() const { return thisBody.empty(); }

    void print(std::ostream &out) const;
    std::string toString() const;

private:
    Term thisHead;
    std::vector<Term> thisBody;
};

class ClauseGroup {
public:
    ClauseGroup(const std::string &name, size_t arity)
	: thisName(name), thisArity(arity) { }

    const std::string & getName() const { return thisName; }
    size_t getArity() const { return thisArity; }
    const std::vector<Clause> & getClauses() const { return thisClauses; }

    void add(const Clause &clause) { thisClauses.push_back(clause); }
    void add(Clause &&clause) { thisClauses.push_back(std::move(clause)); }

private:
    std::string thisName;
    size_t thisArity;
    std::vector<Clause> thisClauses;
};

//
// Module. Clauses grouped by name/arity. Groups are kept in the order
// they first appear, clauses within a group in declaration order.
//
class Module {
public:
    void add(const Clause &clause);
    void add(Clause &&clause);

    const std::vector<ClauseGroup> & getGroups() const { return thisGroups; }
    size_t numGroups() const { return thisGroups.size(); }
    size_t numClauses() const;

    // NULL if there is no such group.
    const ClauseGroup * find(const std::string &name, size_t arity) const;

    void print(std::ostream &out) const;

private:
    ClauseGroup & groupFor(const Clause &clause);

    std::vector<ClauseGroup> thisGroups;
};

//
// Parser. Reads terms, clauses and modules from a stream. Nesting is
// handled with an explicit stack, so the depth of a term is only
// bounded by memory. All errors are reported as ParseError.
//
class Parser {
public:
    Parser(std::istream &in);

    // Parse the next term. Characters following it are left unread.
    Term parseTerm();
    Clause parseClause();
    Module parseModule();

    // Skip whitespace and check for end of input.
    bool atEnd();

    // Fails unless only whitespace remains.
    void parseEnd();

    const LocationTracker & getLocation() const { return thisLocation; }

private:
    enum FrameKind { FRAME_RECORD, FRAME_LIST, FRAME_PAREN };

    struct Frame {
	FrameKind kind;
	size_t base;
	LocationTracker start;
    };

    void skipWhite();
    int peek();
    char next();

    bool isIdentStart(int ch) const;
    bool isIdentChar(int ch) const;
    bool isDigit(int ch) const;
    bool isTermStart(int ch) const;

    std::string parseIdent();
    Term parseInt();

    void expectErrorToken(std::ostream &os, const char *token,
			  bool isLast, bool &isFirst);
    void expectError(int lookahead, Expect expect);
    void parseError(const std::string &msg);
    void parseError(const std::string &msg, const LocationTracker &loc);

    std::istream &thisIn;
    LocationTracker thisLocation;
    Stack<Frame> thisFrames;
    std::vector<Term> thisValues;
};

Term parse(std::istream &in);
Term parse(const std::string &text);
Clause parseClause(const std::string &text);
Module parseModule(std::istream &in);
Module parseModule(const std::string &text);

}

#endif
