#include <utility>
#include <ctype.h>
#include <sstream>
#include "Parser.hpp"

namespace PROJECT {

Clause::Clause(Term head, std::vector<Term> body)
    : thisHead(std::move(head))
{
    thisBody.swap(body);
}

void Clause::print(std::ostream &out) const
{
    out << thisHead;
    if (!thisBody.empty()) {
	out << " :- ";
	for (size_t i = 0; i < thisBody.size(); i++) {
	    if (i > 0) out << ", ";
	    out << thisBody[i];
	}
    }
    out << ".";
}

std::string Clause::toString() const
{
    std::stringstream ss;
    print(ss);
    return ss.str();
}

ClauseGroup & Module::groupFor(const Clause &clause)
{
    for (size_t i = 0; i < thisGroups.size(); i++) {
	ClauseGroup &group = thisGroups[i];
	if (group.getArity() == clause.getArity() &&
	    group.getName() == clause.getName()) {
	    return group;
	}
    }
    thisGroups.push_back(ClauseGroup(clause.getName(), clause.getArity()));
    return thisGroups.back();
}

void Module::add(const Clause &clause)
{
    groupFor(clause).add(clause);
}

void Module::add(Clause &&clause)
{
    groupFor(clause).add(std::move(clause));
}

size_t Module::numClauses() const
{
    size_t n = 0;
    for (size_t i = 0; i < thisGroups.size(); i++) {
	n += thisGroups[i].getClauses().size();
    }
    return n;
}

const ClauseGroup * Module::find(const std::string &name, size_t arity) const
{
    for (size_t i = 0; i < thisGroups.size(); i++) {
	const ClauseGroup &group = thisGroups[i];
	if (group.getArity() == arity && group.getName() == name) {
	    return &group;
	}
    }
    return NULL;
}

void Module::print(std::ostream &out) const
{
    for (size_t i = 0; i < thisGroups.size(); i++) {
	const ClauseGroup &group = thisGroups[i];
	out << "% " << group.getName() << "/" << group.getArity() << "\n";
	for (size_t j = 0; j < group.getClauses().size(); j++) {
	    group.getClauses()[j].print(out);
	    out << "\n";
	}
    }
}

Parser::Parser(std::istream &in)
    : thisIn(in), thisFrames(64)
{
}

int Parser::peek()
{
    return thisIn.peek();
}

char Parser::next()
{
    char ch = static_cast<char>(thisIn.get());
    thisLocation.advance(ch);
    return ch;
}

void Parser::skipWhite()
{
    while (isspace(peek())) {
	next();
    }
}

bool Parser::atEnd()
{
    skipWhite();
    return peek() == EOF;
}

bool Parser::isIdentStart(int ch) const
{
    return (ch >= 'a' && ch <= 'z') || (ch >= 'A' && ch <= 'Z') || ch == '_';
}

bool Parser::isIdentChar(int ch) const
{
    return isIdentStart(ch) || isDigit(ch);
}

bool Parser::isDigit(int ch) const
{
    return ch >= '0' && ch <= '9';
}

bool Parser::isTermStart(int ch) const
{
    return isIdentStart(ch) || isDigit(ch) || ch == '-' || ch == '('
	|| ch == '[';
}

void Parser::parseError(const std::string &msg)
{
    parseError(msg, thisLocation);
}

void Parser::parseError(const std::string &msg, const LocationTracker &loc)
{
    throw ParseError(msg, loc);
}

void Parser::expectErrorToken(std::ostream &os,
			      const char *token,
			      bool isLast,
			      bool &isFirst)
{
    if (!isFirst) {
	os << ", ";
    }
    if (!isFirst && isLast) {
	os << "or ";
    }
    isFirst = false;
    os << token;
}

void Parser::expectError(int lookahead, Expect expect)
{
    static const struct { Token token; const char *text; } names[] = {
	{ LPAREN, "'('" },
	{ RPAREN, "')'" },
	{ RBRACKET, "']'" },
	{ COMMA, "','" },
	{ PERIOD, "'.'" },
	{ NECK, "':-'" },
	{ TERM, "TERM" },
	{ END, "EOF" }
    };

    Expect processed;

    std::stringstream ss;
    ss << "Expecting ";
    bool first = true;

    for (size_t i = 0; i < sizeof(names)/sizeof(names[0]); i++) {
	if (expect & names[i].token) {
	    processed = processed | names[i].token;
	    expectErrorToken(ss, names[i].text, expect == processed, first);
	}
    }

    if (lookahead == EOF) {
	ss << " but got EOF";
    } else {
	ss << " but got '" << ((char)lookahead) << "'";
    }

    parseError(ss.str());
}

std::string Parser::parseIdent()
{
    std::string ident;
    while (isIdentChar(peek())) {
	ident += next();
    }
    return ident;
}

Term Parser::parseInt()
{
    LocationTracker start = thisLocation;
    bool negative = false;
    if (peek() == '-') {
	next();
	negative = true;
	if (!isDigit(peek())) {
	    std::string msg = "Expecting digit after '-'";
	    if (peek() == EOF) {
		msg += " but got EOF";
	    } else {
		msg += " but got '";
		msg += (char)peek();
		msg += "'";
	    }
	    parseError(msg);
	}
    }

    const int64_t limit = negative ? 2147483648LL : 2147483647LL;
    int64_t value = 0;
    bool overflow = false;
    while (isDigit(peek())) {
	value = value * 10 + (next() - '0');
	if (value > limit) {
	    overflow = true;
	    value = limit;
	}
    }
    if (overflow) {
	parseError("Integer out of range", start);
    }
    return Term::newInt(static_cast<int32_t>(negative ? -value : value));
}

//
// The parser alternates between two states: expecting a term, or
// having just completed one and expecting what may follow it inside
// the enclosing frame. Completed values are kept in 'thisValues'; a
// frame remembers where its own values start.
//
Term Parser::parseTerm()
{
    // Anything left behind by an earlier failed parse is garbage.
    thisFrames.clear();
    thisValues.clear();

    Expect expect = TERM;

    for (;;) {
	skipWhite();
	int lookahead = peek();

	bool haveValue = false;
	Term value;

	if ((expect & TERM) && isTermStart(lookahead)) {
	    LocationTracker start = thisLocation;
	    if (lookahead == '(') {
		next();
		Frame frame = { FRAME_PAREN, thisValues.size(), start };
		thisFrames.push(frame);
		expect = TERM;
	    } else if (lookahead == '[') {
		next();
		skipWhite();
		if (peek() == ']') {
		    next();
		    value = Term::newNil();
		    haveValue = true;
		} else {
		    Frame frame = { FRAME_LIST, thisValues.size(), start };
		    thisFrames.push(frame);
		    expect = TERM;
		}
	    } else if (lookahead == '-' || isDigit(lookahead)) {
		value = parseInt();
		haveValue = true;
	    } else {
		std::string name = parseIdent();
		skipWhite();
		if (peek() == '(') {
		    next();
		    thisValues.push_back(Term::newSym(name));
		    Frame frame = { FRAME_RECORD, thisValues.size(), start };
		    thisFrames.push(frame);
		    expect = TERM;
		} else if (name == "_") {
		    value = Term::newFreshVar();
		    haveValue = true;
		} else if ((name[0] >= 'A' && name[0] <= 'Z') || name[0] == '_') {
		    value = Term::newVar(name);
		    haveValue = true;
		} else {
		    value = Term::newSym(name);
		    haveValue = true;
		}
	    }
	} else if (lookahead == ',' && (expect & COMMA)) {
	    next();
	    expect = TERM;
	} else if (lookahead == ')' && (expect & RPAREN)) {
	    next();
	    Frame frame = thisFrames.pop();
	    if (frame.kind == FRAME_PAREN) {
		value.swap(thisValues.back());
		thisValues.pop_back();
	    } else {
		size_t arity = thisValues.size() - frame.base;
		if (arity > 255) {
		    std::stringstream ss;
		    ss << "Too many arguments (" << arity << ") for '"
		       << thisValues[frame.base-1].getName()
		       << "'; at most 255 are allowed";
		    parseError(ss.str(), frame.start);
		}
		std::vector<Term> args(arity);
		for (size_t i = 0; i < arity; i++) {
		    args[i].swap(thisValues[frame.base+i]);
		}
		value = Term::newRecord(thisValues[frame.base-1].getName(),
					std::move(args));
		thisValues.resize(frame.base-1);
	    }
	    haveValue = true;
	} else if (lookahead == ']' && (expect & RBRACKET)) {
	    next();
	    Frame frame = thisFrames.pop();
	    size_t n = thisValues.size() - frame.base;
	    std::vector<Term> elements(n);
	    for (size_t i = 0; i < n; i++) {
		elements[i].swap(thisValues[frame.base+i]);
	    }
	    thisValues.resize(frame.base);
	    value = Term::list(std::move(elements));
	    haveValue = true;
	} else {
	    expectError(lookahead, expect);
	}

	if (!haveValue) {
	    continue;
	}

	if (thisFrames.isEmpty()) {
	    return value;
	}

	thisValues.push_back(Term());
	thisValues.back().swap(value);

	switch (thisFrames.peek().kind) {
	case FRAME_RECORD: expect = Expect(COMMA) | RPAREN; break;
	case FRAME_LIST: expect = Expect(COMMA) | RBRACKET; break;
	case FRAME_PAREN: expect = RPAREN; break;
	}
    }
}

Clause Parser::parseClause()
{
    skipWhite();
    LocationTracker start = thisLocation;
    Term head = parseTerm();
    if (head.getKind() != Term::RECORD) {
	parseError("Clause head must be a record but got '"
		   + head.toString() + "'", start);
    }

    std::vector<Term> body;

    skipWhite();
    int lookahead = peek();
    if (lookahead == '.') {
	next();
	return Clause(std::move(head));
    }
    if (lookahead != ':') {
	expectError(lookahead, Expect(PERIOD) | NECK);
    }
    next();
    if (peek() != '-') {
	expectError(peek(), NECK);
    }
    next();

    for (;;) {
	body.push_back(parseTerm());
	skipWhite();
	lookahead = peek();
	if (lookahead == '.') {
	    next();
	    break;
	}
	if (lookahead != ',') {
	    expectError(lookahead, Expect(COMMA) | PERIOD);
	}
	next();
    }

    return Clause(std::move(head), std::move(body));
}

void Parser::parseEnd()
{
    if (!atEnd()) {
	expectError(peek(), END);
    }
}

Module Parser::parseModule()
{
    Module module;
    while (!atEnd()) {
	module.add(parseClause());
    }
    return module;
}

Term parse(std::istream &in)
{
    Parser parser(in);
    Term term = parser.parseTerm();
    parser.parseEnd();
    return term;
}

Term parse(const std::string &text)
{
    std::stringstream in(text);
    return parse(in);
}

Clause parseClause(const std::string &text)
{
    std::stringstream in(text);
    Parser parser(in);
    Clause clause = parser.parseClause();
    parser.parseEnd();
    return clause;
}

Module parseModule(std::istream &in)
{
    Parser parser(in);
    return parser.parseModule();
}

Module parseModule(const std::string &text)
{
    std::stringstream in(text);
    return parseModule(in);
}

}
