#include <iostream>
#include <sstream>
#include <assert.h>
#include <utility>
#include <vector>
#include "../Term.hpp"
#include "../Parser.hpp"

using namespace PROJECT;

static void testParse(const std::string &input, const std::string &expect)
{
    Term term = parse(input);
    std::string got = term.toString();
    std::cout << "Parse: " << input << "\n";
    std::cout << "Got  : " << got << "\n";
    assert(got == expect);
}

static void testParseError(const std::string &input,
			   const std::string &expectMsg,
			   size_t line, size_t column)
{
    std::cout << "Parse: " << input << "\n";
    try {
	Term term = parse(input);
	std::cout << "Unexpected success: " << term << "\n";
	assert(false);
    } catch (const ParseError &err) {
	std::cout << "Error: " << err.what() << " (line " << err.getLine()
		  << ", column " << err.getColumn() << ")\n";
	assert(err.getMessage() == expectMsg);
	assert(err.getLine() == line);
	assert(err.getColumn() == column);
    }
}

void testTermBasics()
{
    std::cout << "testTermBasics() ----------------------------\n";

    std::vector<Term> args;
    args.push_back(Term::newSym("alice"));
    args.push_back(Term::newInt(29));
    Term person = Term::newRecord("person", args);

    assert(person.getKind() == Term::RECORD);
    assert(person.getName() == "person");
    assert(person.getArity() == 2);
    assert(person.getArg(1).getInt() == 29);
    assert(person.toString() == "person(alice, 29)");

    Term copy = person;
    assert(copy == person);

    std::vector<Term> other;
    other.push_back(Term::newSym("alice"));
    other.push_back(Term::newInt(30));
    assert(Term::newRecord("person", other) != person);
    assert(Term::newRecord("persona", args) != person);
    assert(Term::newSym("person") != person);

    assert(Term::newVar("X").toString() == "X");
    assert(Term::newFreshVar().toString() == "_");
    assert(Term::newFreshVar().isAnonymous());
    assert(!Term::newVar("X").isAnonymous());
    assert(Term::newVar("X") != Term::newVar("Y"));
    assert(Term::newNil().toString() == "[]");
    assert(Term() == Term::newNil());

    std::vector<Term> elems;
    elems.push_back(Term::newInt(1));
    elems.push_back(Term::newInt(2));
    Term list = Term::list(elems);
    assert(list.getKind() == Term::CONS);
    assert(list.getCar().getInt() == 1);
    assert(list.getCdr().getCdr().getKind() == Term::NIL);
    assert(list.toString() == "[1, 2]");

    Term improper = Term::list(elems, Term::newVar("T"));
    assert(improper.toString() == "[1, 2 | T]");

    Term pair = Term::newCons(Term::newSym("a"), Term::newSym("b"));
    assert(pair.toString() == "[a | b]");

    Term empty = Term::list(std::vector<Term>());
    assert(empty == Term::newNil());
}

void testParseTerms()
{
    std::cout << "testParseTerms() ----------------------------\n";

    testParse("foo( bar( a, b), c, baz(blag(dd),xy),ef )",
	      "foo(bar(a, b), c, baz(blag(dd), xy), ef)");
    testParse("f(a123, X64, _3, [], [1], [1, 2], goblin_stats(123, -99, spear))",
	      "f(a123, X64, _3, [], [1], [1, 2], goblin_stats(123, -99, spear))");
    testParse("  [ 1 ,2,  [ ] ]  ", "[1, 2, []]");
    testParse("((a))", "a");
    testParse("f (a)", "f(a)");
    testParse("f(\n  a,\n  (b)\n)", "f(a, b)");

    Term t = parse("X");
    assert(t.getKind() == Term::VAR && t.getName() == "X");
    t = parse("_");
    assert(t.isAnonymous());
    t = parse("_foo");
    assert(t.getKind() == Term::VAR && t.getName() == "_foo");
    t = parse("foo");
    assert(t.getKind() == Term::SYM && t.getName() == "foo");
    t = parse("foo_Bar9");
    assert(t.getKind() == Term::SYM && t.getName() == "foo_Bar9");
    t = parse("42");
    assert(t.getKind() == Term::INT && t.getInt() == 42);
    t = parse("-99");
    assert(t.getKind() == Term::INT && t.getInt() == -99);
    t = parse("2147483647");
    assert(t.getInt() == 2147483647);
    t = parse("-2147483648");
    assert(t.getInt() == -2147483647-1);
    t = parse("[]");
    assert(t.getKind() == Term::NIL);

    std::vector<Term> elems;
    elems.push_back(Term::newInt(1));
    elems.push_back(Term::newVar("X"));
    assert(parse("[1, X]") == Term::list(elems));

    std::vector<Term> args;
    args.push_back(Term::newFreshVar());
    args.push_back(Term::newSym("b"));
    assert(parse("f(_, b)") == Term::newRecord("f", args));
}

void testParseErrors()
{
    std::cout << "testParseErrors() ---------------------------\n";

    testParseError("foo( bar( a, b), c, ",
		   "Expecting TERM but got EOF", 1, 21);
    testParseError("foo( bar(a, ), c)",
		   "Expecting TERM but got ')'", 1, 13);
    testParseError("f()", "Expecting TERM but got ')'", 1, 3);
    testParseError("f(a, b,)", "Expecting TERM but got ')'", 1, 8);
    testParseError("f(a b)", "Expecting ')', or ',' but got 'b'", 1, 5);
    testParseError("[1, 2", "Expecting ']', or ',' but got EOF", 1, 6);
    testParseError("(a, b)", "Expecting ')' but got ','", 1, 3);
    testParseError("foo bar", "Expecting EOF but got 'b'", 1, 5);
    testParseError("", "Expecting TERM but got EOF", 1, 1);
    testParseError("f(a,\n  b,\n  $)", "Expecting TERM but got '$'", 3, 3);
    testParseError("[1 | T]", "Expecting ']', or ',' but got '|'", 1, 4);
    testParseError("2147483648", "Integer out of range", 1, 1);
    testParseError("f(-2147483649)", "Integer out of range", 1, 3);
    testParseError("-x", "Expecting digit after '-' but got 'x'", 1, 2);

    try {
	parse("g(\n\n   $)");
	assert(false);
    } catch (const ParseError &err) {
	assert(err.getLine() == 3);
	assert(err.getColumn() == 4);
	assert(err.getOffset() == 7);
    }
}

void testArityLimit()
{
    std::cout << "testArityLimit() ----------------------------\n";

    std::stringstream ok;
    ok << "f(";
    for (size_t i = 0; i < 255; i++) {
	if (i > 0) ok << ", ";
	ok << i;
    }
    ok << ")";
    Term t = parse(ok.str());
    assert(t.getArity() == 255);
    assert(t.getArg(254).getInt() == 254);

    std::stringstream tooMany;
    tooMany << "  g(";
    for (size_t i = 0; i < 256; i++) {
	if (i > 0) tooMany << ",";
	tooMany << "a";
    }
    tooMany << ")";
    try {
	parse(tooMany.str());
	assert(false);
    } catch (const ParseError &err) {
	std::cout << "Error: " << err.what() << "\n";
	assert(err.getMessage() ==
	       "Too many arguments (256) for 'g'; at most 255 are allowed");
	assert(err.getColumn() == 3);
    }
}

void testParseDeep()
{
    std::cout << "testParseDeep() -----------------------------\n";

    const size_t DEPTH = 100000;

    std::string input;
    for (size_t i = 0; i < DEPTH; i++) {
	input += "s(";
    }
    input += "zero";
    for (size_t i = 0; i < DEPTH; i++) {
	input += ")";
    }

    Term t = parse(input);

    size_t depth = 0;
    const Term *p = &t;
    while (p->getKind() == Term::RECORD) {
	assert(p->getName() == "s" && p->getArity() == 1);
	p = &p->getArg(0);
	depth++;
    }
    assert(depth == DEPTH);
    assert(p->getKind() == Term::SYM && p->getName() == "zero");

    assert(t.toString() == input);
    assert(parse(input) == t);

    Term copy = t;
    assert(copy == t);
    copy = parse("zero");
    assert(copy.getKind() == Term::SYM);

    std::stringstream list;
    list << "[";
    for (size_t i = 0; i < DEPTH; i++) {
	if (i > 0) list << ", ";
	list << i;
    }
    list << "]";
    Term l = parse(list.str());
    assert(l.toString() == list.str());

    // Moving a deep term doesn't copy it
    Term moved(std::move(l));
    assert(l.getKind() == Term::NIL);
    assert(moved.getKind() == Term::CONS);
}

void testClause()
{
    std::cout << "testClause() --------------------------------\n";

    Clause fact = parseClause("likes(alice, bob).");
    assert(fact.isFact());
    assert(fact.getName() == "likes");
    assert(fact.getArity() == 2);
    assert(fact.toString() == "likes(alice, bob).");

    Clause rule = parseClause("mortal(X) :-\n  human(X),\n  alive(X, [now]).");
    assert(!rule.isFact());
    assert(rule.getName() == "mortal");
    assert(rule.getArity() == 1);
    assert(rule.getBody().size() == 2);
    assert(rule.getBody()[1].toString() == "alive(X, [now])");
    std::cout << "Rule: " << rule.toString() << "\n";
    assert(rule.toString() == "mortal(X) :- human(X), alive(X, [now]).");

    Clause atomGoal = parseClause("run(X) :- X, halt.");
    assert(atomGoal.getBody()[0].getKind() == Term::VAR);
    assert(atomGoal.getBody()[1].getKind() == Term::SYM);

    const char *bad[][2] = {
	{ "foo :- bar.", "Clause head must be a record but got 'foo'" },
	{ "X.", "Clause head must be a record but got 'X'" },
	{ "[a].", "Clause head must be a record but got '[a]'" },
	{ "foo(a)", "Expecting '.', or ':-' but got EOF" },
	{ "foo(a) :- bar baz.", "Expecting ',', or '.' but got 'b'" },
	{ "foo(a) :- .", "Expecting TERM but got '.'" },
	{ "foo(a) :x", "Expecting ':-' but got 'x'" },
	{ "foo(a). bar", "Expecting EOF but got 'b'" }
    };

    for (size_t i = 0; i < sizeof(bad)/sizeof(bad[0]); i++) {
	try {
	    parseClause(bad[i][0]);
	    std::cout << "Unexpected success: " << bad[i][0] << "\n";
	    assert(false);
	} catch (const ParseError &err) {
	    std::cout << "Clause: " << bad[i][0] << " Error: " << err.what() << "\n";
	    assert(err.getMessage() == bad[i][1]);
	}
    }
}

void testModule()
{
    std::cout << "testModule() --------------------------------\n";

    Module module = parseModule(
	"p(1).\n"
	"q(a) :- p(1).\n"
	"p(2).\n"
	"p(3, x).\n"
	"q(b).\n");

    assert(module.numGroups() == 3);
    assert(module.numClauses() == 5);

    const std::vector<ClauseGroup> &groups = module.getGroups();
    assert(groups[0].getName() == "p" && groups[0].getArity() == 1);
    assert(groups[1].getName() == "q" && groups[1].getArity() == 1);
    assert(groups[2].getName() == "p" && groups[2].getArity() == 2);

    const ClauseGroup *p1 = module.find("p", 1);
    assert(p1 != NULL);
    assert(p1->getClauses().size() == 2);
    assert(p1->getClauses()[0].toString() == "p(1).");
    assert(p1->getClauses()[1].toString() == "p(2).");

    const ClauseGroup *q1 = module.find("q", 1);
    assert(q1 != NULL);
    assert(q1->getClauses()[0].toString() == "q(a) :- p(1).");
    assert(q1->getClauses()[1].toString() == "q(b).");

    assert(module.find("p", 3) == NULL);
    assert(module.find("r", 0) == NULL);

    std::stringstream ss;
    module.print(ss);
    std::cout << ss.str();
    assert(ss.str() == "% p/1\np(1).\np(2).\n% q/1\nq(a) :- p(1).\nq(b).\n% p/2\np(3, x).\n");

    // Deep clause heads are moved into their group, not copied
    const size_t DEPTH = 100000;
    std::string deep = "p(";
    for (size_t i = 0; i < DEPTH; i++) {
	deep += "s(";
    }
    deep += "z";
    for (size_t i = 0; i < DEPTH; i++) {
	deep += ")";
    }
    deep += ").\n";
    Module deepModule = parseModule(deep);
    assert(deepModule.numClauses() == 1);
    const ClauseGroup *deepGroup = deepModule.find("p", 1);
    assert(deepGroup != NULL);
    size_t depth = 0;
    const Term *arg = &deepGroup->getClauses()[0].getHead().getArg(0);
    while (arg->getKind() == Term::RECORD) {
	arg = &arg->getArg(0);
	depth++;
    }
    assert(depth == DEPTH);
    assert(arg->getName() == "z");

    // Copying a module copies its deep clauses
    Module deepCopy = deepModule;
    assert(deepCopy.find("p", 1)->getClauses()[0].getHead() ==
	   deepGroup->getClauses()[0].getHead());

    assert(parseModule("").numGroups() == 0);
    assert(parseModule("  \n\t ").numClauses() == 0);

    try {
	parseModule("p(1).\np(2)\n");
	assert(false);
    } catch (const ParseError &err) {
	assert(err.getMessage() == "Expecting '.', or ':-' but got EOF");
	assert(err.getLine() == 3);
    }
}

int main(int argc, char *argv[])
{
    std::cout << "TestTerm::main() **************************************\n";

    testTermBasics();
    testParseTerms();
    testParseErrors();
    testArityLimit();
    testParseDeep();
    testClause();
    testModule();

    return 0;
}
