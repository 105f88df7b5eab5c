#include <gtest/gtest.h>

#include <sstream>

#include "LispError.hpp"
#include "evaluator.hpp"
#include "parser.hpp"

// Runs `src` and returns the kind of LispError it raised; fails the test if none was raised.
static ErrorKind errorKindOf(const std::string& src, std::string* what = nullptr) {
    std::ostringstream out;
    Evaluator evaluator(out);
    try {
        evaluator.evaluate_program(parse_all(src));
    } catch (const LispError& e) {
        if (what) *what = e.what();
        return e.kind();
    }
    ADD_FAILURE() << "expected a LispError from: " << src;
    return ErrorKind::InvalidAST;
}

// --- Arity ------------------------------------------------------------------

TEST(ErrorTest, IfWithTwoArgumentsIsArityError) {
    EXPECT_EQ(errorKindOf("(if #t 1)"), ErrorKind::Arity);
}

TEST(ErrorTest, HeadWithTwoArgumentsIsArityError) {
    EXPECT_EQ(errorKindOf("(head () ())"), ErrorKind::Arity);
}

TEST(ErrorTest, EveryCommandChecksItsArity) {
    const char* cases[] = {
        "(quote)", "(quote 1 2)", "(atom)", "(eq 1)", "(eq 1 2 3)",
        "(define x)", "(lambda (x))", "(print)", "(print 1 2)",
        "(+ 1)", "(- 1 2 3)", "(* 1)", "(/ 1)", "(mod 1)", "(> 1)", "(< 1 2 3)",
        "(cons 1)", "(head)", "(tail '(1) '(2))", "(empty)"};
    for (const char* src : cases) {
        EXPECT_EQ(errorKindOf(src), ErrorKind::Arity) << src;
    }
}

TEST(ErrorTest, ArityCheckedBeforeArgumentsAreEvaluated) {
    std::ostringstream out;
    Evaluator evaluator(out);
    EXPECT_THROW(evaluator.evaluate_program(parse_all("(+ (print 1))")), LispError);
    EXPECT_EQ(out.str(), "");
}

TEST(ErrorTest, ClosureArityMismatchReportsBothCounts) {
    std::string what;
    EXPECT_EQ(errorKindOf("((lambda (x y) x) 1)", &what), ErrorKind::Arity);
    EXPECT_NE(what.find("2 parameters expected by function, 1 passed"), std::string::npos) << what;
}

TEST(ErrorTest, BareClosureIsCalledWithNoArguments) {
    Evaluator evaluator;
    Value fn = evaluator.evaluate(parse("(lambda (x) x)"), evaluator.global());
    try {
        evaluator.evaluate(fn, evaluator.global());
        FAIL() << "expected ArityError";
    } catch (const LispError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::Arity);
    }
}

// --- Type -------------------------------------------------------------------

TEST(ErrorTest, DefineRequiresSymbol) {
    EXPECT_EQ(errorKindOf("(define 1 2)"), ErrorKind::Type);
    EXPECT_EQ(errorKindOf("(define (x) 2)"), ErrorKind::Type);
}

TEST(ErrorTest, LambdaRequiresParameterList) {
    EXPECT_EQ(errorKindOf("(lambda x x)"), ErrorKind::Type);
    EXPECT_EQ(errorKindOf("(lambda (x 1) x)"), ErrorKind::Type);
}

TEST(ErrorTest, ArithmeticRequiresIntegers) {
    EXPECT_EQ(errorKindOf("(+ 1 #t)"), ErrorKind::Type);
    EXPECT_EQ(errorKindOf("(- 'a 1)"), ErrorKind::Type);
    EXPECT_EQ(errorKindOf("(< '(1) 2)"), ErrorKind::Type);
    EXPECT_EQ(errorKindOf("(* (lambda (x) x) 2)"), ErrorKind::Type);
}

TEST(ErrorTest, ListOperatorsRequireLists) {
    EXPECT_EQ(errorKindOf("(cons 1 2)"), ErrorKind::Type);
    EXPECT_EQ(errorKindOf("(head 1)"), ErrorKind::Type);
    EXPECT_EQ(errorKindOf("(tail #t)"), ErrorKind::Type);
    EXPECT_EQ(errorKindOf("(empty 'a)"), ErrorKind::Type);
}

// --- EmptyList / DivisionByZero -----------------------------------------------

TEST(ErrorTest, HeadAndTailOfEmptyList) {
    EXPECT_EQ(errorKindOf("(head '())"), ErrorKind::EmptyList);
    EXPECT_EQ(errorKindOf("(tail '())"), ErrorKind::EmptyList);
}

TEST(ErrorTest, DivisionByZero) {
    EXPECT_EQ(errorKindOf("(/ 1 0)"), ErrorKind::DivisionByZero);
    EXPECT_EQ(errorKindOf("(mod 1 0)"), ErrorKind::DivisionByZero);
}

// --- Unbound / NotCallable / InvalidAST -----------------------------------------

TEST(ErrorTest, UndefinedSymbolIsUnbound) {
    EXPECT_EQ(errorKindOf("some-undefined-symbol"), ErrorKind::UnboundSymbol);
    EXPECT_EQ(errorKindOf("(+ x 1)"), ErrorKind::UnboundSymbol);
    EXPECT_EQ(errorKindOf("(undefined-function 1)"), ErrorKind::UnboundSymbol);
}

TEST(ErrorTest, CallingANonFunctionSymbol) {
    std::string what;
    EXPECT_EQ(errorKindOf("(define x 5) (x 1)", &what), ErrorKind::NotCallable);
    EXPECT_NE(what.find("'x'"), std::string::npos) << what;
}

TEST(ErrorTest, EmptyListAndNilAreNotEvaluable) {
    EXPECT_EQ(errorKindOf("()"), ErrorKind::InvalidAST);

    Evaluator evaluator;
    try {
        evaluator.evaluate(make_nil(), evaluator.global());
        FAIL() << "expected InvalidASTError";
    } catch (const LispError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::InvalidAST);
    }
}

// --- Reporting / propagation --------------------------------------------------

TEST(ErrorTest, MessageNamesKindAndForm) {
    std::string what;
    errorKindOf("(if #t 1)", &what);
    EXPECT_EQ(what.rfind("ArityError: ", 0), 0u) << what;
    EXPECT_NE(what.find("--> in: (if #t 1)"), std::string::npos) << what;
}

TEST(ErrorTest, ErrorsPropagateOutOfNestedCalls) {
    std::string what;
    EXPECT_EQ(errorKindOf(
                  "(define f (lambda (l) (head l)))\n"
                  "(define g (lambda (x) (+ 1 (f x))))\n"
                  "(g '())\n",
                  &what),
        ErrorKind::EmptyList);
}

TEST(ErrorTest, EvaluationStopsAtFirstError) {
    std::ostringstream out;
    Evaluator evaluator(out);
    EXPECT_THROW(evaluator.evaluate_program(parse_all("(print 1) (head '()) (print 2)")), LispError);
    EXPECT_EQ(out.str(), "1\n");
}

TEST(ErrorTest, DefinitionsBeforeAnErrorRemain) {
    std::ostringstream out;
    Evaluator evaluator(out);
    EXPECT_THROW(evaluator.evaluate_program(parse_all("(define a 1) (head '())")), LispError);
    EXPECT_TRUE(evaluator.global()->has("a"));
}

TEST(ErrorTest, ParseErrorIsNotALispError) {
    try {
        parse("(1 2");
        FAIL() << "expected ParseError";
    } catch (const LispError&) {
        FAIL() << "ParseError must not be a LispError";
    } catch (const ParseError& e) {
        EXPECT_NE(std::string(e.what()).find("Expected ')'"), std::string::npos);
    }
}

TEST(ErrorTest, ErrorKindNames) {
    EXPECT_STREQ(error_kind_name(ErrorKind::Arity), "ArityError");
    EXPECT_STREQ(error_kind_name(ErrorKind::Type), "TypeError");
    EXPECT_STREQ(error_kind_name(ErrorKind::EmptyList), "EmptyListError");
    EXPECT_STREQ(error_kind_name(ErrorKind::UnboundSymbol), "UnboundSymbolError");
    EXPECT_STREQ(error_kind_name(ErrorKind::NotCallable), "NotCallableError");
    EXPECT_STREQ(error_kind_name(ErrorKind::InvalidAST), "InvalidASTError");
    EXPECT_STREQ(error_kind_name(ErrorKind::DivisionByZero), "DivisionByZeroError");
}

TEST(ErrorTest, CommandTableNamesRoundTrip) {
    const char* names[] = {"quote", "atom", "eq", "if", "define", "lambda", "print",
        "+", "-", "*", "/", "mod", ">", "<", "cons", "head", "tail", "empty"};
    for (const char* name : names) {
        auto cmd = lookup_command(name);
        ASSERT_TRUE(cmd.has_value()) << name;
        EXPECT_STREQ(command_name(*cmd), name);
    }
    EXPECT_EQ(command_arity(Command::If), 3u);
    EXPECT_EQ(command_arity(Command::Empty), 1u);
    EXPECT_EQ(command_family(Command::Mod), CommandFamily::Arithmetic);
    EXPECT_EQ(command_family(Command::Cons), CommandFamily::ListOp);
    EXPECT_FALSE(lookup_command("fact").has_value());
}
