#include <gtest/gtest.h>

#include <sstream>

#include "evaluator.hpp"
#include "parser.hpp"
#include "printer.hpp"

namespace {

// Evaluates all forms of `src` in one evaluator, collecting print output.
struct Session {
    std::ostringstream out;
    Evaluator evaluator{out};

    Value run(const std::string& src) {
        return evaluator.evaluate_program(parse_all(src));
    }
};

Integer asInt(const Value& v) {
    EXPECT_TRUE(is_integer(v)) << unparse(v);
    return is_integer(v) ? std::get<Integer>(v) : 0;
}

}  // namespace

TEST(ClosureTest, LambdaBuildsClosure) {
    Session s;
    Value v = s.run("(lambda (x y) (+ x y))");
    ASSERT_TRUE(is_closure(v));
    const ClosurePtr& fn = std::get<ClosurePtr>(v);
    EXPECT_EQ(fn->arity(), 2u);
    EXPECT_EQ(fn->params[0].name, "x");
    EXPECT_EQ(fn->params[1].name, "y");
    EXPECT_EQ(unparse(fn->body), "(+ x y)");
    EXPECT_EQ(fn->env, s.evaluator.global());
}

TEST(ClosureTest, LambdaDoesNotEvaluateBody) {
    Session s;
    EXPECT_NO_THROW(s.run("(lambda (x) (print undefined-symbol))"));
    EXPECT_EQ(s.out.str(), "");
}

TEST(ClosureTest, AnonymousApplication) {
    Session s;
    EXPECT_EQ(asInt(s.run("((lambda (x) (* x x)) 5)")), 25);
}

TEST(ClosureTest, NamedApplication) {
    Session s;
    EXPECT_EQ(asInt(s.run("(define sq (lambda (x) (* x x))) (sq 4)")), 16);
}

TEST(ClosureTest, ClosureValueInHeadPosition) {
    Session s;
    Value fn = s.run("(lambda (x) (+ x 1))");
    Value form = make_list({fn, make_integer(41)});
    EXPECT_EQ(asInt(s.evaluator.evaluate(form, s.evaluator.global())), 42);
}

TEST(ClosureTest, CapturesDefiningEnvironment) {
    Session s;
    Value v = s.run(
        "(define make-adder (lambda (n) (lambda (x) (+ x n))))\n"
        "(define add3 (make-adder 3))\n"
        "(define add10 (make-adder 10))\n"
        "(+ (add3 4) (add10 4))\n");
    EXPECT_EQ(asInt(v), 7 + 14);
}

TEST(ClosureTest, SeesLaterDefinitionsInSharedEnvironment) {
    Session s;
    EXPECT_EQ(asInt(s.run(
                  "(define f (lambda (x) (+ x y)))\n"
                  "(define y 10)\n"
                  "(f 1)\n")),
        11);
    EXPECT_EQ(asInt(s.run("(define y 100) (f 1)")), 101);
}

TEST(ClosureTest, ParametersShadowOuterBindings) {
    Session s;
    EXPECT_EQ(asInt(s.run("(define x 1) (define f (lambda (x) x)) (f 2)")), 2);
    EXPECT_EQ(asInt(s.run("x")), 1);
}

TEST(ClosureTest, DefineInsideBodyIsLocalToTheCall) {
    Session s;
    s.run("(define g (lambda (x) (define z x))) (g 5)");
    EXPECT_FALSE(s.evaluator.global()->has("z"));
}

TEST(ClosureTest, ArgumentsEvaluatedLeftToRightInCallerEnvironment) {
    Session s;
    Value v = s.run(
        "(define add (lambda (a b) (+ a b)))\n"
        "(define a 100)\n"
        "(add (print 1) (print a))\n");
    EXPECT_EQ(s.out.str(), "1\n100\n");
    EXPECT_EQ(asInt(v), 101);
}

TEST(ClosureTest, ZeroParameterLambdaRunsAtDefinition) {
    Session s;
    s.run("(define n 5) (define t (lambda () (print n)))");
    EXPECT_EQ(s.out.str(), "5\n");
    EXPECT_EQ(asInt(s.run("t")), 5);
}

TEST(ClosureTest, HigherOrderFunctions) {
    Session s;
    Value v = s.run(
        "(define twice (lambda (f x) (f (f x))))\n"
        "(twice (lambda (n) (* n 2)) 3)\n");
    EXPECT_EQ(asInt(v), 12);
}

TEST(ClosureTest, MutualRecursionThroughGlobalDefinitions) {
    Session s;
    Value v = s.run(
        "(define even (lambda (n) (if (eq n 0) #t (odd (- n 1)))))\n"
        "(define odd (lambda (n) (if (eq n 0) #f (even (- n 1)))))\n"
        "(even 10)\n");
    ASSERT_TRUE(is_boolean(v));
    EXPECT_TRUE(std::get<bool>(v));
}

TEST(ClosureTest, RecursiveListFunctions) {
    Session s;
    Value v = s.run(
        "(define len (lambda (l) (if (empty l) 0 (+ 1 (len (tail l))))))\n"
        "(define map (lambda (f l) (if (empty l) '() (cons (f (head l)) (map f (tail l))))))\n"
        "(print (len '(a b c d)))\n"
        "(map (lambda (x) (* x x)) '(1 2 3))\n");
    EXPECT_EQ(s.out.str(), "4\n");
    EXPECT_EQ(unparse(v), "(1 4 9)");
}

TEST(ClosureTest, Fibonacci) {
    Session s;
    Value v = s.run(
        "(define fib (lambda (n) (if (< n 2) n (+ (fib (- n 1)) (fib (- n 2))))))\n"
        "(fib 15)\n");
    EXPECT_EQ(asInt(v), 610);
}

TEST(ClosureTest, RepeatedParameterKeepsLastArgument) {
    Session s;
    EXPECT_EQ(asInt(s.run("((lambda (x x) x) 1 2)")), 2);
}

TEST(ClosureTest, ClosuresCompareByIdentity) {
    Session s;
    s.run("(define f (lambda (x) x)) (define g (lambda (x) x))");
    Value same = s.run("(eq f f)");
    Value different = s.run("(eq f g)");
    ASSERT_TRUE(is_boolean(same));
    ASSERT_TRUE(is_boolean(different));
    EXPECT_TRUE(std::get<bool>(same));
    EXPECT_FALSE(std::get<bool>(different));
}
