// Language tests: evaluate programs in a freshly bootstrapped federation
#include <smriti/smriti.hpp>
#include <cassert>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <iterator>
#include <limits>
#include <sstream>

using namespace smriti;

Sexp num(int64_t v) { return Sexp(Number::integer(v)); }

Config fresh_config(const std::string& name) {
    Config c;
    c.base_dir = "/tmp/smriti_lang_test_" + name;
    c.save_on_exit = false;
    std::filesystem::remove_all(c.base_dir);
    return c;
}

void cleanup(const Config& c) {
    std::filesystem::remove_all(c.base_dir);
}

template <typename F>
bool throws_lang(F&& f, LangError::Type type) {
    try {
        f();
    } catch (const Error& e) {
        return e.is_lang(type);
    }
    return false;
}

void test_arithmetic() {
    std::cout << "Testing arithmetic..." << std::endl;
    Config config = fresh_config("arith");
    Session s(config);

    assert(s.run_text("(+ 1 2)") == num(3));
    assert(s.run_text("(* (+ 1 1) 3)") == num(6));
    assert(s.run_text("(/ (- 1 1) 2)") == num(0));
    assert(s.run_text("(/ 7 2)") == num(3));
    assert(s.run_text("(+ 1u8 2u8)") == Sexp(Number::unsigned_of(Number::Width::U8, 3)));
    assert(s.run_text("(* 2.5 2.)") == Sexp(Number::real(5.0)));
    assert(throws_lang([&s] { s.run_text("(/ 1 0)"); }, LangError::Type::InvalidArgument));
    assert(throws_lang([&s] { s.run_text("(+ 1 \"two\")"); }, LangError::Type::InvalidArgument));

    // Results outside the representable range are errors, not crashes
    assert(throws_lang([&s] { s.run_text("(/ -9223372036854775808 -1)"); },
                       LangError::Type::InvalidArgument));
    assert(throws_lang([&s] { s.run_text("(+ 9223372036854775807 1)"); },
                       LangError::Type::InvalidArgument));
    assert(throws_lang([&s] { s.run_text("(* 4611686018427387904 2)"); },
                       LangError::Type::InvalidArgument));
    assert(throws_lang([&s] { s.run_text("(* 1e308 10.)"); }, LangError::Type::InvalidArgument));
    assert(throws_lang([&s] { s.run_text("(/ 0. 0.)"); }, LangError::Type::InvalidArgument));
    assert(s.run_text("(- -9223372036854775807 1)") ==
           Sexp(Number::integer(std::numeric_limits<int64_t>::min())));

    cleanup(config);
    std::cout << "  PASS" << std::endl;
}

void test_lambda() {
    std::cout << "Testing lambda application..." << std::endl;
    Config config = fresh_config("lambda");
    Session s(config);

    assert(s.run_text("((lambda (a) (+ a a)) 4)") == num(8));
    assert(s.run_text("((lambda (a) a) 4)") == num(4));
    assert(s.run_text("((lambda (a b) (- a b)) 10 3)") == num(7));
    assert(s.run_text("((lambda () 1 2 3))") == num(3));

    assert(throws_lang([&s] { s.run_text("((lambda (a) a) 1 2)"); },
                       LangError::Type::WrongArgumentCount));
    assert(throws_lang([&s] { s.run_text("(lambda (a a) a)"); },
                       LangError::Type::InvalidArgument));
    assert(throws_lang([&s] { s.run_text("(lambda (1) 1)"); },
                       LangError::Type::InvalidArgument));

    cleanup(config);
    std::cout << "  PASS" << std::endl;
}

void test_letrec() {
    std::cout << "Testing letrec..." << std::endl;
    Config config = fresh_config("letrec");
    Session s(config);
    const LangContext& lang = s.agent().lang();

    Sexp result = s.run_text(
        "(letrec ((e (lambda (n) (if (eq 0 n) true (o (- n 1)))))"
        "         (o (lambda (n) (if (eq 0 n) false (e (- n 1))))))"
        "  (cons (e 99) (o 33)))");
    assert(result == make_pair(Sexp(lang.false_node()), Sexp(lang.true_node())));
    assert(s.to_string(result) == "(false . true)");

    assert(s.run_text("(let ((a 1) (b 2)) (+ a b))") == num(3));
    assert(throws_lang([&s] { s.run_text("(let ((a 1) (a 2)) a)"); },
                       LangError::Type::InvalidArgument));
    assert(throws_lang([&s] { s.run_text("(if 1 2 3)"); }, LangError::Type::InvalidArgument));

    cleanup(config);
    std::cout << "  PASS" << std::endl;
}

void test_def() {
    std::cout << "Testing def..." << std::endl;
    Config config = fresh_config("def");
    Session s(config);

    assert(s.run_text("(def fact (lambda (n) (if (eq n 1) 1 (* n (fact (- n 1))))))"
                      "(fact 4)") == num(24));
    assert(s.run_text("(fact 5)") == num(120));

    // def names a node in the working env
    Node fact = s.agent().resolve(Symbol("fact"));
    assert(fact.env == s.manager().working_env());
    assert(s.agent().lookup_designation(fact) == Symbol("fact"));

    assert(throws_lang([&s] { s.run_text("(def fact 1)"); }, LangError::Type::AlreadyBoundSymbol));
    assert(throws_lang([&s] { s.run_text("(def car 1)"); }, LangError::Type::AlreadyBoundSymbol));
    assert(throws_lang([&s] { s.run_text("not-defined-anywhere"); }, LangError::Type::UnboundSymbol));

    // Bare def and anonymous nodes
    Sexp atom = s.run_text("(def atom)");
    assert(atom.is<Node>());
    assert(s.run_text("atom") == atom);
    Sexp anon = s.run_text("(node 42)");
    assert(anon.is<Node>());
    assert(*s.agent().structure_of(*anon.as<Node>()) == num(42));

    // set! replaces a structure
    s.run_text("(def counter 1)");
    s.run_text("(set! counter 2)");
    assert(s.run_text("counter") == num(2));

    cleanup(config);
    std::cout << "  PASS" << std::endl;
}

void test_quote_and_lists() {
    std::cout << "Testing quote and lists..." << std::endl;
    Config config = fresh_config("lists");
    Session s(config);

    assert(s.run_text("'(1 2 3)") == make_list({num(1), num(2), num(3)}));
    assert(s.run_text("(car '(1 2 3))") == num(1));
    assert(s.run_text("(cdr '(1 2 3))") == make_list({num(2), num(3)}));
    assert(s.run_text("(cons 1 '())") == make_list({num(1)}));
    assert(s.run_text("(cons 1 2)") == make_pair(num(1), num(2)));
    assert(s.run_text("(list-len '(a b c))") == Sexp(Number::usize(3)));
    assert(throws_lang([&s] { s.run_text("(car '())"); }, LangError::Type::InvalidArgument));
    assert(throws_lang([&s] { s.run_text("(list-len '(1 . 2))"); }, LangError::Type::InvalidArgument));

    cleanup(config);
    std::cout << "  PASS" << std::endl;
}

void test_fexpr() {
    std::cout << "Testing fexpr..." << std::endl;
    Config config = fresh_config("fexpr");
    Session s(config);

    // Arguments arrive unlowered
    assert(s.run_text("((fexpr (x) x) (+ 1 2))") == parse_all("(+ 1 2)").front());
    assert(s.run_text("(def unevaluated (fexpr (x) x))"
                      "(unevaluated (no such call))") == parse_all("(no such call)").front());
    // eval lowers and runs a datum
    assert(s.run_text("(eval '(+ 1 2))") == num(3));
    assert(s.run_text("(apply + '(1 2 3))") == num(6));

    cleanup(config);
    std::cout << "  PASS" << std::endl;
}

void test_lexical_shadowing() {
    std::cout << "Testing lexical shadowing..." << std::endl;
    Config config = fresh_config("shadow");
    Session s(config);

    s.run_text("(def v 1)");
    assert(s.run_text("((lambda (v) v) 5)") == num(5));
    assert(s.run_text("(let ((v 7)) (+ v 1))") == num(8));
    assert(s.run_text("((lambda (v) ((lambda (v) v) 9)) 5)") == num(9));
    assert(s.run_text("v") == num(1));

    cleanup(config);
    std::cout << "  PASS" << std::endl;
}

void test_lowering_is_pure() {
    std::cout << "Testing lowering writes only the impl env..." << std::endl;
    Config config = fresh_config("lowering");
    Session s(config);
    MetaEnv& meta = *s.manager().meta();

    const Environment& working = *meta.env(s.manager().working_env());
    const Environment& impl = *meta.env(s.manager().impl_env());
    size_t working_nodes = working.node_count();
    size_t working_triples = working.triple_count();
    size_t impl_nodes = impl.node_count();

    Sexp lowered = s.syntax().interpret(parse_all("(lambda (a) (+ a 1))").front());
    const Procedure* proc = lowered.as<Procedure>();
    assert(proc && proc->type == Procedure::Type::Abstraction);
    assert(proc->params.size() == 1 && proc->params[0].env == s.manager().impl_env());

    assert(working.node_count() == working_nodes);
    assert(working.triple_count() == working_triples);
    assert(impl.node_count() > impl_nodes);

    // Running the same lowered code twice gives the same result
    Node meaning = s.syntax().node_or_insert(s.syntax().interpret(parse_all("(* 6 7)").front()));
    assert(s.exec().exec(meaning) == num(42));
    assert(s.exec().exec(meaning) == num(42));

    // Top-level meanings land in the history env
    size_t history_nodes = meta.env(s.manager().history_env())->node_count();
    s.run_text("(+ 1 1)");
    assert(meta.env(s.manager().history_env())->node_count() == history_nodes + 1);

    cleanup(config);
    std::cout << "  PASS" << std::endl;
}

void test_triples() {
    std::cout << "Testing tell and ask..." << std::endl;
    Config config = fresh_config("triples");
    Session s(config);

    s.run_text("(def a) (def rel)");
    Sexp t = s.run_text("(tell a rel a)");
    assert(t.is<Node>() && t.as<Node>()->local.is_triple());
    assert(s.to_string(t) == "(a rel a)");

    bool duplicate = false;
    try {
        s.run_text("(tell a rel a)");
    } catch (const Error& e) {
        duplicate = e.is_lang(LangError::Type::DuplicateTriple);
        assert(s.agent().sexp_to_string(e.reify()).find("DuplicateTriple") != std::string::npos);
    }
    assert(duplicate);

    s.run_text("(def x) (def y) (def likes) (tell x likes y) (tell y likes x)");
    assert(s.run_text("(ask _ likes _)").proper_length() == 2u);
    assert(s.run_text("(ask x likes _)").proper_length() == 1u);
    assert(s.run_text("(ask x likes x)").proper_length() == 0u);
    assert(s.run_text("(ask _ _ _)").proper_length() ==
           s.agent().env().triple_count());

    // Triples using a node in any role
    Node x = s.agent().resolve(Symbol("x"));
    Node likes = s.agent().resolve(Symbol("likes"));
    assert(s.agent().ask_any(x).size() == 2);
    assert(s.agent().ask_any(likes).size() == 2);
    assert(s.agent().ask_any(s.agent().resolve(Symbol("a"))).size() == 1);

    // Patterns may not name nodes of other envs
    assert(throws_lang([&s] { s.run_text("(ask car _ _)"); }, LangError::Type::Unsupported));

    cleanup(config);
    std::cout << "  PASS" << std::endl;
}

void test_jump_and_import() {
    std::cout << "Testing jump and import..." << std::endl;
    Config config = fresh_config("import");
    Session s(config);
    const LangContext& lang = s.agent().lang();

    assert(s.run_text("(eq lambda (import lambda))") == Sexp(lang.false_node()));
    assert(s.run_text("(jump (import lambda))(eq (curr) (import lambda))") == Sexp(lang.true_node()));
    s.agent().jump_env(s.manager().working_env());

    // Import is idempotent and lands in the current env
    Agent& agent = s.agent();
    Node lam = agent.resolve(Symbol("lambda"));
    Node first = agent.import(lam);
    assert(first.env == agent.pos().env);
    assert(agent.import(lam) == first);
    assert(agent.import(first) == first);
    assert(agent.get_imported(lam, agent.pos().env) == first);
    assert(*agent.structure_of(first) == Sexp(lam));

    // env_find and env-jump move between envs
    Sexp lang_env = s.run_text("(env_find \"lang.env\")");
    assert(lang_env == Sexp(Node(LocalNode(0), s.manager().lang_env())));
    assert(s.run_text("(env_find \"missing.env\")").is_nil());
    s.run_text("(env-jump (env_find \"lang.env\"))");
    assert(agent.pos() == Node(s.manager().lang_env(), env_prelude::self_env()));
    agent.jump_env(s.manager().working_env());

    cleanup(config);
    std::cout << "  PASS" << std::endl;
}

void test_tell_handler() {
    std::cout << "Testing tell handler..." << std::endl;
    Config config = fresh_config("handler");
    Session s(config);
    const LangContext& lang = s.agent().lang();

    s.run_text("(def a) (def b) (def is)");
    s.run_text("(set! tell_handler (lambda (s p o) (eq s o)))");
    assert(s.run_text("(tell a is a)").is<Node>());

    bool rejected = false;
    try {
        s.run_text("(tell a is b)");
    } catch (const Error& e) {
        const LangError* le = e.lang_error();
        rejected = le && le->type == LangError::Type::RejectedTriple &&
                   le->reason == Sexp(lang.false_node());
    }
    assert(rejected);
    assert(s.run_text("(ask a is b)").proper_length() == 0u);

    // A refused tell of a node from another env leaves no import behind
    Agent& agent = s.agent();
    const Environment& working = *s.manager().meta()->env(s.manager().working_env());
    Node a = agent.resolve(Symbol("a"));
    Node is = agent.resolve(Symbol("is"));
    Node lam = agent.resolve(Symbol("lambda"));
    size_t nodes_before = working.node_count();
    assert(throws_lang([&] { agent.tell(a, is, lam); }, LangError::Type::RejectedTriple));
    assert(working.node_count() == nodes_before);
    assert(!agent.get_imported(lam, s.manager().working_env()));

    // Clearing the handler accepts everything again
    s.run_text("(set! tell_handler)");
    assert(s.run_text("(tell a is b)").is<Node>());

    Node told = agent.tell(a, is, lam);
    assert(told.env == s.manager().working_env());
    size_t nodes_after = working.node_count();
    assert(throws_lang([&] { agent.tell(a, is, lam); }, LangError::Type::DuplicateTriple));
    assert(working.node_count() == nodes_after);

    cleanup(config);
    std::cout << "  PASS" << std::endl;
}

void test_error_trace() {
    std::cout << "Testing error state..." << std::endl;
    Config config = fresh_config("trace");
    Session s(config);

    try {
        s.run_text("((lambda (a) (car a)) 1)");
        assert(false);
    } catch (const Error& e) {
        assert(e.is_lang(LangError::Type::InvalidArgument));
        assert(e.has_state());
        assert(e.state()->depth() > 1);
    }
    // Frames are popped after a failure
    assert(s.agent().exec_state().depth() == 1);

    cleanup(config);
    std::cout << "  PASS" << std::endl;
}

void test_exec_print_and_fork() {
    std::cout << "Testing exec, printing and fork..." << std::endl;
    Config config = fresh_config("print");
    Session s(config);

    // exec lowers without running; eval lowers and runs
    assert(s.run_text("(exec '(+ 1 2))").is<Procedure>());
    assert(s.run_text("(eval '(+ 1 2))") == num(3));

    // Designated nodes print by name, long lists are cut short
    Sexp foo = s.run_text("(def foo)");
    assert(s.to_string(foo) == "foo");
    std::string long_list = "'(";
    for (int i = 0; i < 70; ++i) long_list += std::to_string(i) + " ";
    long_list += ")";
    std::string printed = s.to_string(s.run_text(long_list));
    assert(printed.find("...") != std::string::npos);
    assert(printed.find("69") == std::string::npos);

    std::ostringstream captured;
    std::streambuf* old = std::cout.rdbuf(captured.rdbuf());
    s.run_text("(println \"x\" foo 7)");
    std::cout.rdbuf(old);
    assert(captured.str() == "x foo 7\n");

    try {
        s.run_text("((lambda (a) (car a)) 1)");
        assert(false);
    } catch (const Error& e) {
        std::ostringstream trace;
        s.agent().trace_error(trace, e);
        assert(trace.str().find("--TRACE--") != std::string::npos);
    }

    // A fork shares the federation and starts at the same position
    Agent forked = s.agent().fork();
    assert(&forked.meta() == &s.agent().meta());
    assert(forked.pos() == s.agent().pos());
    assert(forked.resolve(Symbol("foo")) == *foo.as<Node>());
    forked.jump_env(s.manager().lang_env());
    assert(s.agent().pos().env == s.manager().working_env());

    cleanup(config);
    std::cout << "  PASS" << std::endl;
}

void test_lang_context_roundtrip() {
    std::cout << "Testing LangContext reify/reflect..." << std::endl;
    Config config = fresh_config("langctx");
    Session s(config);

    const LangContext& lang = s.agent().lang();
    Sexp reified = lang.reify();
    assert(LangContext::reflect(reified) == lang);
    // Survives printing and reparsing with sigils
    Sexp reread = parse_all(reified.to_string(), policy_env_serde).front();
    assert(LangContext::reflect(reread) == lang);

    cleanup(config);
    std::cout << "  PASS" << std::endl;
}

void assert_same_env(const Environment& a, const Environment& b) {
    assert(a.node_count() == b.node_count());
    assert(a.triple_count() == b.triple_count());
    for (const auto& t : a.match_all()) {
        assert(a.triple_subject(t) == b.triple_subject(t));
        assert(a.triple_predicate(t) == b.triple_predicate(t));
        assert(a.triple_object(t) == b.triple_object(t));
    }
    assert(a.designation_contexts() == b.designation_contexts());
    for (const auto& ctx : a.designation_contexts()) {
        assert(a.designation_pairs(ctx) == b.designation_pairs(ctx));
    }
    for (const auto& n : a.all_nodes()) {
        if (n == env_prelude::self_des()) continue;
        const Sexp* x = a.structure(n);
        const Sexp* y = b.structure(n);
        assert((x == nullptr) == (y == nullptr));
        if (x) assert(*x == *y);
    }
}

void test_serialize_reload() {
    std::cout << "Testing serialize and reload..." << std::endl;
    Config config = fresh_config("reload");

    {
        Session s(config);
        s.run_text("(def fact (lambda (n) (if (eq n 1) 1 (* n (fact (- n 1))))))");
        s.run_text("(def greeting \"hello\\n\")");
        s.run_text("(def ratio 2.5)");
        s.run_text("(def big (* 1e308 1.5))");
        s.run_text("(def third (/ 1. 3.))");
        s.run_text("(def narrow 0.1f32)");
        s.run_text("(def nested '(1 (2 . 3) \"x\" ()))");
        s.run_text("(def a) (def rel) (tell a rel a)");
        s.run_text("(def b) (def meta-fact (tell (tell a rel b) rel a))");
        s.run_text("(import lambda)");
        s.save();

        Session reloaded(config);
        assert(!reloaded.manager().fresh());
        assert(reloaded.agent().lang() == s.agent().lang());

        const MetaEnv& before = *s.manager().meta();
        const MetaEnv& after = *reloaded.manager().meta();
        assert(before.env_nodes() == after.env_nodes());
        assert_same_env(before.base(), after.base());
        for (const auto& env : before.env_nodes()) {
            assert_same_env(*before.env(env), *after.env(env));
        }

        assert(reloaded.run_text("(fact 5)") == num(120));
        assert(reloaded.run_text("greeting") == Sexp(LangString("hello\n")));
        assert(reloaded.run_text("nested") == s.run_text("nested"));
        // Floats come back as the same numbers
        assert(reloaded.run_text("(+ big 1.)") == s.run_text("(+ big 1.)"));
        assert(reloaded.run_text("third") == s.run_text("third"));
        assert(reloaded.run_text("narrow") == s.run_text("narrow"));
        assert(reloaded.run_text("narrow").as<Number>()->width() == Number::Width::F32);
    }

    // A second save of the reloaded federation is byte-identical
    {
        Session s(config);
        std::string out_dir = config.base_dir + "/copy";
        s.manager().serialize_full(out_dir, {});
        for (const auto& [env, path] : s.manager().serialized_envs()) {
            std::ifstream a(config.path_of(path));
            std::ifstream b(out_dir + "/" + path);
            std::string x((std::istreambuf_iterator<char>(a)), std::istreambuf_iterator<char>());
            std::string y((std::istreambuf_iterator<char>(b)), std::istreambuf_iterator<char>());
            assert(!x.empty() && x == y);
        }
    }

    cleanup(config);
    std::cout << "  PASS" << std::endl;
}

void test_blacklist_and_missing_env() {
    std::cout << "Testing blacklist and missing env files..." << std::endl;
    Config config = fresh_config("blacklist");
    config.serialize_blacklist.insert(config.history_file);

    {
        Session s(config);
        s.run_text("(def kept 1)");
        s.save();
    }
    assert(!std::filesystem::exists(config.path_of(config.history_file)));
    assert(std::filesystem::exists(config.path_of(config.working_file)));

    // The history env comes back empty; the rest reloads
    Session s(config);
    assert(s.manager().meta()->env(s.manager().history_env())->node_count() ==
           env_prelude::PRELUDE_SIZE);
    assert(s.run_text("kept") == num(1));

    cleanup(config);
    std::cout << "  PASS" << std::endl;
}

void test_corrupt_env_file() {
    std::cout << "Testing corrupt env files..." << std::endl;
    Config config = fresh_config("corrupt");
    {
        Session s(config);
        s.save();
    }

    {
        std::ofstream out(config.path_of(config.working_file));
        out << "(header (version \"9.0.0\") (node-count 10) (triple-count 0))\n(nodes)\n(triples)\n";
    }
    bool incompatible = false;
    try {
        Session s(config);
    } catch (const Error& e) {
        const auto* de = std::get_if<DeserializeError>(&e.kind());
        incompatible = de && de->type == DeserializeError::Type::IncompatibleVersion;
    }
    assert(incompatible);

    {
        std::ofstream out(config.path_of(config.working_file));
        out << "(header (version \"1.0.0\") (node-count 10) (triple-count 0))\n(triples)\n";
    }
    bool missing_nodes = false;
    try {
        Session s(config);
    } catch (const Error& e) {
        const auto* de = std::get_if<DeserializeError>(&e.kind());
        missing_nodes = de && de->type == DeserializeError::Type::MissingNodeSection;
    }
    assert(missing_nodes);

    cleanup(config);
    std::cout << "  PASS" << std::endl;
}

int main() {
    std::cout << "=== smriti Language Tests ===" << std::endl;
    std::cout << std::endl;

    test_arithmetic();
    test_lambda();
    test_letrec();
    test_def();
    test_quote_and_lists();
    test_fexpr();
    test_lexical_shadowing();
    test_lowering_is_pure();
    test_triples();
    test_jump_and_import();
    test_tell_handler();
    test_error_trace();
    test_exec_print_and_fork();
    test_lang_context_roundtrip();
    test_serialize_reload();
    test_blacklist_and_missing_env();
    test_corrupt_env_file();

    std::cout << std::endl;
    std::cout << "=== All tests passed! ===" << std::endl;
    return 0;
}
