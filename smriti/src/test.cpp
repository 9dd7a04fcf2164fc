#include <smriti/smriti.hpp>
#include <iostream>
#include <limits>
#include <cassert>
#include <sstream>

using namespace smriti;

Sexp num(int64_t v) { return Sexp(Number::integer(v)); }

template <typename F>
bool throws_parse(F&& f, ParseError::Reason reason) {
    try {
        f();
    } catch (const Error& e) {
        const auto* pe = std::get_if<ParseError>(&e.kind());
        return pe && pe->reason == reason;
    }
    return false;
}

template <typename F>
bool throws_deserialize(F&& f, DeserializeError::Type type) {
    try {
        f();
    } catch (const Error& e) {
        const auto* de = std::get_if<DeserializeError>(&e.kind());
        return de && de->type == type;
    }
    return false;
}

void test_number() {
    std::cout << "Testing Number..." << std::endl;

    auto five = Number::parse("5");
    assert(five && five->width() == Number::Width::I64 && five->as_i64() == 5);
    auto half = Number::parse("2.5");
    assert(half && half->is_float() && half->as_f64() == 2.5);
    auto wide = Number::parse("5u64");
    assert(wide && wide->width() == Number::Width::U64);
    assert(wide->to_string(true) == "5u64");
    assert(five->to_string(true) == "5");
    assert(!Number::parse("abc"));
    assert(!Number::parse("-"));

    // Mixed integer widths widen to I64
    auto a = wide->apply('+', Number::integer(2));
    assert(a && a->width() == Number::Width::I64 && a->as_i64() == 7);

    // Integer division truncates
    auto q = Number::integer(7).apply('/', Number::integer(2));
    assert(q && q->as_i64() == 3);

    // Overflow and non-finite results are refused
    const Number min = Number::integer(std::numeric_limits<int64_t>::min());
    const Number max = Number::integer(std::numeric_limits<int64_t>::max());
    assert(!min.apply('/', Number::integer(-1)));
    assert(!max.apply('+', Number::integer(1)));
    assert(!min.apply('-', Number::integer(1)));
    assert(!max.apply('*', Number::integer(2)));
    assert(!Number::integer(1).apply('/', Number::integer(0)));
    assert(!Number::real(1e308).apply('*', Number::real(10.0)));
    assert(!Number::real(0.0).apply('/', Number::real(0.0)));
    assert(!Number::parse("1e39f32"));
    assert(!Number::parse("inf"));

    // Integral floats still read back as floats
    Number three = Number::real(3.0);
    auto reread = Number::parse(three.to_string(true));
    assert(reread && reread->is_float() && *reread == three);

    std::cout << "  PASS" << std::endl;
}

void test_tokenizer() {
    std::cout << "Testing Tokenizer..." << std::endl;

    Tokenizer t;
    t.feed_line("(a \"b\\n\" 1.5) ; note");
    std::vector<Token> tokens;
    while (t.ready()) tokens.push_back(t.pop());
    assert(tokens.size() == 6);
    assert(tokens[0].kind == Token::Kind::LeftParen);
    assert(tokens[1].kind == Token::Kind::Primitive && tokens[1].value == sym("a"));
    assert(tokens[2].value == Sexp(LangString("b\n")));
    assert(tokens[3].value == Sexp(Number::real(1.5)));
    assert(tokens[4].kind == Token::Kind::RightParen);
    assert(tokens[5].kind == Token::Kind::Comment);

    // A string continues across fed lines
    Tokenizer multi;
    multi.feed_line("\"one");
    assert(multi.in_string());
    assert(!multi.ready());
    multi.feed_line("two\"");
    assert(multi.ready());
    assert(multi.pop().value == Sexp(LangString("one\ntwo")));

    Tokenizer open;
    open.feed_line("\"never closed");
    bool unterminated = false;
    try {
        open.finish();
    } catch (const Error& e) {
        const auto* te = std::get_if<TokenizeError>(&e.kind());
        unterminated = te && te->type == TokenizeError::Type::UnterminatedString;
    }
    assert(unterminated);

    // Reserved names only pass the admin policy
    bool rejected = false;
    try {
        parse_all("__imports");
    } catch (const Error& e) {
        const auto* te = std::get_if<TokenizeError>(&e.kind());
        rejected = te && te->type == TokenizeError::Type::InvalidSymbol;
    }
    assert(rejected);
    assert(parse_all("__imports", policy_admin).front() == sym("__imports"));

    std::cout << "  PASS" << std::endl;
}

void test_parser() {
    std::cout << "Testing Parser..." << std::endl;

    auto forms = parse_all("(1 2 . 3) 'x ()");
    assert(forms.size() == 3);
    assert(forms[0].to_string() == "(1 2 . 3)");
    assert(forms[0].proper_length() == std::nullopt);
    assert(forms[1] == make_list({sym("quote"), sym("x")}));
    assert(forms[2].is_nil());

    auto nested = parse_all("(a (b (c)) \"s\")");
    assert(nested.size() == 1);
    assert(nested[0].proper_length() == 3u);

    assert(throws_parse([] { parse_all(")"); }, ParseError::Reason::UnmatchedClose));
    assert(throws_parse([] { parse_all("(1 2"); }, ParseError::Reason::UnmatchedOpen));
    assert(throws_parse([] { parse_all("(. 1)"); }, ParseError::Reason::IsolatedPeriod));
    assert(throws_parse([] { parse_all("(1 . 2 3)"); }, ParseError::Reason::NotPenultimatePeriod));
    assert(throws_parse([] { parse_all("'"); }, ParseError::Reason::TrailingQuote));

    std::string deep(MAX_LIST_DEPTH + 1, '(');
    assert(throws_parse([&deep] { parse_all(deep); }, ParseError::Reason::DepthOverflow));

    // Stream parsing hands over each datum as it completes
    std::istringstream in("(a\n b) c\n");
    auto streamed = parse_stream(in);
    assert(streamed.size() == 2);
    assert(streamed[0] == make_list({sym("a"), sym("b")}));

    // Very long lists are copied, compared and released without deep recursion
    {
        std::string text = "(";
        for (int i = 0; i < 1000000; ++i) text += "1 ";
        text += ")";
        auto big = parse_all(text);
        assert(big.size() == 1);
        assert(big[0].proper_length() == 1000000u);
        Sexp copy = big[0];
        assert(copy == big[0]);
        copy.push_front(num(0));
        assert(copy != big[0]);
    }

    std::cout << "  PASS" << std::endl;
}

void test_sexp_printing() {
    std::cout << "Testing Sexp printing..." << std::endl;

    assert(make_list({num(1), num(2), num(3)}).to_string() == "(1 2 3)");
    assert(make_pair(sym("a"), num(2)).to_string() == "(a . 2)");
    assert(Sexp(LangString("q\"t\n")).to_string() == "\"q\\\"t\\n\"");
    assert(Sexp(Node(LocalNode(3), LocalNode(12))).to_string() == "^3^12");
    assert(Sexp().to_string() == "()");

    SexpWriter w;
    w.max_length = 2;
    std::ostringstream oss;
    write_sexp(oss, make_list({num(1), num(2), num(3)}), w);
    assert(oss.str() == "(1 2 ...)");

    Sexp list = make_list({num(2)});
    list.push_front(num(1));
    assert(list.to_string() == "(1 2)");

    std::cout << "  PASS" << std::endl;
}

void test_environment() {
    std::cout << "Testing Environment..." << std::endl;

    MemEnvironment env;
    for (int i = 0; i < 20; ++i) env.insert_node(std::nullopt);

    // Id density
    auto nodes = env.all_nodes();
    assert(nodes.size() == 20);
    for (size_t i = 0; i < nodes.size(); ++i) assert(nodes[i].id == i);

    LocalNode a(1), b(2), c(3);
    LocalTriple t0 = env.insert_triple(a, b, c);
    LocalTriple t1 = env.insert_triple(c, b, a);
    LocalTriple t2 = env.insert_triple(a, a, a);

    // Triple ids never collide with node ids
    for (const auto& t : {t0, t1, t2}) {
        assert(t.node().is_triple());
        assert(env.contains(t.node()));
        assert(t.node() != LocalNode(t.index()));
    }
    assert(t1.index() == 1);
    assert(env.node_as_triple(t1.node()) == t1);
    assert(!env.node_as_triple(a));

    // Edge consistency
    for (const auto& t : env.match_all()) {
        assert(env.match_subject(env.triple_subject(t)).count(t));
        assert(env.match_predicate(env.triple_predicate(t)).count(t));
        assert(env.match_object(env.triple_object(t)).count(t));
    }
    assert(env.match_but_object(a, b).size() == 1);
    assert(env.match_predicate(b).size() == 2);
    assert(env.match_any(a).size() == 3);
    assert(env.match_triple(c, b, a) == t1);
    assert(!env.match_triple(b, b, b));

    // Triples are nodes too
    LocalTriple meta = env.insert_triple(t0.node(), b, c);
    assert(env.triple_subject(meta) == t0.node());

    bool missing = false;
    try {
        env.insert_triple(a, b, LocalNode(999));
    } catch (const Error& e) {
        missing = e.is_lang(LangError::Type::InvalidArgument);
    }
    assert(missing);

    // Designation is a bijection per context
    LocalNode ctx(1);
    env.insert_designation(ctx, Symbol("x"), Node(LocalNode(5), a));
    env.insert_designation(ctx, Symbol("y"), Node(LocalNode(5), b));
    auto found = env.match_designation(ctx, Symbol("x"));
    assert(found && *found == Node(LocalNode(5), a));
    assert(env.find_designation(ctx, *found) == Symbol("x"));
    env.insert_designation(ctx, Symbol("x"), Node(LocalNode(5), c));
    assert(!env.find_designation(ctx, Node(LocalNode(5), a)));
    assert(env.designation_pairs(ctx).size() == 2);

    // Structures
    env.set_structure(c, num(42));
    assert(*env.structure(c) == num(42));
    {
        EntryMut entry = env.entry_mut(c);
        *entry.structure() = num(43);
    }
    assert(*env.structure(c) == num(43));
    assert(env.take_structure(c) == num(43));
    assert(env.structure(c) == nullptr);

    std::cout << "  PASS" << std::endl;
}

void test_meta_env() {
    std::cout << "Testing MetaEnv..." << std::endl;

    MetaEnv meta;
    assert(meta.base().node_count() == env_prelude::PRELUDE_SIZE);
    assert(*meta.base().structure(LocalNode(0)) == Sexp(Node(LocalNode(0), LocalNode(0))));

    LocalNode e = meta.insert_env();
    assert(e.id == env_prelude::PRELUDE_SIZE);
    assert(meta.is_env(e));
    Environment* env = meta.env(e);
    assert(env && env->node_count() == env_prelude::PRELUDE_SIZE);
    assert(*env->structure(env_prelude::self_env()) == Sexp(Node(LocalNode(0), e)));
    assert(env->structure(env_prelude::tell_handler()) == nullptr);
    assert(meta.env(LocalNode(0)) == &meta.base());
    assert(meta.env(LocalNode(77)) == nullptr);

    // The env hangs off its meta node, which itself stays atomic
    env->insert_node(num(1));
    assert(meta.env(e)->node_count() == env_prelude::PRELUDE_SIZE + 1);
    assert(meta.base().structure(e) == nullptr);
    assert(meta.env_nodes() == std::vector<LocalNode>{e});

    assert(env_prelude::from_name("tell_handler") == env_prelude::tell_handler());
    assert(std::string(env_prelude::name_of(env_prelude::self_des())) == "self_des");
    assert(!env_prelude::from_name("other"));

    std::cout << "  PASS" << std::endl;
}

void test_sigils() {
    std::cout << "Testing Sigils..." << std::endl;

    LocalNode here(4);
    auto local = parse_sigil("^12");
    assert(local && local->kind == Sigil::Kind::LocalNode);
    assert(local->node_in(here) == Node(here, LocalNode(12)));

    auto triple = parse_sigil("^t3");
    assert(triple && triple->kind == Sigil::Kind::LocalTriple);
    assert(triple->node_in(here) == Node(here, LocalTriple::from_index(3).node()));

    auto global = parse_sigil("^2^7");
    assert(global && global->node_in(here) == Node(LocalNode(2), LocalNode(7)));

    auto global_triple = parse_sigil("^2^t0");
    assert(global_triple && global_triple->kind == Sigil::Kind::Triple);
    assert(global_triple->node_in(here).local.is_triple());

    assert(!parse_sigil("^x"));
    assert(!parse_sigil("12"));
    assert(!parse_sigil("^1^2^3"));

    assert(policy_env_serde("^5^t2") == Symbol("^5^t2"));
    assert(policy_env_serde("lambda") == Symbol("lambda"));
    assert(!policy_base("^5"));

    // Sigils in files read back as the node they name
    assert(Deserializer::as_node(sym("^3"), here) == Node(here, LocalNode(3)));
    Sexp long_form = make_list({sym("Node"), make_pair(sym("env"), Number::u64(1)),
                                make_pair(sym("local"), Number::u64(9))});
    assert(Deserializer::as_node(long_form, here) == Node(LocalNode(1), LocalNode(9)));

    std::cout << "  PASS" << std::endl;
}

void test_serializer_forms() {
    std::cout << "Testing Serializer forms..." << std::endl;

    Serializer ser;
    ser.begin_struct("Point");
    ser.serialize_field("x", [](Serializer& s) { s.serialize_number(Number::integer(1)); });
    ser.serialize_field("y", [](Serializer& s) { s.serialize_number(Number::integer(2)); });
    ser.end_struct();
    assert(ser.finish().to_string() == "(Point (x . 1) (y . 2))");

    Serializer variant;
    variant.begin_struct_variant("Shape", "Circle");
    variant.serialize_field("r", [](Serializer& s) { s.serialize_number(Number::integer(3)); });
    variant.end_struct_variant();
    assert(variant.finish().to_string() == "((Shape . Circle) (r . 3))");

    Serializer map;
    map.begin_map();
    map.serialize_entry([](Serializer& s) { s.serialize_str("k"); },
                        [](Serializer& s) { s.serialize_bool(true); });
    map.end_map();
    assert(map.finish().to_string() == "((\"k\" . true))");

    Serializer unit;
    unit.serialize_unit_variant("Color", "Red");
    assert(unit.finish() == sym("Red"));

    Serializer none;
    none.serialize_none();
    assert(none.finish().is_nil());

    std::cout << "  PASS" << std::endl;
}

void test_structured_roundtrip() {
    std::cout << "Testing structured value round-trip..." << std::endl;

    LocalNode env(3);
    auto n = [&env](LocalId id) { return Node(env, LocalNode(id)); };

    std::vector<Procedure> procs = {
        Procedure::application(n(10), {n(11), n(12)}),
        Procedure::abstraction({n(13)}, n(14)),
        Procedure::interpreter_abstraction({}, n(15)),
        Procedure::sequence({n(16), Node(LocalNode(4), LocalNode(17))}),
        Procedure::branch(n(18), n(19), n(20)),
    };
    for (const auto& p : procs) {
        Sexp reified = *reify_structured(Primitive(p));
        assert(reflect_procedure(reified, env) == p);
    }
    assert(reify_structured(Primitive(procs[0]))->to_string() == "(Application ^3^10 (^3^11 ^3^12))");

    SymNodeTable names;
    names.insert(Symbol("a"), n(10));
    names.insert(Symbol("b"), n(11));
    Sexp table = *reify_structured(Primitive(names));
    assert(reflect_structured(table, env) == Sexp(names));

    LocalNodeTable imports(LocalNode(5));
    imports.insert(LocalNode(12), LocalNode(30));
    Sexp imported = *reify_structured(Primitive(imports));
    assert(reflect_local_node_table(imported) == imports);

    // Plain data is not structured
    assert(!reify_structured(Primitive(Number::integer(1))));
    assert(!reflect_structured(make_list({sym("point"), num(1)}), env));

    std::cout << "  PASS" << std::endl;
}

void test_env_header() {
    std::cout << "Testing EnvHeader..." << std::endl;

    MetaEnv meta;
    EnvHeader h = EnvHeader::from_env(meta.base());
    assert(h.node_count == env_prelude::PRELUDE_SIZE);
    h.extras.push_back(make_list({sym("author"), Sexp(LangString("someone"))}));

    Sexp reified = h.reify();
    Sexp reread = parse_all(reified.to_string(), policy_env_serde).front();
    EnvHeader back = EnvHeader::reflect(reread);
    assert(back.version == version::env_format());
    assert(back.node_count == h.node_count);
    assert(back.triple_count == 0);
    assert(back.extras.size() == 1 && back.extras[0] == h.extras[0]);

    assert(throws_deserialize([] {
        EnvHeader::reflect(parse_all("(header (version \"2.0.0\") (node-count 10) (triple-count 0))").front());
    }, DeserializeError::Type::IncompatibleVersion));
    assert(throws_deserialize([] {
        EnvHeader::reflect(parse_all("(header (version \"99999999999.0.0\") (node-count 10) (triple-count 0))").front());
    }, DeserializeError::Type::UnexpectedType));

    int major = 0, minor = 0, patch = 0;
    assert(version::parse_env_format("123456.0.7", major, minor, patch));
    assert(major == 123456 && minor == 0 && patch == 7);
    assert(!version::parse_env_format("1234567.0.0", major, minor, patch));
    assert(!version::parse_env_format("1..0", major, minor, patch));
    assert(throws_deserialize([] {
        EnvHeader::reflect(parse_all("(header (version \"1.0.0\") (node-count 10))").front());
    }, DeserializeError::Type::MissingData));
    assert(throws_deserialize([] {
        EnvHeader::reflect(parse_all("(nodes ^0)", policy_env_serde).front());
    }, DeserializeError::Type::MissingHeaderSection));

    major = 0; minor = 0; patch = 0;
    assert(version::parse_env_format("1.2.3", major, minor, patch));
    assert(major == 1 && minor == 2 && patch == 3);
    assert(!version::parse_env_format("1.2", major, minor, patch));

    std::cout << "  PASS" << std::endl;
}

void test_env_codec() {
    std::cout << "Testing env structure codec..." << std::endl;

    LocalNode env(6);
    Sexp data = make_list({Sexp(Node(env, LocalNode(11))), Sexp(*find_builtin("car")),
                           Sexp(LangPath("a/b.env")), make_pair(sym("k"), num(3))});
    Sexp encoded = env_codec::encode_structure(data);
    assert(encoded.cons() && encoded.cons()->car()->as<Symbol>()->str() == "quote");
    assert(env_codec::decode_structure(encoded, env) == data);

    Procedure p = Procedure::branch(Node(env, LocalNode(12)), Node(env, LocalNode(13)),
                                    Node(LocalNode(2), LocalNode(40)));
    Sexp proc = env_codec::encode_structure(Sexp(p));
    assert(env_codec::decode_structure(proc, env) == Sexp(p));

    // A procedure nested inside data survives too
    Sexp nested = make_list({num(1), Sexp(p)});
    assert(env_codec::decode_structure(env_codec::encode_structure(nested), env) == nested);

    assert(env_codec::decode_structure(Sexp(LangString("s")), env) == Sexp(LangString("s")));
    assert(env_codec::decode_structure(sym("^2^3"), env) == Sexp(Node(LocalNode(2), LocalNode(3))));

    assert(throws_deserialize([&env] {
        env_codec::decode_structure(parse_all("(__builtin nope)", policy_admin).front(), env);
    }, DeserializeError::Type::UnrecognizedBuiltIn));
    assert(throws_deserialize([&env] {
        env_codec::decode_structure(parse_all("(frobnicate 1)").front(), env);
    }, DeserializeError::Type::UnexpectedCommand));

    std::cout << "  PASS" << std::endl;
}

void test_errors() {
    std::cout << "Testing Error reification..." << std::endl;

    Error unbound = lang_error(LangError::unbound_symbol(Symbol("zz")));
    assert(!unbound.has_state());
    assert(unbound.is_lang(LangError::Type::UnboundSymbol));
    assert(unbound.reify().to_string().find("UnboundSymbol") != std::string::npos);

    Error counted = lang_error(LangError::wrong_argument_count(3, ExpectedCount::at_most(2)));
    assert(counted.reify().to_string().find("WrongArgumentCount") != std::string::npos);

    assert(ExpectedCount::exactly(2).accepts(2));
    assert(!ExpectedCount::exactly(2).accepts(3));
    assert(ExpectedCount::at_least(1).accepts(5));
    assert(!ExpectedCount::at_most(1).accepts(2));

    ExecStack stack(ExecFrame(Node(LocalNode(1), LocalNode(10))));
    stack.push(ExecFrame(Node(LocalNode(1), LocalNode(11))));
    Error with = Error::with_state(stack, LangError::unsupported("x"));
    assert(with.has_state() && with.state()->depth() == 2);
    // The first attached state wins
    with.set_state(ExecStack(ExecFrame()));
    assert(with.state()->depth() == 2);

    Error io = io_error("/nope", "missing");
    assert(io.reify().to_string().find("IoError") != std::string::npos);

    std::cout << "  PASS" << std::endl;
}

void test_continuation() {
    std::cout << "Testing Continuation..." << std::endl;

    ExecStack stack{ExecFrame(Node())};
    assert(!stack.pop());
    assert(stack.depth() == 1);

    stack.push(ExecFrame(Node(LocalNode(1), LocalNode(12))));
    Node param(LocalNode(1), LocalNode(20));
    assert(stack.top_mut().insert(param, num(5)));
    assert(!stack.top_mut().insert(param, num(6)));
    assert(*stack.top().lookup(param) == num(5));
    assert(stack.pop());
    assert(stack.depth() == 1);
    assert(!stack.top().lookup(param));

    std::cout << "  PASS" << std::endl;
}

void test_config() {
    std::cout << "Testing Config..." << std::endl;

    json j = json::parse(R"({
        "base_dir": "/tmp/smriti_config_test",
        "working_file": "work.env",
        "save_on_exit": false,
        "serialize_blacklist": ["history.env", 7],
        "unknown_key": {"nested": true}
    })");
    Config c = Config::from_json(j);
    assert(c.base_dir == "/tmp/smriti_config_test");
    assert(c.working_file == "work.env");
    assert(c.lang_file == "lang.env");
    assert(!c.save_on_exit);
    assert(c.serialize_blacklist.size() == 1 && c.serialize_blacklist.count("history.env"));
    assert(c.path_of("lang.env") == "/tmp/smriti_config_test/lang.env");
    assert(c.path_of("/abs/x.env") == "/abs/x.env");

    Config round = Config::from_json(c.to_json());
    assert(round.working_file == c.working_file && round.serialize_blacklist == c.serialize_blacklist);

    Config missing = Config::load("/nonexistent/smriti/config.json");
    assert(missing.meta_file == "meta.env");

    std::cout << "  PASS" << std::endl;
}

int main() {
    std::cout << "=== smriti Tests ===" << std::endl;
    std::cout << "Env format " << version::env_format() << std::endl;
    std::cout << std::endl;

    test_number();
    test_tokenizer();
    test_parser();
    test_sexp_printing();
    test_environment();
    test_meta_env();
    test_sigils();
    test_serializer_forms();
    test_structured_roundtrip();
    test_env_header();
    test_env_codec();
    test_errors();
    test_continuation();
    test_config();

    std::cout << std::endl;
    std::cout << "=== All tests passed! ===" << std::endl;
    return 0;
}
