#pragma once
// Error model
//
// One exception type, smriti::Error, carries an ErrorKind and optionally
// a snapshot of the agent's exec stack at the point of failure. Stateless
// errors (tokenizer, parser, file IO) are built with Error::empty_state;
// agents build stateful ones through Agent::error.

#include "continuation.hpp"
#include "sexp.hpp"
#include <optional>
#include <stdexcept>
#include <string>
#include <variant>

namespace smriti {

struct ExpectedCount {
    enum class Type { Exactly, AtLeast, AtMost };
    Type type = Type::Exactly;
    size_t n = 0;

    static ExpectedCount exactly(size_t n) { return {Type::Exactly, n}; }
    static ExpectedCount at_least(size_t n) { return {Type::AtLeast, n}; }
    static ExpectedCount at_most(size_t n) { return {Type::AtMost, n}; }

    bool accepts(size_t given) const {
        switch (type) {
            case Type::Exactly: return given == n;
            case Type::AtLeast: return given >= n;
            case Type::AtMost: return given <= n;
        }
        return false;
    }

    Sexp reify() const {
        const char* name = type == Type::Exactly ? "Exactly"
                         : type == Type::AtLeast ? "AtLeast" : "AtMost";
        return make_list({sym(name), Sexp(Number::usize(n))});
    }
};

// Language-level failures
struct LangError {
    enum class Type {
        InvalidArgument, InvalidState, InvalidSexp, WrongArgumentCount,
        UnboundSymbol, AlreadyBoundSymbol, DuplicateTriple, RejectedTriple, Unsupported
    };
    Type type = Type::Unsupported;

    Sexp given;                 // InvalidArgument, InvalidSexp
    std::string expected;       // InvalidArgument, InvalidState
    std::string actual;         // InvalidState
    size_t given_count = 0;     // WrongArgumentCount
    ExpectedCount expected_count;
    Symbol symbol;              // UnboundSymbol, AlreadyBoundSymbol
    Sexp triple;                // DuplicateTriple, RejectedTriple
    Sexp reason;                // RejectedTriple: handler return value
    std::string message;        // Unsupported

    static LangError invalid_argument(Sexp g, std::string e) {
        LangError err{Type::InvalidArgument};
        err.given = std::move(g);
        err.expected = std::move(e);
        return err;
    }
    static LangError invalid_state(std::string a, std::string e) {
        LangError err{Type::InvalidState};
        err.actual = std::move(a);
        err.expected = std::move(e);
        return err;
    }
    static LangError invalid_sexp(Sexp s) {
        LangError err{Type::InvalidSexp};
        err.given = std::move(s);
        return err;
    }
    static LangError wrong_argument_count(size_t g, ExpectedCount e) {
        LangError err{Type::WrongArgumentCount};
        err.given_count = g;
        err.expected_count = e;
        return err;
    }
    static LangError unbound_symbol(Symbol s) {
        LangError err{Type::UnboundSymbol};
        err.symbol = std::move(s);
        return err;
    }
    static LangError already_bound_symbol(Symbol s) {
        LangError err{Type::AlreadyBoundSymbol};
        err.symbol = std::move(s);
        return err;
    }
    static LangError duplicate_triple(Sexp t) {
        LangError err{Type::DuplicateTriple};
        err.triple = std::move(t);
        return err;
    }
    static LangError rejected_triple(Sexp t, Sexp r) {
        LangError err{Type::RejectedTriple};
        err.triple = std::move(t);
        err.reason = std::move(r);
        return err;
    }
    static LangError unsupported(std::string m) {
        LangError err{Type::Unsupported};
        err.message = std::move(m);
        return err;
    }

    static const char* type_name(Type t) {
        switch (t) {
            case Type::InvalidArgument: return "InvalidArgument";
            case Type::InvalidState: return "InvalidState";
            case Type::InvalidSexp: return "InvalidSexp";
            case Type::WrongArgumentCount: return "WrongArgumentCount";
            case Type::UnboundSymbol: return "UnboundSymbol";
            case Type::AlreadyBoundSymbol: return "AlreadyBoundSymbol";
            case Type::DuplicateTriple: return "DuplicateTriple";
            case Type::RejectedTriple: return "RejectedTriple";
            case Type::Unsupported: return "Unsupported";
        }
        return "";
    }

    // (Kind (field . value)...)
    Sexp reify() const {
        auto field = [](const char* name, Sexp v) { return make_pair(sym(name), std::move(v)); };
        ConsList out;
        out.append(sym(type_name(type)));
        switch (type) {
            case Type::InvalidArgument:
                out.append(field("given", given));
                out.append(field("expected", LangString(expected)));
                break;
            case Type::InvalidState:
                out.append(field("actual", LangString(actual)));
                out.append(field("expected", LangString(expected)));
                break;
            case Type::InvalidSexp:
                out.append(field("sexp", given));
                break;
            case Type::WrongArgumentCount:
                out.append(field("given", Number::usize(given_count)));
                out.append(field("expected", expected_count.reify()));
                break;
            case Type::UnboundSymbol:
            case Type::AlreadyBoundSymbol:
                out.append(field("symbol", symbol));
                break;
            case Type::DuplicateTriple:
                out.append(field("triple", triple));
                break;
            case Type::RejectedTriple:
                out.append(field("triple", triple));
                out.append(field("reason", reason));
                break;
            case Type::Unsupported:
                out.append(field("message", LangString(message)));
                break;
        }
        return out.release();
    }
};

struct ParseError {
    enum class Reason {
        DepthOverflow, UnmatchedOpen, UnmatchedClose,
        IsolatedPeriod, NotPenultimatePeriod, TrailingQuote
    };
    Reason reason = Reason::UnmatchedOpen;
    std::string token;
    size_t line = 0;

    static const char* reason_name(Reason r) {
        switch (r) {
            case Reason::DepthOverflow: return "DepthOverflow";
            case Reason::UnmatchedOpen: return "UnmatchedOpen";
            case Reason::UnmatchedClose: return "UnmatchedClose";
            case Reason::IsolatedPeriod: return "IsolatedPeriod";
            case Reason::NotPenultimatePeriod: return "NotPenultimatePeriod";
            case Reason::TrailingQuote: return "TrailingQuote";
        }
        return "";
    }

    Sexp reify() const {
        return make_list({sym(reason_name(reason)),
                          make_pair(sym("token"), LangString(token)),
                          make_pair(sym("line"), Number::usize(line))});
    }
};

struct TokenizeError {
    enum class Type { InvalidSymbol, UnterminatedString };
    Type type = Type::InvalidSymbol;
    std::string token;
    size_t line = 0;

    Sexp reify() const {
        return make_list({sym(type == Type::InvalidSymbol ? "InvalidSymbol" : "UnterminatedString"),
                          make_pair(sym("token"), LangString(token)),
                          make_pair(sym("line"), Number::usize(line))});
    }
};

struct DeserializeError {
    enum class Type {
        MissingHeaderSection, MissingNodeSection, MissingTripleSection, ExtraneousSection,
        UnexpectedCommand, ExpectedSymbol, UnrecognizedBuiltIn, InvalidNodeEntry,
        ExtraneousData, MissingData, UnexpectedType, IncompatibleVersion
    };
    Type type = Type::MissingData;
    Sexp detail;
    std::string message;

    static DeserializeError of(Type t, Sexp d = Sexp(), std::string m = "") {
        DeserializeError e;
        e.type = t;
        e.detail = std::move(d);
        e.message = std::move(m);
        return e;
    }

    static const char* type_name(Type t) {
        switch (t) {
            case Type::MissingHeaderSection: return "MissingHeaderSection";
            case Type::MissingNodeSection: return "MissingNodeSection";
            case Type::MissingTripleSection: return "MissingTripleSection";
            case Type::ExtraneousSection: return "ExtraneousSection";
            case Type::UnexpectedCommand: return "UnexpectedCommand";
            case Type::ExpectedSymbol: return "ExpectedSymbol";
            case Type::UnrecognizedBuiltIn: return "UnrecognizedBuiltIn";
            case Type::InvalidNodeEntry: return "InvalidNodeEntry";
            case Type::ExtraneousData: return "ExtraneousData";
            case Type::MissingData: return "MissingData";
            case Type::UnexpectedType: return "UnexpectedType";
            case Type::IncompatibleVersion: return "IncompatibleVersion";
        }
        return "";
    }

    Sexp reify() const {
        ConsList out;
        out.append(sym(type_name(type)));
        if (!detail.is_nil()) out.append(make_pair(sym("data"), detail));
        if (!message.empty()) out.append(make_pair(sym("message"), LangString(message)));
        return out.release();
    }
};

struct IoError {
    std::string path;
    std::string message;

    Sexp reify() const {
        return make_list({make_pair(sym("path"), LangString(path)),
                          make_pair(sym("message"), LangString(message))});
    }
};

using ErrorKind = std::variant<LangError, ParseError, TokenizeError, DeserializeError, IoError>;

inline const char* error_kind_name(const ErrorKind& k) {
    static const char* names[] = {"LangError", "ParseError", "TokenizeError",
                                  "DeserializeError", "IoError"};
    return names[k.index()];
}

// (KindName body...)
inline Sexp reify_error_kind(const ErrorKind& k) {
    Sexp body = std::visit([](const auto& e) { return e.reify(); }, k);
    if (std::holds_alternative<LangError>(k)) {
        return make_list({sym(error_kind_name(k)), std::move(body)});
    }
    body.push_front(sym(error_kind_name(k)));
    return body;
}

class Error : public std::runtime_error {
public:
    static Error empty_state(ErrorKind kind) { return Error(std::move(kind), std::nullopt); }
    static Error with_state(ExecStack state, ErrorKind kind) {
        return Error(std::move(kind), std::move(state));
    }

    const ErrorKind& kind() const { return kind_; }
    const std::optional<ExecStack>& state() const { return state_; }
    bool has_state() const { return state_.has_value(); }

    // Attach a snapshot if none was captured at the throw site
    void set_state(ExecStack state) {
        if (!state_) state_ = std::move(state);
    }

    const LangError* lang_error() const { return std::get_if<LangError>(&kind_); }
    bool is_lang(LangError::Type t) const {
        const LangError* e = lang_error();
        return e && e->type == t;
    }

    Sexp reify() const { return reify_error_kind(kind_); }

private:
    Error(ErrorKind kind, std::optional<ExecStack> state)
        : std::runtime_error(reify_error_kind(kind).to_string()),
          kind_(std::move(kind)), state_(std::move(state)) {}

    ErrorKind kind_;
    std::optional<ExecStack> state_;
};

inline Error lang_error(LangError e) { return Error::empty_state(std::move(e)); }

inline Error io_error(const std::string& path, const std::string& message) {
    return Error::empty_state(IoError{path, message});
}

inline Error deserialize_error(DeserializeError::Type t, Sexp detail = Sexp(), std::string message = "") {
    return Error::empty_state(DeserializeError::of(t, std::move(detail), std::move(message)));
}

} // namespace smriti
