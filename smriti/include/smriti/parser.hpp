#pragma once
// Parser: tokens -> s-expressions
//
// Same push protocol as the tokenizer. Tracks list depth, dotted tails
// and pending quotes; a complete top-level datum becomes ready.

#include "tokenizer.hpp"
#include <deque>
#include <istream>
#include <vector>

namespace smriti {

constexpr size_t MAX_LIST_DEPTH = 128;

class Parser {
public:
    void feed(Token token) {
        switch (token.kind) {
            case Token::Kind::Comment:
                return;
            case Token::Kind::Quote:
                pending_quotes() += 1;
                last_quote_ = token;
                return;
            case Token::Kind::LeftParen:
                if (levels_.size() >= MAX_LIST_DEPTH) {
                    fail(ParseError::Reason::DepthOverflow, token);
                }
                levels_.emplace_back();
                levels_.back().open = token;
                return;
            case Token::Kind::RightParen:
                close(token);
                return;
            case Token::Kind::Period:
                period(token);
                return;
            case Token::Kind::Primitive:
                datum(std::move(token.value), token);
                return;
        }
    }

    bool ready() const { return !out_.empty(); }

    Sexp pop() {
        Sexp s = std::move(out_.front());
        out_.pop_front();
        return s;
    }

    void finish() {
        if (!levels_.empty()) {
            Token open = levels_.back().open;
            reset();
            fail(ParseError::Reason::UnmatchedOpen, open);
        }
        if (top_quotes_ > 0) {
            Token q = last_quote_;
            reset();
            fail(ParseError::Reason::TrailingQuote, q);
        }
    }

    size_t depth() const { return levels_.size(); }
    bool idle() const { return levels_.empty() && top_quotes_ == 0; }

    void reset() {
        levels_.clear();
        top_quotes_ = 0;
    }

private:
    enum class Tail { None, Awaiting, Done };

    struct Level {
        ConsList list;
        bool has_elems = false;
        Tail tail = Tail::None;
        size_t quotes = 0;
        Token open;
    };

    std::vector<Level> levels_;
    std::deque<Sexp> out_;
    size_t top_quotes_ = 0;
    Token last_quote_;

    size_t& pending_quotes() { return levels_.empty() ? top_quotes_ : levels_.back().quotes; }

    [[noreturn]] void fail(ParseError::Reason reason, const Token& at) {
        reset();
        throw Error::empty_state(ParseError{reason, at.text, at.line});
    }

    void datum(Sexp value, const Token& at) {
        size_t& quotes = pending_quotes();
        for (; quotes > 0; --quotes) {
            value = make_list({sym("quote"), std::move(value)});
        }

        if (levels_.empty()) {
            out_.push_back(std::move(value));
            return;
        }

        Level& level = levels_.back();
        switch (level.tail) {
            case Tail::None:
                level.list.append(std::move(value));
                level.has_elems = true;
                return;
            case Tail::Awaiting:
                level.list.append_tail(std::move(value));
                level.tail = Tail::Done;
                return;
            case Tail::Done:
                fail(ParseError::Reason::NotPenultimatePeriod, at);
        }
    }

    void period(const Token& at) {
        if (levels_.empty()) fail(ParseError::Reason::IsolatedPeriod, at);
        Level& level = levels_.back();
        if (level.quotes > 0) fail(ParseError::Reason::TrailingQuote, last_quote_);
        if (!level.has_elems) fail(ParseError::Reason::IsolatedPeriod, at);
        if (level.tail != Tail::None) fail(ParseError::Reason::NotPenultimatePeriod, at);
        level.tail = Tail::Awaiting;
    }

    void close(const Token& at) {
        if (levels_.empty()) fail(ParseError::Reason::UnmatchedClose, at);
        Level& level = levels_.back();
        if (level.quotes > 0) fail(ParseError::Reason::TrailingQuote, last_quote_);
        if (level.tail == Tail::Awaiting) fail(ParseError::Reason::NotPenultimatePeriod, at);

        Sexp list = level.list.release();
        levels_.pop_back();
        datum(std::move(list), at);
    }
};

// Parse complete text; errors stop at the first failure
inline std::vector<Sexp> parse_all(const std::string& text, SymbolPolicy policy = policy_base) {
    Tokenizer tokenizer(policy);
    Parser parser;
    std::vector<Sexp> out;

    auto drain = [&]() {
        while (tokenizer.ready()) parser.feed(tokenizer.pop());
        while (parser.ready()) out.push_back(parser.pop());
    };

    tokenizer.feed(text);
    drain();
    tokenizer.finish();
    drain();
    parser.finish();
    return out;
}

// Parse a stream line by line, handing each top-level datum to f as it completes
template <typename F>
void parse_stream_each(std::istream& in, F&& f, SymbolPolicy policy = policy_base) {
    Tokenizer tokenizer(policy);
    Parser parser;
    std::string line;
    while (std::getline(in, line)) {
        tokenizer.feed_line(line);
        while (tokenizer.ready()) parser.feed(tokenizer.pop());
        while (parser.ready()) f(parser.pop());
    }
    tokenizer.finish();
    while (tokenizer.ready()) parser.feed(tokenizer.pop());
    while (parser.ready()) f(parser.pop());
    parser.finish();
}

inline std::vector<Sexp> parse_stream(std::istream& in, SymbolPolicy policy = policy_base) {
    std::vector<Sexp> out;
    parse_stream_each(in, [&out](Sexp s) { out.push_back(std::move(s)); }, policy);
    return out;
}

} // namespace smriti
