#pragma once
// Tokenizer: push-driven lexer
//
// Text is fed in arbitrary chunks (usually lines); finished tokens queue
// up until popped. A string literal left open at the end of a chunk
// continues into the next one. finish() reports a string still open.

#include "error.hpp"
#include "symbol_policy.hpp"
#include <deque>
#include <string>

namespace smriti {

struct Token {
    enum class Kind { LeftParen, RightParen, Quote, Period, Primitive, Comment };
    Kind kind = Kind::Primitive;
    Sexp value;         // Primitive only
    std::string text;   // source text
    size_t line = 0;
};

class Tokenizer {
public:
    explicit Tokenizer(SymbolPolicy policy = policy_base) : policy_(policy) {}

    void feed(const std::string& text) {
        for (char c : text) step(c);
        // End of chunk terminates any pending atom
        if (!in_string_) flush_atom();
    }

    // Feed one line; the newline is implied
    void feed_line(const std::string& line) {
        feed(line);
        step('\n');
    }

    bool ready() const { return !tokens_.empty(); }

    Token pop() {
        Token t = std::move(tokens_.front());
        tokens_.pop_front();
        return t;
    }

    void finish() {
        if (in_string_) {
            std::string partial = "\"" + string_buf_;
            size_t line = string_line_;
            clear();
            throw Error::empty_state(
                TokenizeError{TokenizeError::Type::UnterminatedString, partial, line});
        }
        flush_atom();
    }

    bool in_string() const { return in_string_; }
    size_t line() const { return line_; }

    // Drop partial state and queued tokens (e.g. after an interrupt)
    void clear() {
        tokens_.clear();
        atom_.clear();
        string_buf_.clear();
        comment_.clear();
        in_string_ = false;
        in_comment_ = false;
        escape_ = false;
    }

private:
    SymbolPolicy policy_;
    std::deque<Token> tokens_;
    std::string atom_;
    std::string string_buf_;
    std::string comment_;
    bool in_string_ = false;
    bool in_comment_ = false;
    bool escape_ = false;
    size_t line_ = 1;
    size_t string_line_ = 1;

    void emit(Token::Kind kind, std::string text, Sexp value = Sexp()) {
        Token t;
        t.kind = kind;
        t.text = std::move(text);
        t.value = std::move(value);
        t.line = line_;
        tokens_.push_back(std::move(t));
    }

    void step(char c) {
        if (in_comment_) {
            if (c == '\n') {
                emit(Token::Kind::Comment, comment_);
                comment_.clear();
                in_comment_ = false;
                ++line_;
            } else {
                comment_ += c;
            }
            return;
        }

        if (in_string_) {
            step_string(c);
            return;
        }

        switch (c) {
            case '(':
                flush_atom();
                emit(Token::Kind::LeftParen, "(");
                return;
            case ')':
                flush_atom();
                emit(Token::Kind::RightParen, ")");
                return;
            case '\'':
                flush_atom();
                emit(Token::Kind::Quote, "'");
                return;
            case ';':
                flush_atom();
                in_comment_ = true;
                return;
            case '"':
                flush_atom();
                in_string_ = true;
                string_line_ = line_;
                return;
            case '\n':
                flush_atom();
                ++line_;
                return;
            case ' ':
            case '\t':
            case '\r':
                flush_atom();
                return;
            default:
                atom_ += c;
                return;
        }
    }

    void step_string(char c) {
        if (escape_) {
            escape_ = false;
            switch (c) {
                case 't': string_buf_ += '\t'; break;
                case 'r': string_buf_ += '\r'; break;
                case 'n': string_buf_ += '\n'; break;
                case '\\': string_buf_ += '\\'; break;
                case '"': string_buf_ += '"'; break;
                default:
                    string_buf_ += '\\';
                    string_buf_ += c;
                    break;
            }
            return;
        }
        if (c == '\\') {
            escape_ = true;
            return;
        }
        if (c == '"') {
            in_string_ = false;
            std::string s = std::move(string_buf_);
            string_buf_.clear();
            emit(Token::Kind::Primitive, "\"" + s + "\"", LangString(s));
            return;
        }
        if (c == '\n') ++line_;
        string_buf_ += c;
    }

    void flush_atom() {
        if (atom_.empty()) return;
        std::string a = std::move(atom_);
        atom_.clear();

        if (a == ".") {
            emit(Token::Kind::Period, a);
            return;
        }
        if (auto n = Number::parse(a)) {
            emit(Token::Kind::Primitive, a, *n);
            return;
        }
        if (auto s = policy_(a)) {
            emit(Token::Kind::Primitive, a, *s);
            return;
        }
        throw Error::empty_state(TokenizeError{TokenizeError::Type::InvalidSymbol, a, line_});
    }
};

} // namespace smriti
