#pragma once
// Number: numeric primitive that carries its width.
//
// Literals without a suffix parse as I64 (integral) or F64 (otherwise).
// The file/debug form appends a suffix for non-default widths: 5u64, 2.5f32.

#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <cerrno>
#include <cmath>
#include <limits>
#include <optional>
#include <string>

namespace smriti {

class Number {
public:
    enum class Width { I8, I16, I32, I64, U8, U16, U32, U64, USize, F32, F64 };

    Number() = default;

    static Number integer(int64_t v) { return signed_of(Width::I64, v); }
    static Number real(double v) { return float_of(Width::F64, v); }
    static Number usize(size_t v) { return unsigned_of(Width::USize, v); }
    static Number u64(uint64_t v) { return unsigned_of(Width::U64, v); }

    static Number signed_of(Width w, int64_t v) {
        Number n;
        n.width_ = w;
        n.i_ = v;
        n.normalize();
        return n;
    }
    static Number unsigned_of(Width w, uint64_t v) {
        Number n;
        n.width_ = w;
        n.u_ = v;
        n.normalize();
        return n;
    }
    static Number float_of(Width w, double v) {
        Number n;
        n.width_ = w;
        n.f_ = v;
        n.normalize();
        return n;
    }

    Width width() const { return width_; }

    bool is_float() const { return width_ == Width::F32 || width_ == Width::F64; }
    bool is_unsigned() const {
        return width_ == Width::U8 || width_ == Width::U16 || width_ == Width::U32 ||
               width_ == Width::U64 || width_ == Width::USize;
    }
    bool is_integer() const { return !is_float(); }

    int64_t as_i64() const {
        if (is_float()) return static_cast<int64_t>(f_);
        if (is_unsigned()) return static_cast<int64_t>(u_);
        return i_;
    }
    uint64_t as_u64() const {
        if (is_float()) return static_cast<uint64_t>(f_);
        if (is_unsigned()) return u_;
        return static_cast<uint64_t>(i_);
    }
    double as_f64() const {
        if (is_float()) return f_;
        if (is_unsigned()) return static_cast<double>(u_);
        return static_cast<double>(i_);
    }

    bool is_zero() const {
        if (is_float()) return f_ == 0.0;
        if (is_unsigned()) return u_ == 0;
        return i_ == 0;
    }

    bool operator==(const Number& o) const {
        if (width_ != o.width_) return false;
        if (is_float()) return f_ == o.f_;
        if (is_unsigned()) return u_ == o.u_;
        return i_ == o.i_;
    }
    bool operator!=(const Number& o) const { return !(*this == o); }

    // op is one of + - * /. Integers stay integers (same width kept, mixed
    // widths widen to I64); any float operand yields a float. Integer
    // division truncates. Returns nullopt on I64 overflow, integer division
    // by zero, or a float result that is not finite.
    std::optional<Number> apply(char op, const Number& o) const {
        if (is_float() || o.is_float()) {
            Width w = (width_ == Width::F32 && o.width_ == Width::F32) ? Width::F32 : Width::F64;
            double a = as_f64(), b = o.as_f64(), r = 0.0;
            switch (op) {
                case '+': r = a + b; break;
                case '-': r = a - b; break;
                case '*': r = a * b; break;
                default: r = a / b; break;
            }
            Number out = float_of(w, r);
            if (!std::isfinite(out.f_)) return std::nullopt;
            return out;
        }

        if (op == '/' && o.is_zero()) return std::nullopt;
        Width w = (width_ == o.width_) ? width_ : Width::I64;
        bool unsigned_result = (w == width_) ? is_unsigned() : false;
        if (unsigned_result) {
            uint64_t a = as_u64(), b = o.as_u64(), r = 0;
            switch (op) {
                case '+': r = a + b; break;
                case '-': r = a - b; break;
                case '*': r = a * b; break;
                default: r = a / b; break;
            }
            return unsigned_of(w, r);
        }

        int64_t a = as_i64(), b = o.as_i64(), r = 0;
        bool overflow = false;
        switch (op) {
            case '+': overflow = __builtin_add_overflow(a, b, &r); break;
            case '-': overflow = __builtin_sub_overflow(a, b, &r); break;
            case '*': overflow = __builtin_mul_overflow(a, b, &r); break;
            default:
                overflow = (a == std::numeric_limits<int64_t>::min() && b == -1);
                if (!overflow) r = a / b;
                break;
        }
        if (overflow) return std::nullopt;
        return signed_of(w, r);
    }

    static const char* suffix(Width w) {
        switch (w) {
            case Width::I8: return "i8";
            case Width::I16: return "i16";
            case Width::I32: return "i32";
            case Width::I64: return "i64";
            case Width::U8: return "u8";
            case Width::U16: return "u16";
            case Width::U32: return "u32";
            case Width::U64: return "u64";
            case Width::USize: return "usize";
            case Width::F32: return "f32";
            case Width::F64: return "f64";
        }
        return "";
    }

    // with_suffix: append the width suffix unless the width is a default (I64/F64)
    std::string to_string(bool with_suffix = false) const {
        std::string s;
        if (is_float()) {
            s = format_float(f_);
        } else if (is_unsigned()) {
            s = std::to_string(u_);
        } else {
            s = std::to_string(i_);
        }
        if (with_suffix && width_ != Width::I64 && width_ != Width::F64) {
            s += suffix(width_);
        }
        return s;
    }

    // Accepts optional sign, digits, fraction/exponent, optional width suffix.
    static std::optional<Number> parse(const std::string& text) {
        if (text.empty()) return std::nullopt;

        std::string body = text;
        std::optional<Width> width;
        static const Width all[] = {Width::USize, Width::I16, Width::I32, Width::I64,
                                    Width::U16, Width::U32, Width::U64, Width::F32,
                                    Width::F64, Width::I8, Width::U8};
        for (Width w : all) {
            std::string suf = suffix(w);
            if (body.size() > suf.size() &&
                body.compare(body.size() - suf.size(), suf.size(), suf) == 0) {
                width = w;
                body = body.substr(0, body.size() - suf.size());
                break;
            }
        }

        size_t i = 0;
        if (body[0] == '+' || body[0] == '-') i = 1;
        if (i >= body.size()) return std::nullopt;

        bool integral = true;
        bool digit_seen = false;
        for (size_t j = i; j < body.size(); ++j) {
            char c = body[j];
            if (c >= '0' && c <= '9') {
                digit_seen = true;
            } else if (c == '.' || c == 'e' || c == 'E' ||
                       ((c == '+' || c == '-') && (body[j - 1] == 'e' || body[j - 1] == 'E'))) {
                integral = false;
            } else {
                return std::nullopt;
            }
        }
        if (!digit_seen) return std::nullopt;

        if (integral && (!width || (*width != Width::F32 && *width != Width::F64))) {
            errno = 0;
            char* end = nullptr;
            Width w = width.value_or(Width::I64);
            Number n;
            n.width_ = w;
            if (n.is_unsigned()) {
                if (body[0] == '-') return std::nullopt;
                unsigned long long v = std::strtoull(body.c_str(), &end, 10);
                if (errno == ERANGE || *end != '\0') return std::nullopt;
                return unsigned_of(w, v);
            }
            long long v = std::strtoll(body.c_str(), &end, 10);
            if (errno == ERANGE || *end != '\0') return std::nullopt;
            return signed_of(w, v);
        }

        if (width && *width != Width::F32 && *width != Width::F64) return std::nullopt;
        errno = 0;
        char* end = nullptr;
        double v = std::strtod(body.c_str(), &end);
        if (errno == ERANGE || *end != '\0') return std::nullopt;
        Number out = float_of(width.value_or(Width::F64), v);
        if (!std::isfinite(out.f_)) return std::nullopt;
        return out;
    }

private:
    Width width_ = Width::I64;
    int64_t i_ = 0;
    uint64_t u_ = 0;
    double f_ = 0.0;

    void normalize() {
        switch (width_) {
            case Width::I8: i_ = static_cast<int8_t>(i_); break;
            case Width::I16: i_ = static_cast<int16_t>(i_); break;
            case Width::I32: i_ = static_cast<int32_t>(i_); break;
            case Width::U8: u_ = static_cast<uint8_t>(u_); break;
            case Width::U16: u_ = static_cast<uint16_t>(u_); break;
            case Width::U32: u_ = static_cast<uint32_t>(u_); break;
            case Width::F32: f_ = static_cast<float>(f_); break;
            default: break;
        }
    }

    // Shortest representation that parses back to the same value; always
    // contains '.' or 'e' so it re-reads as a float. Numbers are finite.
    static std::string format_float(double v) {
        char buf[64];
        for (int precision = 1; precision <= 17; ++precision) {
            std::snprintf(buf, sizeof(buf), "%.*g", precision, v);
            if (std::strtod(buf, nullptr) == v) break;
        }
        std::string s(buf);
        if (s.find_first_of(".eE") == std::string::npos) s += ".";
        return s;
    }
};

} // namespace smriti
