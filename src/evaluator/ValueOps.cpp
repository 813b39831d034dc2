#include <cmath>
#include <iomanip>
#include <limits>
#include <sstream>

#include "UselessError.hpp"
#include "value.hpp"

std::string type_mismatch_message(const std::string& detail) {
    return "You've achieved the impossible: " + detail + ". Here's a virtual cookie 🍪";
}

std::string type_name(const Value& v) {
    if (std::holds_alternative<std::monostate>(v)) return "null";
    if (std::holds_alternative<double>(v)) return "number";
    if (std::holds_alternative<std::string>(v)) return "text";
    if (std::holds_alternative<bool>(v)) return "boolean";
    if (std::holds_alternative<ArrayPtr>(v)) return "array";
    if (std::holds_alternative<RecordPtr>(v)) return "record";
    if (std::holds_alternative<FunctionPtr>(v)) return "function";
    return "promise";
}

bool coerce_boolean(const Value& v) {
    if (std::holds_alternative<std::monostate>(v)) return false;
    if (auto b = std::get_if<bool>(&v)) return *b;
    if (auto d = std::get_if<double>(&v)) return *d != 0.0 && !std::isnan(*d);
    if (auto s = std::get_if<std::string>(&v)) return !s->empty();
    if (auto a = std::get_if<ArrayPtr>(&v)) return *a && !(*a)->elements.empty();
    if (auto r = std::get_if<RecordPtr>(&v)) return *r && !(*r)->empty();
    return true;
}

std::string format_number(double d) {
    if (std::isnan(d)) return "NaN";
    if (std::isinf(d)) return d > 0 ? "Infinity" : "-Infinity";
    if (std::floor(d) == d && std::fabs(d) < 1e15) {
        std::ostringstream ss;
        ss << static_cast<long long>(d);
        return ss.str();
    }
    // shortest representation that reads back to the same double
    for (int prec = 1; prec <= std::numeric_limits<double>::max_digits10; ++prec) {
        std::ostringstream ss;
        ss << std::setprecision(prec) << d;
        if (std::stod(ss.str()) == d) return ss.str();
    }
    std::ostringstream ss;
    ss << std::setprecision(std::numeric_limits<double>::max_digits10) << d;
    return ss.str();
}

static std::string quote_text(const std::string& s) {
    std::string out = "\"";
    for (char c : s) {
        switch (c) {
            case '"': out += "\\\""; break;
            case '\\': out += "\\\\"; break;
            case '\n': out += "\\n"; break;
            case '\t': out += "\\t"; break;
            default: out += c;
        }
    }
    return out + "\"";
}

// Nested text is quoted so [1, "1"] stays readable; top-level text is raw.
static std::string render(const Value& v, bool nested) {
    if (std::holds_alternative<std::monostate>(v)) return "null";
    if (auto d = std::get_if<double>(&v)) return format_number(*d);
    if (auto s = std::get_if<std::string>(&v)) return nested ? quote_text(*s) : *s;
    if (auto b = std::get_if<bool>(&v)) return *b ? "true" : "false";
    if (auto a = std::get_if<ArrayPtr>(&v)) {
        if (!*a) return "[]";
        std::string out = "[";
        for (size_t i = 0; i < (*a)->elements.size(); ++i) {
            if (i) out += ", ";
            out += render((*a)->elements[i], true);
        }
        return out + "]";
    }
    if (auto r = std::get_if<RecordPtr>(&v)) {
        if (!*r) return "{}";
        std::string out = "{";
        for (size_t i = 0; i < (*r)->fields.size(); ++i) {
            if (i) out += ", ";
            out += quote_text((*r)->fields[i].first) + ": " + render((*r)->fields[i].second, true);
        }
        return out + "}";
    }
    if (auto f = std::get_if<FunctionPtr>(&v)) {
        return "<function " + ((*f && !(*f)->name.empty()) ? (*f)->name : std::string("anonymous")) + ">";
    }
    return "<promise #" + std::to_string(std::get<PromiseHandle>(v).id) + ">";
}

std::string value_to_string(const Value& v) {
    return render(v, false);
}

static ChaosError shape_mismatch(const std::string& op, const Value& a, const Value& b, const Token& at) {
    return ChaosError(ErrorKind::TypeMismatch,
        type_mismatch_message(op + " cannot compare " + type_name(a) + " with " + type_name(b)),
        at.loc);
}

static bool deep_equals(const Value& a, const Value& b, const Token& at) {
    if (a.index() != b.index()) throw shape_mismatch("equals", a, b, at);

    if (std::holds_alternative<std::monostate>(a)) return true;
    if (auto x = std::get_if<double>(&a)) return *x == std::get<double>(b);
    if (auto x = std::get_if<std::string>(&a)) return *x == std::get<std::string>(b);
    if (auto x = std::get_if<bool>(&a)) return *x == std::get<bool>(b);

    if (auto x = std::get_if<ArrayPtr>(&a)) {
        const ArrayPtr& y = std::get<ArrayPtr>(b);
        if (*x == y) return true;
        if (!*x || !y) return false;
        if ((*x)->elements.size() != y->elements.size()) return false;
        for (size_t i = 0; i < y->elements.size(); ++i) {
            // element shapes may differ: that is inequality, not a mismatch
            const Value& l = (*x)->elements[i];
            const Value& r = y->elements[i];
            if (l.index() != r.index() || !deep_equals(l, r, at)) return false;
        }
        return true;
    }

    if (auto x = std::get_if<RecordPtr>(&a)) {
        const RecordPtr& y = std::get<RecordPtr>(b);
        if (*x == y) return true;
        if (!*x || !y) return false;
        if ((*x)->size() != y->size()) return false;
        for (const auto& f : (*x)->fields) {
            const Value* other = y->find(f.first);
            if (!other || other->index() != f.second.index() || !deep_equals(f.second, *other, at)) return false;
        }
        return true;
    }

    if (auto x = std::get_if<FunctionPtr>(&a)) return *x == std::get<FunctionPtr>(b);
    return std::get<PromiseHandle>(a) == std::get<PromiseHandle>(b);
}

bool value_equals(const Value& a, const Value& b, const Token& at) {
    return deep_equals(a, b, at);
}

bool value_less_than(const Value& a, const Value& b, const Token& at) {
    if (auto x = std::get_if<double>(&a)) {
        if (auto y = std::get_if<double>(&b)) return *x < *y;
    }
    if (auto x = std::get_if<std::string>(&a)) {
        if (auto y = std::get_if<std::string>(&b)) return *x < *y;
    }
    throw ChaosError(ErrorKind::TypeMismatch,
        type_mismatch_message("lessThan only orders two numbers or two texts, got " + type_name(a) + " and " + type_name(b)),
        at.loc);
}
