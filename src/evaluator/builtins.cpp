// Built-in primitives. They live in the global scope as native functions.
#include <cmath>
#include <limits>
#include <string>

#include "Presenter.hpp"
#include "PromiseScheduler.hpp"
#include "UselessError.hpp"
#include "evaluator.hpp"

static void expect_arity(const std::string& name, const std::vector<Value>& args, size_t n, const Token& tok) {
    if (args.size() == n) return;
    throw ChaosError(ErrorKind::TypeMismatch,
        type_mismatch_message(name + " takes " + std::to_string(n) + " argument(s), got " + std::to_string(args.size())),
        tok.loc);
}

static ChaosError math_is_hard(const std::string& name, const std::vector<Value>& args, const Token& tok) {
    return ChaosError(ErrorKind::TypeMismatch,
        type_mismatch_message(messages::math_is_hard + " (" + name + " wants two numbers, got " +
            type_name(args[0]) + " and " + type_name(args[1]) + ")"),
        tok.loc);
}

void Evaluator::init_builtins(EnvPtr env) {
    using Method = Value (Evaluator::*)(const std::vector<Value>&, const Token&);
    auto def = [&](const std::string& name, Method method) {
        Token tok(TokenType::IDENTIFIER, name, TokenLocation("<builtin>", 0, 0, 0));
        NativeFn impl = [this, method](const std::vector<Value>& args, const Token& callTok) {
            return (this->*method)(args, callTok);
        };
        // natives capture no scope
        env->define(name, std::make_shared<FunctionValue>(name, impl, nullptr, tok));
    };

    def("add", &Evaluator::builtin_add);
    def("multiply", &Evaluator::builtin_multiply);
    def("equals", &Evaluator::builtin_equals);
    def("lessThan", &Evaluator::builtin_less_than);
    def("index", &Evaluator::builtin_index);
    def("access", &Evaluator::builtin_access);
    def("print", &Evaluator::builtin_print);
    def("save", &Evaluator::builtin_save);
    def("exit", &Evaluator::builtin_exit);
    def("promise", &Evaluator::builtin_promise);
}

void Evaluator::maybe_teapot(const Token& tok) {
    if (chaos_.teapot()) {
        throw ChaosError(ErrorKind::TeapotError, messages::teapot, tok.loc);
    }
}

Value Evaluator::builtin_add(const std::vector<Value>& args, const Token& tok) {
    expect_arity("add", args, 2, tok);
    const double* a = std::get_if<double>(&args[0]);
    const double* b = std::get_if<double>(&args[1]);
    if (!a || !b) throw math_is_hard("add", args, tok);

    double result = chaos_.pick_arith_alt(ArithOp::Add) == ArithOp::Subtract ? *a - *b : *a * *b;
    maybe_teapot(tok);
    return result;
}

Value Evaluator::builtin_multiply(const std::vector<Value>& args, const Token& tok) {
    expect_arity("multiply", args, 2, tok);
    const double* a = std::get_if<double>(&args[0]);
    const double* b = std::get_if<double>(&args[1]);
    if (!a || !b) throw math_is_hard("multiply", args, tok);

    double result = 0;
    if (chaos_.pick_arith_alt(ArithOp::Multiply) == ArithOp::Divide) {
        if (*b == 0) throw ChaosError(ErrorKind::DivisionByZero, messages::division_by_zero, tok.loc);
        result = *a / *b;
    } else {
        result = *a + *b;
    }
    maybe_teapot(tok);
    return result;
}

// Shape mismatches either surface or dissolve into a coin flip.
Value Evaluator::compare_with_chaos(const std::vector<Value>& args, const Token& tok, bool less) {
    expect_arity(less ? "lessThan" : "equals", args, 2, tok);
    bool result = false;
    try {
        result = less ? value_less_than(args[0], args[1], tok) : value_equals(args[0], args[1], tok);
    } catch (const ChaosError& e) {
        if (e.kind() != ErrorKind::TypeMismatch || chaos_.surface_type_mismatch()) throw;
        return chaos_.random_boolean();
    }
    maybe_teapot(tok);
    return result;
}

Value Evaluator::builtin_equals(const std::vector<Value>& args, const Token& tok) {
    return compare_with_chaos(args, tok, false);
}

Value Evaluator::builtin_less_than(const std::vector<Value>& args, const Token& tok) {
    return compare_with_chaos(args, tok, true);
}

Value Evaluator::builtin_index(const std::vector<Value>& args, const Token& tok) {
    expect_arity("index", args, 2, tok);
    const ArrayPtr* arr = std::get_if<ArrayPtr>(&args[0]);
    if (!arr || !*arr) {
        throw ChaosError(ErrorKind::TypeMismatch,
            type_mismatch_message("index wants an array, got " + type_name(args[0])), tok.loc);
    }
    const double* num = std::get_if<double>(&args[1]);
    if (!num || std::isnan(*num)) {
        std::string got = num ? format_number(*num) : type_name(args[1]);
        throw ChaosError(ErrorKind::TypeMismatch,
            type_mismatch_message("index wants a number, got " + got), tok.loc);
    }

    const auto& elements = (*arr)->elements;
    auto vacation = [&]() {
        return ChaosError(ErrorKind::IndexOutOfVacation,
            "Index " + format_number(*num) + " is on vacation. This array only has " +
                std::to_string(elements.size()) + " element(s) 🧳",
            tok.loc);
    };
    // bounds are checked before integrality
    if (*num < 0 || *num >= static_cast<double>(elements.size())) throw vacation();
    if (std::floor(*num) != *num) {
        throw ChaosError(ErrorKind::TypeMismatch,
            type_mismatch_message("index wants a whole number, got " + format_number(*num)), tok.loc);
    }

    std::optional<size_t> picked = chaos_.pick_container_index(elements.size(), static_cast<int64_t>(*num));
    if (!picked) throw vacation();
    Value v = elements[*picked];
    maybe_teapot(tok);
    return v;
}

Value Evaluator::builtin_access(const std::vector<Value>& args, const Token& tok) {
    expect_arity("access", args, 2, tok);
    const RecordPtr* rec = std::get_if<RecordPtr>(&args[0]);
    if (!rec || !*rec) {
        throw ChaosError(ErrorKind::TypeMismatch,
            type_mismatch_message("access wants a record, got " + type_name(args[0])), tok.loc);
    }
    const std::string* key = std::get_if<std::string>(&args[1]);
    if (!key) {
        throw ChaosError(ErrorKind::TypeMismatch,
            type_mismatch_message("access wants a text key, got " + type_name(args[1])), tok.loc);
    }

    std::optional<std::string> chosen = chaos_.pick_field(**rec, *key);
    if (!chosen) throw ChaosError(ErrorKind::EmptyRecordAccess, messages::empty_record, tok.loc);

    const Value* v = (*rec)->find(*chosen);
    if (!v) {
        throw ChaosError(ErrorKind::NameNotFound,
            "Field '" + *chosen + "' not found. Have you tried looking under the couch?", tok.loc);
    }
    Value out = *v;
    maybe_teapot(tok);
    return out;
}

Value Evaluator::builtin_print(const std::vector<Value>& args, const Token& tok) {
    expect_arity("print", args, 1, tok);
    if (chaos_.mischief_style_points()) {
        throw ChaosError(ErrorKind::StylePoints, messages::style_points, tok.loc);
    }
    if (chaos_.browser_error_on_print()) {
        presenter_.present_browser_error(args[0]);
    } else {
        presenter_.present(args[0]);
    }
    return std::monostate{};
}

Value Evaluator::builtin_save(const std::vector<Value>&, const Token& tok) {
    throw ChaosError(ErrorKind::SaveAlwaysFails, chaos_.pick_save_message(), tok.loc);
}

Value Evaluator::builtin_exit(const std::vector<Value>& args, const Token& tok) {
    expect_arity("exit", args, 0, tok);
    return std::monostate{};
}

// promise(value, timeoutMs[, mindChange])
Value Evaluator::builtin_promise(const std::vector<Value>& args, const Token& tok) {
    if (args.empty() || args.size() > 3) {
        throw ChaosError(ErrorKind::TypeMismatch,
            type_mismatch_message("promise takes 1 to 3 arguments, got " + std::to_string(args.size())), tok.loc);
    }

    std::optional<uint64_t> timeout;
    if (args.size() >= 2 && !std::holds_alternative<std::monostate>(args[1])) {
        const double* t = std::get_if<double>(&args[1]);
        if (!t || std::isnan(*t)) {
            throw ChaosError(ErrorKind::TypeMismatch,
                type_mismatch_message("promise wants a timeout in milliseconds, got " + type_name(args[1])), tok.loc);
        }
        timeout = *t <= 0 ? 0 : (*t >= 1.8e19 ? std::numeric_limits<uint64_t>::max() : static_cast<uint64_t>(*t));
    }

    std::optional<bool> mind_change;
    if (args.size() == 3) {
        const bool* m = std::get_if<bool>(&args[2]);
        if (!m) {
            throw ChaosError(ErrorKind::TypeMismatch,
                type_mismatch_message("promise wants a boolean mind-change flag, got " + type_name(args[2])), tok.loc);
        }
        mind_change = *m;
    }

    return scheduler_->create(args[0], timeout, mind_change);
}
