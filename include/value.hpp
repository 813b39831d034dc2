#pragma once

#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <utility>
#include <variant>
#include <vector>

#include "ast.hpp"
#include "token.hpp"

// Forward declaration
class Environment;
using EnvPtr = std::shared_ptr<Environment>;

struct FunctionValue;
using FunctionPtr = std::shared_ptr<FunctionValue>;

struct ArrayValue;
using ArrayPtr = std::shared_ptr<ArrayValue>;

struct RecordValue;
using RecordPtr = std::shared_ptr<RecordValue>;

// Handle into the scheduler's promise table.
struct PromiseHandle {
    uint64_t id = 0;
    bool operator==(const PromiseHandle& other) const { return id == other.id; }
    bool operator!=(const PromiseHandle& other) const { return id != other.id; }
};

using Value = std::variant<
    std::monostate,
    double,
    std::string,
    bool,
    ArrayPtr,
    RecordPtr,
    FunctionPtr,
    PromiseHandle>;

struct ArrayValue {
    std::vector<Value> elements;
};

// Fields keep insertion order; keys are unique.
struct RecordValue {
    std::vector<std::pair<std::string, Value>> fields;

    const Value* find(const std::string& key) const {
        for (const auto& f : fields) {
            if (f.first == key) return &f.second;
        }
        return nullptr;
    }

    void set(const std::string& key, const Value& v) {
        for (auto& f : fields) {
            if (f.first == key) {
                f.second = v;
                return;
            }
        }
        fields.emplace_back(key, v);
    }

    size_t size() const { return fields.size(); }
    bool empty() const { return fields.empty(); }
};

using NativeFn = std::function<Value(const std::vector<Value>&, const Token&)>;

struct FunctionValue {
    std::string name;
    std::vector<std::string> parameters;
    std::shared_ptr<FunctionDeclarationNode> body;
    EnvPtr closure;
    Token token;
    bool is_async = false;
    bool is_native = false;
    NativeFn native_impl;

    // user function: keeps its own copy of the declaration
    FunctionValue(
        const std::string& nm,
        const std::shared_ptr<FunctionDeclarationNode>& b,
        const EnvPtr& env,
        const Token& tok) : name(nm),
                            parameters(b ? b->parameters : std::vector<std::string>{}),
                            body(b),
                            closure(env),
                            token(tok),
                            is_async(b ? b->is_async : false),
                            is_native(false) {
    }

    // native built-in
    FunctionValue(
        const std::string& nm,
        NativeFn impl,
        const EnvPtr& env,
        const Token& tok) : name(nm),
                            body(nullptr),
                            closure(env),
                            token(tok),
                            is_async(false),
                            is_native(true),
                            native_impl(std::move(impl)) {
    }
};

// ----- value operations (src/evaluator/ValueOps.cpp) -----

// Truthiness: null, 0, "", [] and {} are false.
bool coerce_boolean(const Value& v);

// Structural comparison. Mismatched shapes throw ChaosError(TypeMismatch) located at `at`.
bool value_equals(const Value& a, const Value& b, const Token& at);
// Number~Number or Text~Text only.
bool value_less_than(const Value& a, const Value& b, const Token& at);

std::string format_number(double d);
std::string value_to_string(const Value& v);
std::string type_name(const Value& v);

// "You've achieved the impossible: <detail>. Here's a virtual cookie 🍪"
std::string type_mismatch_message(const std::string& detail);
