#pragma once

#include <cstdint>
#include <exception>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <unordered_map>
#include <utility>
#include <variant>
#include <vector>

#include "ChaosPolicy.hpp"
#include "UselessError.hpp"
#include "ast.hpp"
#include "config.hpp"
#include "token.hpp"
#include "value.hpp"

// NOTE: Frame.hpp and PromiseScheduler.hpp include this header; only forward-declare here.
class PromiseScheduler;
class Presenter;

struct CallFrame;
using CallFramePtr = std::shared_ptr<CallFrame>;

// Environment with lexical parent pointer
class Environment : public std::enable_shared_from_this<Environment> {
   public:
    Environment(EnvPtr parent = nullptr) : parent(parent) {
    }

    // map from name -> value slot
    std::unordered_map<std::string, Value> values;
    EnvPtr parent;

    // check if name exists in this environment or any parent
    bool has(const std::string& name) const;

    // Walks innermost to outermost. Throws NameNotFound if absent everywhere.
    Value lookup(const std::string& name) const;
    Value lookup(const std::string& name, const Token& at) const;

    // set variable in the current environment (creates or replaces)
    void define(const std::string& name, const Value& value);

    // rebind the nearest existing binding; NameNotFound if there is none
    void assign(const std::string& name, const Value& value, const Token& at);

    EnvPtr child_scope();

   private:
    const Value* find_slot(const std::string& name) const;
};

std::string not_found_message(const std::string& name);

struct LoopControl {
    bool did_break = false;
};

struct SuspendExecution : public std::exception {
    // Thrown when an await parks the current frame. Only the frame runner catches it.
    const char* what() const noexcept override { return "Execution suspended for await"; }
};

class Evaluator {
   public:
    enum class RunStatus {
        Ok = 0,
        ChaosCrash = 1,
        FatalCrash = 2
    };

    Evaluator(Presenter& presenter, const RuntimeOptions& options = RuntimeOptions());
    ~Evaluator();

    // Evaluate whole program, driving the scheduler to completion.
    // Uncaught language errors escape as ChaosError.
    void evaluate(ProgramNode* program);

    // evaluate() plus error presentation; maps the outcome to a status.
    RunStatus run(ProgramNode* program);

    // Evaluate a single expression (with chaos) in the program scope.
    Value evaluate_expression(ExpressionNode* expr);

    // Invoke a built-in primitive directly, bypassing expression chaos.
    Value call_builtin(const std::string& name, const std::vector<Value>& args, const Token& callToken = Token());

    ChaosPolicy& chaos() { return chaos_; }
    PromiseScheduler& scheduler() { return *scheduler_; }
    EnvPtr global_environment() const { return global_env; }
    EnvPtr program_environment() const { return program_env; }
    uint64_t seed() const { return rng_.seed(); }

   private:
    Presenter& presenter_;
    RuntimeOptions options_;

    ChaosRng rng_;
    ChaosPolicy chaos_;
    std::unique_ptr<PromiseScheduler> scheduler_;

    EnvPtr global_env;
    EnvPtr program_env;

    std::vector<CallFramePtr> call_stack_;

    // call frame helpers
    void push_frame(CallFramePtr f);
    void pop_frame();
    CallFramePtr current_frame();
    void execute_frame_until_await_or_return(CallFramePtr frame);
    void resume_frame(CallFramePtr frame, const AwaitExpressionNode* node, PromiseHandle awaited);

    // globals
    void init_builtins(EnvPtr env);

    // statements
    void evaluate_statement(StatementNode* stmt, EnvPtr env, Value* return_value, bool* did_return, LoopControl* lc);
    void execute_block(const StatementList& body, EnvPtr env, bool create_scope, Value* return_value, bool* did_return, LoopControl* lc);

    // expressions
    Value evaluate_expression(ExpressionNode* expr, EnvPtr env);
    Value evaluate_expression_raw(ExpressionNode* expr, EnvPtr env);
    Value evaluate_call(CallExpressionNode* call, EnvPtr env);
    Value evaluate_await(AwaitExpressionNode* node, EnvPtr env);

    // functions
    Value call_function(FunctionPtr fn, const std::vector<Value>& args, const Token& callToken);

    // built-in primitives
    Value builtin_add(const std::vector<Value>& args, const Token& tok);
    Value builtin_multiply(const std::vector<Value>& args, const Token& tok);
    Value builtin_equals(const std::vector<Value>& args, const Token& tok);
    Value builtin_less_than(const std::vector<Value>& args, const Token& tok);
    Value builtin_index(const std::vector<Value>& args, const Token& tok);
    Value builtin_access(const std::vector<Value>& args, const Token& tok);
    Value builtin_print(const std::vector<Value>& args, const Token& tok);
    Value builtin_save(const std::vector<Value>& args, const Token& tok);
    Value builtin_exit(const std::vector<Value>& args, const Token& tok);
    Value builtin_promise(const std::vector<Value>& args, const Token& tok);

    Value compare_with_chaos(const std::vector<Value>& args, const Token& tok, bool less);
    void maybe_teapot(const Token& tok);
    bool report_pending_problems();
};
