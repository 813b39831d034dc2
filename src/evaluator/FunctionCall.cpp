#include <string>

#include "Frame.hpp"
#include "PromiseScheduler.hpp"
#include "UselessError.hpp"
#include "evaluator.hpp"

Value Evaluator::evaluate_call(CallExpressionNode* call, EnvPtr env) {
    // callee is resolved by name; it is not a chaos point
    const std::string& name = call->callee->name;
    Value calleeVal = env->lookup(name, call->callee->token);

    std::vector<Value> args;
    args.reserve(call->arguments.size());
    for (auto& a : call->arguments) {
        args.push_back(evaluate_expression(a.get(), env));
    }

    if (!std::holds_alternative<FunctionPtr>(calleeVal) || !std::get<FunctionPtr>(calleeVal)) {
        std::string t = type_name(calleeVal);
        throw ChaosError(ErrorKind::TypeMismatch,
            type_mismatch_message("'" + name + "' is a " + t + ", and a " + t + " does not answer calls 📞"),
            call->token.loc);
    }
    return call_function(std::get<FunctionPtr>(calleeVal), args, call->token);
}

Value Evaluator::call_function(FunctionPtr fn, const std::vector<Value>& args, const Token& callToken) {
    if (fn->is_native) {
        return fn->native_impl(args, callToken);
    }

    switch (chaos_.mischief_function_call()) {
        case CallMischief::ReturnNull:
            return std::monostate{};
        case CallMischief::TaskFailed:
            throw ChaosError(ErrorKind::TaskFailedSuccessfully, messages::task_failed_successfully, callToken.loc);
        case CallMischief::CoffeeBreak:
            throw ChaosError(ErrorKind::CoffeeBreak, messages::coffee_break(fn->name), callToken.loc);
        case CallMischief::None:
            break;
    }

    // callee scope hangs off the captured scope, not the caller's
    EnvPtr local = std::make_shared<Environment>(fn->closure);
    for (size_t i = 0; i < fn->parameters.size(); ++i) {
        local->define(fn->parameters[i], i < args.size() ? args[i] : Value(std::monostate{}));
    }

    auto frame = std::make_shared<CallFrame>();
    frame->function = fn;
    frame->env = local;
    frame->body = &fn->body->body;
    frame->call_token = callToken;
    frame->label = fn->name;
    frame->is_async = fn->is_async;

    if (fn->is_async) {
        // Run right away until the first pending await; the caller gets the task promise.
        frame->task = scheduler_->create_task();
        execute_frame_until_await_or_return(frame);
        return *frame->task;
    }

    push_frame(frame);
    Value ret_val = std::monostate{};
    bool did_return = false;
    try {
        execute_block(fn->body->body, local, false, &ret_val, &did_return, nullptr);
    } catch (const std::exception&) {
        pop_frame();
        throw;
    }
    pop_frame();
    return ret_val;
}
