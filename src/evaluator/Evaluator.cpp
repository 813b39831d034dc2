// src/evaluator/Evaluator.cpp
#include "evaluator.hpp"

#include <stdexcept>

#include "Frame.hpp"
#include "Presenter.hpp"
#include "PromiseScheduler.hpp"

Evaluator::Evaluator(Presenter& presenter, const RuntimeOptions& options)
    : presenter_(presenter),
      options_(options),
      rng_(options.seed),
      chaos_(rng_, ChaosOptions{options.mischief, options.trace}),
      scheduler_(std::make_unique<PromiseScheduler>(chaos_, SchedulerOptions{options.tick_ms, options.default_timeout_ms, options.trace})),
      global_env(std::make_shared<Environment>(nullptr)) {
    init_builtins(global_env);
    // user code lives one scope below the built-ins so it can shadow them
    program_env = std::make_shared<Environment>(global_env);
    chaos_.trace("seed", std::to_string(rng_.seed()));
}

Evaluator::~Evaluator() = default;

void Evaluator::push_frame(CallFramePtr f) {
    call_stack_.push_back(f);
}

void Evaluator::pop_frame() {
    if (!call_stack_.empty()) call_stack_.pop_back();
}

CallFramePtr Evaluator::current_frame() {
    if (call_stack_.empty()) return nullptr;
    return call_stack_.back();
}

// Runs (or resumes) an async frame until it awaits something pending or finishes.
// Finishing settles the frame's task promise; the program frame has none and lets errors escape.
void Evaluator::execute_frame_until_await_or_return(CallFramePtr frame) {
    if (!frame || !frame->body) return;

    push_frame(frame);
    frame->is_suspended = false;

    Value ret_val = std::monostate{};
    bool did_return = false;
    try {
        execute_block(*frame->body, frame->env, false, &ret_val, &did_return, nullptr);
    } catch (const SuspendExecution&) {
        // Normal suspension: block cursors keep the position, the continuation is parked.
        frame->is_suspended = true;
        pop_frame();
        return;
    } catch (const ChaosError& e) {
        pop_frame();
        if (e.fatal() || !frame->task) throw;
        scheduler_->reject_task(*frame->task, e.error());
        return;
    } catch (const std::exception&) {
        pop_frame();
        throw;
    }

    pop_frame();
    if (frame->task) scheduler_->resolve_task(*frame->task, ret_val);
}

void Evaluator::resume_frame(CallFramePtr frame, const AwaitExpressionNode* node, PromiseHandle awaited) {
    const PromiseEntry& entry = scheduler_->entry(awaited);
    if (entry.status == PromiseStatus::Resolved) {
        frame->awaited_results[node] = entry.value;
    } else {
        ErrorValue err = entry.error;
        if (!err.span) err.span = node->token.loc;
        frame->awaited_errors[node] = err;
    }
    execute_frame_until_await_or_return(frame);
}

void Evaluator::evaluate(ProgramNode* program) {
    if (!program) return;

    if (chaos_.mischief_teapot_at_start()) {
        throw ChaosError(ErrorKind::TeapotError, messages::teapot, program->token.loc);
    }

    // The program runs as the root task so top-level await can suspend it.
    auto frame = std::make_shared<CallFrame>();
    frame->env = program_env;
    frame->body = &program->body;
    frame->call_token = program->token;
    frame->label = "<program>";
    frame->is_async = true;

    execute_frame_until_await_or_return(frame);
    scheduler_->run_until_idle();

    if (chaos_.mischief_perfectly_wrong()) {
        throw ChaosError(ErrorKind::PerfectlyWrong, messages::perfectly_wrong);
    }
}

Evaluator::RunStatus Evaluator::run(ProgramNode* program) {
    try {
        evaluate(program);
    } catch (const ChaosError& e) {
        presenter_.present_error(e.what());
        return e.fatal() ? RunStatus::FatalCrash : RunStatus::ChaosCrash;
    }
    return report_pending_problems() ? RunStatus::ChaosCrash : RunStatus::Ok;
}

// Unhandled task rejections and continuations that can never resume.
bool Evaluator::report_pending_problems() {
    bool problems = false;
    for (const PromiseEntry* e : scheduler_->unhandled_rejections()) {
        std::string where = e->error.span ? " at " + e->error.span->to_string() : "";
        presenter_.present_error("Unhandled rejection of task #" + std::to_string(e->handle.id) + ": " +
            error_kind_name(e->error.kind) + where + "\n" + e->error.message);
        problems = true;
    }
    size_t stuck = scheduler_->suspended_count();
    if (stuck > 0) {
        presenter_.present_error(std::to_string(stuck) +
            " task(s) are still waiting for promises that will never settle. They have been left to contemplate their choices ⏳");
        problems = true;
    }
    return problems;
}

Value Evaluator::evaluate_expression(ExpressionNode* expr) {
    return evaluate_expression(expr, program_env);
}

Value Evaluator::call_builtin(const std::string& name, const std::vector<Value>& args, const Token& callToken) {
    Value v = global_env->lookup(name, callToken);
    FunctionPtr fn = std::holds_alternative<FunctionPtr>(v) ? std::get<FunctionPtr>(v) : nullptr;
    if (!fn || !fn->is_native) {
        throw std::logic_error("'" + name + "' is not a built-in primitive");
    }
    return fn->native_impl(args, callToken);
}
