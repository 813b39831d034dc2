#include <stdexcept>
#include <string>

#include "Frame.hpp"
#include "PromiseScheduler.hpp"
#include "UselessError.hpp"
#include "evaluator.hpp"

// Every expression passes through the two chaos stages after it is evaluated.
// In an async frame the final value is kept until the statement finishes.
Value Evaluator::evaluate_expression(ExpressionNode* expr, EnvPtr env) {
    CallFramePtr frame = current_frame();
    bool resumable = frame && frame->is_async && expr;
    if (resumable) {
        auto done = frame->expression_results.find(expr);
        if (done != frame->expression_results.end()) return done->second;
    }

    Value v = evaluate_expression_raw(expr, env);
    v = chaos_.maybe_randomize_expression_result(v);
    if (const bool* b = std::get_if<bool>(&v)) {
        v = chaos_.maybe_flip_boolean(*b);
    }

    if (resumable) frame->expression_results[expr] = v;
    return v;
}

Value Evaluator::evaluate_expression_raw(ExpressionNode* expr, EnvPtr env) {
    if (!expr) return std::monostate{};

    if (auto n = dynamic_cast<NumericLiteralNode*>(expr)) {
        if (chaos_.mischief_party_number()) return party_text(n->value);
        return n->value;
    }
    if (auto s = dynamic_cast<StringLiteralNode*>(expr)) {
        return s->value;
    }
    if (auto b = dynamic_cast<BooleanLiteralNode*>(expr)) {
        return b->value;
    }
    if (dynamic_cast<NullNode*>(expr)) {
        return std::monostate{};
    }

    if (auto id = dynamic_cast<IdentifierNode*>(expr)) {
        if (chaos_.mischief_identifier_vacation()) {
            throw ChaosError(ErrorKind::NameNotFound, not_found_message(id->name + " (it's on vacation)"), id->token.loc);
        }
        return env->lookup(id->name, id->token);
    }

    if (auto arr = dynamic_cast<ArrayExpressionNode*>(expr)) {
        auto out = std::make_shared<ArrayValue>();
        out->elements.reserve(arr->elements.size());
        for (auto& e : arr->elements) {
            out->elements.push_back(evaluate_expression(e.get(), env));
        }
        return out;
    }

    if (auto rec = dynamic_cast<RecordExpressionNode*>(expr)) {
        auto out = std::make_shared<RecordValue>();
        for (auto& f : rec->fields) {
            out->set(f.first, evaluate_expression(f.second.get(), env));
        }
        return out;
    }

    if (auto call = dynamic_cast<CallExpressionNode*>(expr)) {
        return evaluate_call(call, env);
    }

    if (auto aw = dynamic_cast<AwaitExpressionNode*>(expr)) {
        return evaluate_await(aw, env);
    }

    throw std::logic_error("Unhandled expression node: " + expr->to_string());
}

Value Evaluator::evaluate_await(AwaitExpressionNode* node, EnvPtr env) {
    CallFramePtr frame = current_frame();
    if (!frame || !frame->is_async) {
        throw ChaosError(ErrorKind::TypeMismatch,
            type_mismatch_message("await only works inside async functions or at the top level"),
            node->token.loc);
    }

    // answered on an earlier pass through this statement
    auto done = frame->awaited_results.find(node);
    if (done != frame->awaited_results.end()) return done->second;
    auto failed = frame->awaited_errors.find(node);
    if (failed != frame->awaited_errors.end()) throw ChaosError(failed->second);

    Value operand = evaluate_expression(node->expression.get(), env);
    const PromiseHandle* ph = std::get_if<PromiseHandle>(&operand);
    if (!ph) return operand;

    PromiseHandle handle = *ph;
    scheduler_->mark_awaited(handle);

    const PromiseEntry& entry = scheduler_->entry(handle);
    switch (entry.status) {
        case PromiseStatus::Resolved:
            frame->awaited_results[node] = entry.value;
            return entry.value;
        case PromiseStatus::Rejected:
        case PromiseStatus::Abandoned: {
            ErrorValue err = entry.error;
            if (!err.span) err.span = node->token.loc;
            frame->awaited_errors[node] = err;
            throw ChaosError(err);
        }
        case PromiseStatus::Pending:
            break;
    }

    scheduler_->suspend(handle, [this, frame, node, handle]() {
        resume_frame(frame, node, handle);
    });
    throw SuspendExecution();
}
