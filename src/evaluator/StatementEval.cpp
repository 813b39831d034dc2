#include <optional>
#include <stdexcept>
#include <string>

#include "Frame.hpp"
#include "UselessError.hpp"
#include "evaluator.hpp"

// Runs a statement list. Inside an async frame the position is recorded per block
// so a suspended frame re-enters at the statement that awaited. Sub-expressions
// that finished before the suspension keep their results until the statement ends.
void Evaluator::execute_block(const StatementList& body, EnvPtr env, bool create_scope, Value* return_value, bool* did_return, LoopControl* lc) {
    CallFramePtr frame = current_frame();
    bool resumable = frame && frame->is_async;

    EnvPtr scope;
    size_t start = 0;
    if (resumable) {
        auto it = frame->blocks.find(&body);
        if (it != frame->blocks.end()) {
            scope = it->second.env;
            start = it->second.next;
        } else {
            scope = create_scope ? std::make_shared<Environment>(env) : env;
            frame->blocks[&body] = CallFrame::BlockState{scope, 0};
        }
    } else {
        scope = create_scope ? std::make_shared<Environment>(env) : env;
    }

    for (size_t i = start; i < body.size(); ++i) {
        if (resumable) frame->blocks[&body].next = i;
        try {
            evaluate_statement(body[i].get(), scope, return_value, did_return, lc);
        } catch (const SuspendExecution&) {
            throw;
        } catch (const std::exception&) {
            if (resumable) {
                frame->blocks.erase(&body);
                frame->statement_finished();
            }
            throw;
        }
        if (resumable) frame->statement_finished();
        if (*did_return || (lc && lc->did_break)) break;
    }

    if (resumable) frame->blocks.erase(&body);
}

void Evaluator::evaluate_statement(StatementNode* stmt, EnvPtr env, Value* return_value, bool* did_return, LoopControl* lc) {
    if (!stmt) return;

    if (auto vd = dynamic_cast<VariableDeclarationNode*>(stmt)) {
        Value val = vd->value ? evaluate_expression(vd->value.get(), env) : Value(std::monostate{});
        if (chaos_.mischief_lost_binding()) {
            throw ChaosError(ErrorKind::NameNotFound, not_found_message(vd->identifier), vd->token.loc);
        }
        env->define(vd->identifier, val);
        return;
    }

    if (auto an = dynamic_cast<AssignmentNode*>(stmt)) {
        Value val = evaluate_expression(an->value.get(), env);
        env->assign(an->identifier, val, an->token);
        return;
    }

    if (auto es = dynamic_cast<ExpressionStatementNode*>(stmt)) {
        evaluate_expression(es->expression.get(), env);
        return;
    }

    if (auto ifn = dynamic_cast<IfStatementNode*>(stmt)) {
        CallFramePtr frame = current_frame();
        bool resuming = frame && frame->is_async && frame->has_block_state(&ifn->else_body);

        if (!resuming) {
            // evaluated for its draws and side effects; the branch choice ignores it
            evaluate_expression(ifn->condition.get(), env);
        }

        // The then branch never runs.
        if (!chaos_.invert_branch_always() || !ifn->has_else) return;

        if (!resuming && chaos_.mischief_creative_else()) {
            throw ChaosError(ErrorKind::CreativeBreakage, messages::creative_breakage, ifn->token.loc);
        }
        chaos_.trace("if", "else");
        execute_block(ifn->else_body, env, true, return_value, did_return, lc);
        return;
    }

    if (auto loop = dynamic_cast<LoopStatementNode*>(stmt)) {
        CallFramePtr frame = current_frame();
        bool resuming = frame && frame->is_async && frame->has_block_state(&loop->body);

        // the condition, if any, is never evaluated
        if (!resuming && chaos_.mischief_loop_failure()) {
            throw ChaosError(ErrorKind::TaskFailedSuccessfully, messages::task_failed_successfully, loop->token.loc);
        }

        LoopControl loopLc;
        for (int pass = 0; pass < chaos_.loop_once(); ++pass) {
            execute_block(loop->body, env, true, return_value, did_return, &loopLc);
            if (loopLc.did_break || *did_return) break;
        }
        return;
    }

    if (auto fd = dynamic_cast<FunctionDeclarationNode*>(stmt)) {
        // the function keeps its own copy of the declaration; the AST may not outlive it
        auto persisted = std::shared_ptr<FunctionDeclarationNode>(
            static_cast<FunctionDeclarationNode*>(fd->clone().release()));
        auto fn = std::make_shared<FunctionValue>(fd->name, persisted, env, fd->token);
        env->define(fd->name, fn);
        return;
    }

    if (auto rs = dynamic_cast<ReturnStatementNode*>(stmt)) {
        *return_value = rs->value ? evaluate_expression(rs->value.get(), env) : Value(std::monostate{});
        *did_return = true;
        return;
    }

    if (auto bs = dynamic_cast<BreakStatementNode*>(stmt)) {
        if (!lc) {
            throw ChaosError(ErrorKind::TypeMismatch,
                type_mismatch_message("'break' outside of a loop has nowhere to go"),
                bs->token.loc);
        }
        lc->did_break = true;
        return;
    }

    if (auto tc = dynamic_cast<TryCatchNode*>(stmt)) {
        CallFramePtr frame = current_frame();
        if (frame && frame->is_async && frame->has_block_state(&tc->catchBlock)) {
            // resuming inside the catch body: its scope (with the error binding) is in the cursor
            execute_block(tc->catchBlock, env, false, return_value, did_return, lc);
            return;
        }

        std::optional<ErrorValue> caught;
        try {
            execute_block(tc->tryBlock, env, true, return_value, did_return, lc);
        } catch (const ChaosError& e) {
            if (e.fatal()) throw;
            caught = e.error();
        }
        if (!caught) return;

        auto record = std::make_shared<RecordValue>();
        record->set("kind", std::string(error_kind_name(caught->kind)));
        record->set("message", caught->message);

        auto catchEnv = std::make_shared<Environment>(env);
        catchEnv->define(tc->errorVar, record);
        execute_block(tc->catchBlock, catchEnv, false, return_value, did_return, lc);
        return;
    }

    throw std::logic_error("Unhandled statement node: " + stmt->to_string());
}
