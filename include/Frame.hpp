#pragma once
#include <functional>
#include <memory>
#include <optional>
#include <unordered_map>

#include "ast.hpp"
#include "evaluator.hpp"

struct CallFrame {
    FunctionPtr function;  // null for the program itself
    std::shared_ptr<Environment> env;
    const StatementList* body = nullptr;
    Token call_token;
    std::string label;
    bool is_async = false;
    bool is_suspended = false;

    // promise settled when the body finishes; absent for the program frame
    std::optional<PromiseHandle> task;

    // Block position persistence for async frames, keyed by the block's statement list.
    // `next` is the statement that was running when the frame suspended.
    struct BlockState {
        EnvPtr env;
        size_t next = 0;
    };
    std::unordered_map<const void*, BlockState> blocks;

    bool has_block_state(const void* block) const {
        return blocks.find(block) != blocks.end();
    }

    // --- await bookkeeping (keyed by the AwaitExpressionNode pointer)
    std::unordered_map<const AwaitExpressionNode*, Value> awaited_results;
    std::unordered_map<const AwaitExpressionNode*, ErrorValue> awaited_errors;

    // Results of sub-expressions that finished during the statement in progress.
    // A resumed statement reads these instead of evaluating (and drawing chaos) again.
    std::unordered_map<const ExpressionNode*, Value> expression_results;

    void statement_finished() {
        expression_results.clear();
        awaited_results.clear();
        awaited_errors.clear();
    }
};
using CallFramePtr = std::shared_ptr<CallFrame>;

using Continuation = std::function<void()>;
