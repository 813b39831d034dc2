#pragma once
#include <memory>
#include <sstream>
#include <string>
#include <utility>
#include <vector>

#include "token.hpp"

// Base class for all AST nodes
struct Node {
    virtual ~Node() = default;
    Token token;  // filename, line, column for this node (set by the parser)

    virtual std::string to_string() const {
        return "<node>";
    }
};

// Expressions
struct ExpressionNode : public Node {
    // Function declarations are persisted by the evaluator, which clones their bodies.
    virtual std::unique_ptr<ExpressionNode> clone() const = 0;
};

struct NumericLiteralNode : public ExpressionNode {
    double value = 0.0;
    std::string to_string() const override {
        std::ostringstream ss;
        ss << value;
        return ss.str();
    }
    std::unique_ptr<ExpressionNode> clone() const override {
        auto n = std::make_unique<NumericLiteralNode>();
        n->value = value;
        n->token = token;
        return n;
    }
};

struct StringLiteralNode : public ExpressionNode {
    std::string value;
    std::string to_string() const override {
        return "\"" + value + "\"";
    }
    std::unique_ptr<ExpressionNode> clone() const override {
        auto n = std::make_unique<StringLiteralNode>();
        n->value = value;
        n->token = token;
        return n;
    }
};

struct BooleanLiteralNode : public ExpressionNode {
    bool value = false;
    std::string to_string() const override {
        return value ? "true" : "false";
    }
    std::unique_ptr<ExpressionNode> clone() const override {
        auto n = std::make_unique<BooleanLiteralNode>();
        n->value = value;
        n->token = token;
        return n;
    }
};

struct NullNode : public ExpressionNode {
    std::string to_string() const override {
        return "null";
    }
    std::unique_ptr<ExpressionNode> clone() const override {
        auto n = std::make_unique<NullNode>();
        n->token = token;
        return n;
    }
};

struct IdentifierNode : public ExpressionNode {
    std::string name;
    std::string to_string() const override {
        return name;
    }
    std::unique_ptr<ExpressionNode> clone() const override {
        auto n = std::make_unique<IdentifierNode>();
        n->name = name;
        n->token = token;
        return n;
    }
};

struct ArrayExpressionNode : public ExpressionNode {
    std::vector<std::unique_ptr<ExpressionNode>> elements;

    std::string to_string() const override {
        std::string s = "[";
        for (size_t i = 0; i < elements.size(); ++i) {
            if (i) s += ", ";
            s += elements[i] ? elements[i]->to_string() : "<null>";
        }
        return s + "]";
    }
    std::unique_ptr<ExpressionNode> clone() const override {
        auto n = std::make_unique<ArrayExpressionNode>();
        n->token = token;
        n->elements.reserve(elements.size());
        for (const auto& e : elements) n->elements.push_back(e ? e->clone() : nullptr);
        return n;
    }
};

// Record literal: { "name": expr, other: expr }. Field order is the source order.
struct RecordExpressionNode : public ExpressionNode {
    std::vector<std::pair<std::string, std::unique_ptr<ExpressionNode>>> fields;

    std::string to_string() const override {
        std::string s = "{";
        for (size_t i = 0; i < fields.size(); ++i) {
            if (i) s += ", ";
            s += "\"" + fields[i].first + "\": " + (fields[i].second ? fields[i].second->to_string() : "<null>");
        }
        return s + "}";
    }
    std::unique_ptr<ExpressionNode> clone() const override {
        auto n = std::make_unique<RecordExpressionNode>();
        n->token = token;
        n->fields.reserve(fields.size());
        for (const auto& f : fields) n->fields.emplace_back(f.first, f.second ? f.second->clone() : nullptr);
        return n;
    }
};

struct CallExpressionNode : public ExpressionNode {
    std::unique_ptr<IdentifierNode> callee;
    std::vector<std::unique_ptr<ExpressionNode>> arguments;

    std::string to_string() const override {
        std::string c = callee ? callee->to_string() : "<null>";
        std::string args;
        for (size_t i = 0; i < arguments.size(); ++i) {
            if (i) args += ", ";
            args += arguments[i] ? arguments[i]->to_string() : "<null>";
        }
        return c + "(" + args + ")";
    }

    std::unique_ptr<ExpressionNode> clone() const override {
        auto n = std::make_unique<CallExpressionNode>();
        n->token = token;
        if (callee) {
            n->callee = std::unique_ptr<IdentifierNode>(static_cast<IdentifierNode*>(callee->clone().release()));
        }
        n->arguments.reserve(arguments.size());
        for (const auto& a : arguments) n->arguments.push_back(a ? a->clone() : nullptr);
        return n;
    }
};

// await <expr>. The node address identifies the await inside a suspended task.
struct AwaitExpressionNode : public ExpressionNode {
    std::unique_ptr<ExpressionNode> expression;
    std::string to_string() const override {
        return "await " + (expression ? expression->to_string() : "<null>");
    }

    std::unique_ptr<ExpressionNode> clone() const override {
        auto n = std::make_unique<AwaitExpressionNode>();
        n->token = token;
        n->expression = expression ? expression->clone() : nullptr;
        return n;
    }
};

// Statements
struct StatementNode : public Node {
    virtual std::unique_ptr<StatementNode> clone() const = 0;
};

using StatementList = std::vector<std::unique_ptr<StatementNode>>;

inline StatementList clone_statements(const StatementList& body) {
    StatementList out;
    out.reserve(body.size());
    for (const auto& s : body) out.push_back(s ? s->clone() : nullptr);
    return out;
}

struct VariableDeclarationNode : public StatementNode {
    std::string identifier;
    std::unique_ptr<ExpressionNode> value;

    std::string to_string() const override {
        return "let " + identifier + " = " + (value ? value->to_string() : "<null>");
    }
    std::unique_ptr<StatementNode> clone() const override {
        auto n = std::make_unique<VariableDeclarationNode>();
        n->token = token;
        n->identifier = identifier;
        n->value = value ? value->clone() : nullptr;
        return n;
    }
};

// name = expr; rebinds the nearest existing binding
struct AssignmentNode : public StatementNode {
    std::string identifier;
    std::unique_ptr<ExpressionNode> value;

    std::unique_ptr<StatementNode> clone() const override {
        auto n = std::make_unique<AssignmentNode>();
        n->token = token;
        n->identifier = identifier;
        n->value = value ? value->clone() : nullptr;
        return n;
    }
};

struct ExpressionStatementNode : public StatementNode {
    std::unique_ptr<ExpressionNode> expression;

    std::string to_string() const override {
        return expression ? expression->to_string() : "<null>";
    }
    std::unique_ptr<StatementNode> clone() const override {
        auto n = std::make_unique<ExpressionStatementNode>();
        n->token = token;
        n->expression = expression ? expression->clone() : nullptr;
        return n;
    }
};

struct IfStatementNode : public StatementNode {
    std::unique_ptr<ExpressionNode> condition;
    StatementList then_body;
    StatementList else_body;
    bool has_else = false;

    std::unique_ptr<StatementNode> clone() const override {
        auto n = std::make_unique<IfStatementNode>();
        n->token = token;
        n->condition = condition ? condition->clone() : nullptr;
        n->has_else = has_else;
        n->then_body = clone_statements(then_body);
        n->else_body = clone_statements(else_body);
        return n;
    }
};

// loop [(condition)] { ... }. The condition is kept for round-tripping only.
struct LoopStatementNode : public StatementNode {
    std::unique_ptr<ExpressionNode> condition;  // optional
    StatementList body;

    std::unique_ptr<StatementNode> clone() const override {
        auto n = std::make_unique<LoopStatementNode>();
        n->token = token;
        n->condition = condition ? condition->clone() : nullptr;
        n->body = clone_statements(body);
        return n;
    }
};

struct BreakStatementNode : public StatementNode {
    std::unique_ptr<StatementNode> clone() const override {
        auto n = std::make_unique<BreakStatementNode>();
        n->token = token;
        return n;
    }

    std::string to_string() const override {
        return "break";
    }
};

struct FunctionDeclarationNode : public StatementNode {
    std::string name;
    std::vector<std::string> parameters;
    StatementList body;
    bool is_async = false;

    std::string to_string() const override {
        std::string s = is_async ? "async " : "";
        s += name + "(";
        for (size_t i = 0; i < parameters.size(); ++i) {
            if (i) s += ", ";
            s += parameters[i];
        }
        return s + ") { ... }";
    }

    std::unique_ptr<StatementNode> clone() const override {
        auto n = std::make_unique<FunctionDeclarationNode>();
        n->token = token;
        n->name = name;
        n->parameters = parameters;
        n->is_async = is_async;
        n->body = clone_statements(body);
        return n;
    }
};

struct ReturnStatementNode : public StatementNode {
    std::unique_ptr<ExpressionNode> value;  // optional

    std::unique_ptr<StatementNode> clone() const override {
        auto n = std::make_unique<ReturnStatementNode>();
        n->token = token;
        n->value = value ? value->clone() : nullptr;
        return n;
    }
};

struct TryCatchNode : public StatementNode {
    StatementList tryBlock;
    std::string errorVar;
    StatementList catchBlock;

    std::unique_ptr<StatementNode> clone() const override {
        auto n = std::make_unique<TryCatchNode>();
        n->token = token;
        n->errorVar = errorVar;
        n->tryBlock = clone_statements(tryBlock);
        n->catchBlock = clone_statements(catchBlock);
        return n;
    }

    std::string to_string() const override {
        return "try { ... } catch " + errorVar + " { ... }";
    }
};

// Program root
struct ProgramNode : public Node {
    StatementList body;
};
