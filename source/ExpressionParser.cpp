// SPDX-License-Identifier: Apache-2.0
#include "Errors.hpp"
#include "Parser.hpp"
#include "SyntaxTree.hpp"

// whether node can be the end of an operand, i.e. what follows is an operator or a body
static bool endsOperand(const SyntaxNode* node) {
    if (node->kind != SyntaxKind::Token)
        return true;
    const Token& token = node->as<TokenSyntax>().token;
    return token.isOperandName() || token.isLiteral() || token.is("?") || token.is("@");
}

// `Path {` starts a struct literal, `cond {` or `=> {` a block
static bool startsStructLiteral(const SyntaxNode* node) {
    if (node->kind != SyntaxKind::Token)
        return false;
    const Token& token = node->as<TokenSyntax>().token;
    return token.isIdentifier() && (!token.isKeyword() || token.is("Self"));
}

// whether a '|' following parts opens closure (or quantifier) parameters
static bool closureCanStart(const SmallVectorBase<SyntaxNode*>& parts) {
    if (parts.empty())
        return true;
    const SyntaxNode* last = parts.back();
    if (last->kind == SyntaxKind::Token) {
        const Token& token = last->as<TokenSyntax>().token;
        if (token.is("move") || token.is("forall") || token.is("exists") || token.is("choose"))
            return true;
    }
    return !endsOperand(last);
}

BlockSyntax* Parser::parseBlock() {
    auto block = make<BlockSyntax>();
    SmallVector<SyntaxNode*, 32> children;
    const Token open = peek();
    block->open = expectKind(TokenKind::OpenBrace, "'{'");
    children.push_back(block->open);
    while (peek().kind != TokenKind::CloseBrace) {
        if (atEnd())
            error(open, "unclosed block");
        children.push_back(parseStatement());
    }
    block->close = consume();
    children.push_back(block->close);
    return finish(block, children);
}

SyntaxNode* Parser::parseStatement() {
    if (peekIs(";"))
        return consume();

    if (isItemStart(skipAttributes(index))) {
        auto statement = make<ItemStatementSyntax>();
        SmallVector<SyntaxNode*, 1> children;
        statement->item = parseItem(false);
        children.push_back(statement->item);
        return finish(statement, children);
    }

    SmallVector<SyntaxNode*, 8> children;
    parseAttributes(children);
    if (peekIs("let"))
        return parseLet(children);

    SyntaxNode* seed = nullptr;
    if (macroPathLength(index)) {
        auto macro = parseMacroInvocation();
        bool braced = macro->body->getFirstToken()->token.kind == TokenKind::OpenBrace;
        if (peekIs(";") || braced || peek().kind == TokenKind::CloseBrace) {
            auto statement = make<MacroStatementSyntax>();
            statement->macro = macro;
            children.push_back(macro);
            if (peekIs(";")) {
                statement->semicolon = consume();
                children.push_back(statement->semicolon);
            }
            return finish(statement, children);
        }
        // macro call is only the start of a longer expression
        seed = macro;
    }

    auto statement = make<ExpressionStatementSyntax>();
    statement->expression = parseExpression(Statement | StopAtSemicolon, seed);
    children.push_back(statement->expression);
    if (peekIs(";")) {
        statement->semicolon = consume();
        children.push_back(statement->semicolon);
    }
    return finish(statement, children);
}

LetStatementSyntax* Parser::parseLet(Children& children) {
    auto statement = make<LetStatementSyntax>();
    children.push_back(expect("let", "to start a binding"));
    if ((peekIs("ghost") || peekIs("tracked")) &&
        (peek(1).isIdentifier() || peek(1).isOpenDelimiter())) {
        statement->qualifier = peekIs("tracked") ? Qualifier::Tracked : Qualifier::Ghost;
        children.push_back(consume());
    }

    size_t patternStart = children.size();
    consumeBalanced(children, [](const Token& token) {
        return token.is("=") || token.is(";") || token.is("else");
    });
    // only the keyword makes a binding ghost, `let g: Ghost<T>` is an executable value
    if (children.size() == patternStart)
        error(peek(), "expected pattern after 'let'");

    if (peekIs("=")) {
        children.push_back(consume());
        statement->initializer = parseExpression(StopAtSemicolon | StopAtElse);
        children.push_back(statement->initializer);
    }
    if (peekIs("else")) {
        children.push_back(consume());
        children.push_back(parseBlock());
    }
    children.push_back(expect(";", "after let statement"));
    return finish(statement, children);
}

ExpressionSyntax* Parser::parseExpression(uint32_t flags, SyntaxNode* seed) {
    auto expression = make<ExpressionSyntax>();
    SmallVector<SyntaxNode*, 16> parts;
    // nothing but a label seen yet
    bool leading = true;
    if (seed) {
        parts.push_back(seed);
        leading = false;
    }

    while (true) {
        const Token& token = peek();
        if (token.kind == TokenKind::EndOfFile || token.isCloseDelimiter())
            break;
        if (((flags & StopAtComma) && token.is(",")) ||
            ((flags & StopAtSemicolon) && token.is(";")) ||
            ((flags & StopAtFatArrow) && token.is("=>")) ||
            ((flags & StopAtElse) && token.is("else")))
            break;
        if (token.isIdentifier()) {
            if (((flags & StopAtLoopSpec) && !parts.empty() && isLoopSpecKeyword(token.text)) ||
                ((flags & StopAtContract) && isContractKeyword(token.text)) ||
                ((flags & StopAtVia) && token.is("via")) ||
                ((flags & StopAtWhen) && token.is("when")))
                break;
        }

        bool blockLike = false;
        bool endsStatement = false;
        if (token.kind == TokenKind::OpenBrace) {
            if ((flags & StopAtBody) && !parts.empty() && endsOperand(parts.back()))
                break;
            if ((flags & NoStruct) && !parts.empty())
                break;
            if (!parts.empty() && startsStructLiteral(parts.back())) {
                parts.push_back(parseGroup());
            } else {
                parts.push_back(parseBlock());
                blockLike = true;
            }
        } else if (token.kind == TokenKind::OpenParen || token.kind == TokenKind::OpenBracket) {
            parts.push_back(parseGroup());
        } else if (token.is("if")) {
            parseIf(parts);
            blockLike = true;
        } else if (token.is("match")) {
            parts.push_back(consume());
            parts.push_back(parseExpression(NoStruct));
            parts.push_back(parseMatchBody());
            blockLike = true;
        } else if (token.is("while")) {
            parts.push_back(consume());
            parts.push_back(parseExpression(NoStruct | StopAtLoopSpec));
            parseLoopTail(parts);
            blockLike = true;
        } else if (token.is("for")) {
            parts.push_back(consume());
            consumeBalanced(parts, [](const Token& token) { return token.is("in"); });
            parts.push_back(expect("in", "in for loop"));
            parts.push_back(parseExpression(NoStruct | StopAtLoopSpec));
            parseLoopTail(parts);
            blockLike = true;
        } else if (token.is("loop")) {
            parts.push_back(consume());
            parseLoopTail(parts);
            blockLike = true;
        } else if ((token.is("unsafe") || token.is("async") || token.is("const") ||
                    token.is("proof")) &&
                   peek(1).kind == TokenKind::OpenBrace) {
            parts.push_back(consume());
            parts.push_back(parseBlock());
            blockLike = true;
        } else if (token.is("async") && peekIs("move", 1) && peek(2).kind == TokenKind::OpenBrace) {
            parts.push_back(consume());
            parts.push_back(consume());
            parts.push_back(parseBlock());
            blockLike = true;
        } else if (token.is("by") && !parts.empty() && peek(1).kind == TokenKind::OpenBrace) {
            parts.push_back(consume());
            parts.push_back(parseBlock());
            endsStatement = true;
        } else if (token.is("by") && !parts.empty() && peek(1).kind == TokenKind::OpenParen) {
            parts.push_back(consume());
            parts.push_back(parseGroup());
            if (peek().kind == TokenKind::OpenBrace) {
                parts.push_back(parseBlock());
                endsStatement = true;
            }
        } else if (macroPathLength(index)) {
            parts.push_back(parseMacroInvocation());
        } else if ((token.is("|") || token.is("||")) && closureCanStart(parts)) {
            if (token.is("|"))
                parseClosureParameters(parts);
            else
                parts.push_back(consume());
            parseClosureTail(parts);
        } else if (token.is("::") && peekIs("<", 1)) {
            parts.push_back(consume());
            consumeAngles(parts);
        } else if (token.kind == TokenKind::Lifetime && peekIs(":", 1) && leading) {
            // loop label
            parts.push_back(consume());
            parts.push_back(consume());
            continue;
        } else {
            parts.push_back(consume());
        }

        if ((flags & Statement) && ((blockLike && leading) || endsStatement))
            break;
        leading = false;
    }

    if (parts.empty())
        error(peek(), "expected expression");
    finish(expression, parts);
    classifyExpression(*expression);
    return expression;
}

void Parser::parseIf(Children& parts) {
    parts.push_back(expect("if", "to start a conditional"));
    parts.push_back(parseExpression(NoStruct));
    parts.push_back(parseBlock());
    while (peekIs("else")) {
        parts.push_back(consume());
        if (peekIs("if")) {
            parts.push_back(consume());
            parts.push_back(parseExpression(NoStruct));
            parts.push_back(parseBlock());
        } else {
            parts.push_back(parseBlock());
            break;
        }
    }
}

void Parser::parseLoopTail(Children& parts) {
    if (isLoopSpecStart())
        parts.push_back(parseLoopSpec());
    if (peek().kind != TokenKind::OpenBrace)
        error(peek(), "expected loop body");
    parts.push_back(parseBlock());
}

LoopSpecSyntax* Parser::parseLoopSpec() {
    auto spec = make<LoopSpecSyntax>();
    SmallVector<SyntaxNode*, 16> children;
    while (isLoopSpecStart()) {
        children.push_back(consume());
        while (!atEnd() && peek().kind != TokenKind::OpenBrace && !peek().isCloseDelimiter() &&
               !peekIs(";") && !isLoopSpecStart()) {
            children.push_back(
                parseExpression(StopAtComma | StopAtSemicolon | StopAtLoopSpec | StopAtBody));
            if (!peekIs(","))
                break;
            children.push_back(consume());
        }
    }
    return finish(spec, children);
}

MatchBodySyntax* Parser::parseMatchBody() {
    auto body = make<MatchBodySyntax>();
    SmallVector<SyntaxNode*, 16> children;
    const Token open = peek();
    children.push_back(expectKind(TokenKind::OpenBrace, "'{' opening match body"));
    while (peek().kind != TokenKind::CloseBrace) {
        if (atEnd())
            error(open, "unclosed match body");
        if (peek().isCloseDelimiter())
            error(peek(), "mismatched closing delimiter");
        children.push_back(parseMatchArm());
    }
    children.push_back(consume());
    return finish(body, children);
}

MatchArmSyntax* Parser::parseMatchArm() {
    auto arm = make<MatchArmSyntax>();
    SmallVector<SyntaxNode*, 16> children;
    size_t patternStart = children.size();
    consumeBalanced(children,
                    [](const Token& token) { return token.is("=>") || token.is("if"); });
    if (children.size() == patternStart)
        error(peek(), "expected match arm pattern");
    if (peekIs("if")) {
        children.push_back(consume());
        children.push_back(parseExpression(StopAtFatArrow));
    }
    children.push_back(expect("=>", "in match arm"));
    children.push_back(parseExpression(Statement | StopAtComma));
    if (peekIs(","))
        children.push_back(consume());
    return finish(arm, children);
}

DelimitedListSyntax* Parser::parseGroup() {
    auto group = make<DelimitedListSyntax>(SyntaxKind::Group);
    SmallVector<SyntaxNode*, 16> children;
    const Token open = peek();
    ASSERT(open.isOpenDelimiter(), "group must start with a delimiter");
    TokenKind closeKind = closingDelimiterFor(open.kind);
    group->open = consume();
    children.push_back(group->open);
    while (peek().kind != closeKind) {
        if (atEnd())
            error(open, "unclosed delimiter '" + std::string(open.text) + "'");
        if (peek().isCloseDelimiter())
            error(peek(), "mismatched closing delimiter");
        children.push_back(parseExpression(StopAtComma));
        if (!peekIs(","))
            break;
        children.push_back(consume());
    }
    group->close = expectKind(closeKind, "closing delimiter");
    children.push_back(group->close);
    return finish(group, children);
}

MacroInvocationSyntax* Parser::parseMacroInvocation() {
    auto macro = make<MacroInvocationSyntax>();
    SmallVector<SyntaxNode*, 8> children;
    size_t length = macroPathLength(index);
    ASSERT(length > 0, "macro invocation expected");
    for (size_t i = 0; i < length; i++) {
        if (peek().isIdentifier())
            macro->name = peek().text;
        children.push_back(consume());
    }
    macro->body = parseTokenTree();
    children.push_back(macro->body);
    return finish(macro, children);
}

void Parser::parseClosureParameters(Children& parts) {
    const Token open = peek();
    parts.push_back(consume());
    while (!peekIs("|")) {
        if (atEnd() || peek().isCloseDelimiter())
            error(open, "unclosed closure parameter list");
        if (peek().isOpenDelimiter())
            parts.push_back(parseTokenTree());
        else
            parts.push_back(consume());
    }
    parts.push_back(consume());
}

// `-> T`, contract clauses and the body of a closure. Without a return type or contract the
// body is an ordinary expression.
void Parser::parseClosureTail(Children& parts) {
    if (!peekIs("->") && !isContractStart())
        return;
    if (peekIs("->"))
        parts.push_back(parseReturnType());
    if (isContractStart())
        parts.push_back(parseContractSpec());
    if (peek().kind != TokenKind::OpenBrace)
        error(peek(), "expected closure body");
    parts.push_back(parseBlock());
}

static bool isParenGroup(const SyntaxNode* node) {
    return node->kind == SyntaxKind::Group &&
           node->as<DelimitedListSyntax>().open->token.kind == TokenKind::OpenParen;
}

void classifyExpression(ExpressionSyntax& expression) {
    auto parts = expression.children;
    auto tokenAt = [&](size_t i) -> const Token* {
        if (i < parts.size() && parts[i]->kind == SyntaxKind::Token)
            return &parts[i]->as<TokenSyntax>().token;
        return nullptr;
    };

    if (parts.empty())
        return;

    if (auto first = tokenAt(0)) {
        auto second = tokenAt(1);
        bool quantifierBinder = second && (second->is("|") || second->is("||"));
        if (first->is("proof") && parts.size() > 1 && parts[1]->kind == SyntaxKind::Block) {
            expression.expressionKind = ExpressionKind::GhostUnary;
            expression.unaryOp = GhostUnaryOp::Proof;
            return;
        }
        if ((first->is("forall") || first->is("exists") || first->is("choose")) &&
            quantifierBinder) {
            expression.expressionKind = ExpressionKind::GhostUnary;
            expression.unaryOp = first->is("forall")   ? GhostUnaryOp::Forall
                                 : first->is("exists") ? GhostUnaryOp::Exists
                                                       : GhostUnaryOp::Choose;
            return;
        }
        if (first->is("assert") && second && second->is("forall")) {
            expression.expressionKind = ExpressionKind::AssertForallExpr;
            return;
        }
        if (first->is("assert") && parts.size() > 1 && isParenGroup(parts[1])) {
            expression.expressionKind = ExpressionKind::AssertExpr;
            return;
        }
        if (first->is("assume") && parts.size() > 1 && isParenGroup(parts[1])) {
            expression.expressionKind = ExpressionKind::AssumeExpr;
            return;
        }
        if (first->is("&&&")) {
            expression.expressionKind = ExpressionKind::ConjunctionMarker;
            return;
        }
        if (first->is("|||")) {
            expression.expressionKind = ExpressionKind::DisjunctionMarker;
            return;
        }
        // closures are opaque whatever their body is
        if (first->is("|") || first->is("||") || first->is("move"))
            return;
    }

    if (parts.size() == 1 && parts[0]->kind == SyntaxKind::MacroInvocation) {
        expression.expressionKind = ExpressionKind::MacroCall;
        expression.macroName = parts[0]->as<MacroInvocationSyntax>().name;
        return;
    }

    const Token* implication = nullptr;
    bool binaryOperator = false;
    for (size_t i = 0; i < parts.size(); i++) {
        auto token = tokenAt(i);
        if (!token || token->kind != TokenKind::Punctuation)
            continue;
        if (isAssignmentOperator(token->text))
            return;
        if (token->is("<==>") && (!implication || !implication->is("<==>")))
            implication = token;
        else if ((token->is("==>") || token->is("<==")) && !implication)
            implication = token;
        if (i > 0 && isBinaryOperator(token->text))
            binaryOperator = true;
    }

    if (implication) {
        expression.expressionKind = ExpressionKind::GhostBinary;
        expression.binaryOp = implication->is("<==>") ? GhostBinaryOp::Equivalent
                              : implication->is("==>") ? GhostBinaryOp::Implies
                                                       : GhostBinaryOp::ImpliedBy;
        return;
    }

    auto last = tokenAt(parts.size() - 1);
    if (last && last->is("@") && !binaryOperator)
        expression.expressionKind = ExpressionKind::ViewProjection;
}
