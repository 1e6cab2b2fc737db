// SPDX-License-Identifier: Apache-2.0
#include "Parser.hpp"
#include "Errors.hpp"
#include "SyntaxTree.hpp"

Parser::Parser(std::vector<Token> tokens, SyntaxTree& tree) : tokens(std::move(tokens)), tree(tree) {
    ASSERT(!this->tokens.empty() && this->tokens.back().kind == TokenKind::EndOfFile,
           "token stream must end with EndOfFile");
}

TokenSyntax* Parser::consume() {
    auto token = make<TokenSyntax>(peek());
    if (index < tokens.size() - 1)
        index++;
    return token;
}

TokenSyntax* Parser::expect(std::string_view text, std::string_view what) {
    if (!peekIs(text))
        error(peek(), "expected '" + std::string(text) + "' " + std::string(what));
    return consume();
}

TokenSyntax* Parser::expectKind(TokenKind kind, std::string_view what) {
    if (peek().kind != kind)
        error(peek(), "expected " + std::string(what));
    return consume();
}

TokenSyntax* Parser::expectIdentifier(std::string_view what) {
    if (!peek().isIdentifier())
        error(peek(), "expected " + std::string(what));
    return consume();
}

void Parser::error(const Token& token, const std::string& message) const {
    auto& sourceManager = tree.sourceManager();
    std::string found = token.kind == TokenKind::EndOfFile
                            ? "end of file"
                            : "'" + std::string(token.text) + "'";
    throw SyntaxError(std::string(sourceManager.getFileName(token.location)),
                      sourceManager.getLineNumber(token.location),
                      sourceManager.getColumnNumber(token.location),
                      message + ", found " + found);
}

SourceFileSyntax& Parser::parseSourceFile() {
    auto file = make<SourceFileSyntax>();
    SmallVector<SyntaxNode*, 64> children;
    while (!atEnd()) {
        if (peek().isCloseDelimiter())
            error(peek(), "unexpected closing delimiter");
        children.push_back(parseItem(false));
    }
    children.push_back(consume());
    return *finish(file, children);
}

// index just past the group opened at i
size_t Parser::skipGroup(size_t i) const {
    int depth = 0;
    do {
        const Token& token = tokenAt(i);
        if (token.kind == TokenKind::EndOfFile)
            return i;
        if (token.isOpenDelimiter())
            depth++;
        else if (token.isCloseDelimiter())
            depth--;
        i++;
    } while (depth > 0);
    return i;
}

size_t Parser::skipAttributes(size_t i) const {
    while (tokenAt(i).is("#")) {
        size_t bracket = tokenAt(i + 1).is("!") ? i + 2 : i + 1;
        if (tokenAt(bracket).kind != TokenKind::OpenBracket)
            break;
        i = skipGroup(bracket);
    }
    return i;
}

// index of the keyword that decides what kind of item starts at i
size_t Parser::skipModifiers(size_t i) const {
    while (true) {
        const Token& token = tokenAt(i);
        const Token& next = tokenAt(i + 1);
        if (token.is("pub")) {
            i = next.kind == TokenKind::OpenParen ? skipGroup(i + 1) : i + 1;
        } else if (token.is("spec")) {
            if (next.kind == TokenKind::OpenParen && tokenAt(i + 2).is("checked") &&
                tokenAt(i + 3).kind == TokenKind::CloseParen)
                i += 4;
            else
                i++;
        } else if (token.is("proof") || token.is("exec") || token.is("axiom") ||
                   token.is("open") || token.is("closed") || token.is("uninterp") ||
                   token.is("broadcast") || token.is("async") || token.is("unsafe")) {
            if (!next.isIdentifier() && next.kind != TokenKind::StringLiteral)
                break;
            i++;
        } else if (token.is("const") || token.is("default")) {
            if (!next.is("fn") && !next.is("unsafe") && !next.is("async") && !next.is("extern") &&
                !next.is("type") && !next.is("const"))
                break;
            i++;
        } else if (token.is("extern")) {
            if (next.kind == TokenKind::StringLiteral && tokenAt(i + 2).is("fn"))
                i += 2;
            else if (next.is("fn"))
                i++;
            else
                break;
        } else {
            break;
        }
    }
    return i;
}

// number of tokens in `path::name!` when a macro invocation starts at i, 0 otherwise
size_t Parser::macroPathLength(size_t i) const {
    size_t j = i;
    if (tokenAt(j).is("::"))
        j++;
    if (!tokenAt(j).isOperandName())
        return 0;
    j++;
    while (tokenAt(j).is("::") && tokenAt(j + 1).isIdentifier())
        j += 2;
    if (tokenAt(j).is("!") && tokenAt(j + 1).isOpenDelimiter())
        return j + 1 - i;
    return 0;
}

bool Parser::isItemStart(size_t i) const {
    size_t k = skipModifiers(i);
    const Token& token = tokenAt(k);
    const Token& next = tokenAt(k + 1);
    if (token.is("fn") || token.is("struct") || token.is("enum") || token.is("trait") ||
        token.is("impl") || token.is("mod") || token.is("use"))
        return true;
    if (token.is("type"))
        return next.isIdentifier();
    if (token.is("static"))
        return next.is("mut") || (next.isIdentifier() && tokenAt(k + 2).is(":"));
    if (token.is("const"))
        return next.isIdentifier() && tokenAt(k + 2).is(":");
    if (token.is("extern"))
        return next.is("crate") || next.kind == TokenKind::StringLiteral ||
               next.kind == TokenKind::OpenBrace;
    if (token.is("macro_rules"))
        return next.is("!");
    if (token.is("group"))
        return k > i && tokenAt(k - 1).is("broadcast");
    return false;
}

bool Parser::isContractStart() const {
    return peek().isIdentifier() && isContractKeyword(peek().text);
}

bool Parser::isLoopSpecStart() const {
    return peek().isIdentifier() && isLoopSpecKeyword(peek().text);
}

TokenTreeSyntax* Parser::parseTokenTree() {
    auto node = make<TokenTreeSyntax>();
    SmallVector<SyntaxNode*, 16> children;
    const Token& open = peek();
    ASSERT(open.isOpenDelimiter(), "token tree must start with a delimiter");
    TokenKind closeKind = closingDelimiterFor(open.kind);
    children.push_back(consume());
    while (true) {
        const Token& token = peek();
        if (token.kind == TokenKind::EndOfFile) {
            error(open, "unclosed delimiter '" + std::string(open.text) + "'");
        } else if (token.kind == closeKind) {
            children.push_back(consume());
            break;
        } else if (token.isCloseDelimiter()) {
            error(token, "mismatched closing delimiter");
        } else if (token.isOpenDelimiter()) {
            children.push_back(parseTokenTree());
        } else {
            children.push_back(consume());
        }
    }
    return finish(node, children);
}

// Consume tokens (groups as whole token trees) until stop() holds at this nesting level or a
// closing delimiter of the enclosing group is reached.
void Parser::consumeBalanced(Children& children, const StopPredicate& stop) {
    while (true) {
        const Token& token = peek();
        if (token.kind == TokenKind::EndOfFile || token.isCloseDelimiter() || stop(token))
            return;
        if (token.isOpenDelimiter())
            children.push_back(parseTokenTree());
        else
            children.push_back(consume());
    }
}

// generic argument list starting at '<'
void Parser::consumeAngles(Children& children) {
    int depth = 0;
    do {
        const Token& token = peek();
        if (token.kind == TokenKind::EndOfFile || token.isCloseDelimiter())
            error(token, "unclosed generic argument list");
        if (token.is("<"))
            depth++;
        else if (token.is("<<"))
            depth += 2;
        else if (token.is(">"))
            depth--;
        else if (token.is(">>"))
            depth -= 2;

        if (token.isOpenDelimiter())
            children.push_back(parseTokenTree());
        else
            children.push_back(consume());
    } while (depth > 0);
}

// Consume a type; stop() is consulted outside of generic arguments only.
// Returns number of consumed nodes.
size_t Parser::consumeType(Children& children, const StopPredicate& stop) {
    size_t start = children.size();
    int depth = 0;
    while (true) {
        const Token& token = peek();
        if (token.kind == TokenKind::EndOfFile || token.isCloseDelimiter())
            break;
        if (depth == 0 && stop(token))
            break;
        if (token.is("<"))
            depth++;
        else if (token.is(">"))
            depth--;
        else if (token.is(">>"))
            depth -= 2;
        if (depth < 0)
            depth = 0;

        if (token.isOpenDelimiter())
            children.push_back(parseTokenTree());
        else
            children.push_back(consume());
    }
    return children.size() - start;
}

void Parser::parseAttributes(Children& children) {
    while (peekIs("#") && (peek(1).kind == TokenKind::OpenBracket ||
                           (peekIs("!", 1) && peek(2).kind == TokenKind::OpenBracket)))
        children.push_back(parseAttribute());
}

AttributeSyntax* Parser::parseAttribute() {
    auto attribute = make<AttributeSyntax>();
    SmallVector<SyntaxNode*, 4> children;
    children.push_back(expect("#", "to start an attribute"));
    if (peekIs("!")) {
        attribute->isInner = true;
        children.push_back(consume());
    }
    if (peek().kind != TokenKind::OpenBracket)
        error(peek(), "expected '[' after '#'");

    std::string path;
    for (size_t i = index + 1; tokenAt(i).isIdentifier() || tokenAt(i).is("::"); i++)
        path += tokenAt(i).text;
    attribute->path = tree.makeText(std::move(path));

    children.push_back(parseTokenTree());
    return finish(attribute, children);
}

SyntaxNode* Parser::parseItem(bool inTrait) {
    if (peekIs("#") && peek(1).is("!") && peek(2).kind == TokenKind::OpenBracket)
        return parseAttribute();

    SmallVector<SyntaxNode*, 16> children;
    parseAttributes(children);

    size_t keywordIndex = skipModifiers(index);
    const Token& keyword = tokenAt(keywordIndex);
    if (keyword.is("fn"))
        return parseFunction(children, inTrait);

    auto consumeModifiers = [&] {
        while (index < keywordIndex) {
            if (peek().isOpenDelimiter())
                children.push_back(parseTokenTree());
            else
                children.push_back(consume());
        }
    };

    if (keyword.is("struct")) {
        consumeModifiers();
        return parseStruct(children);
    }
    if (keyword.is("enum")) {
        consumeModifiers();
        return parseEnum(children);
    }
    if (keyword.is("trait")) {
        return parseItemContainer(children, SyntaxKind::TraitDeclaration);
    }
    if (keyword.is("impl")) {
        return parseItemContainer(children, SyntaxKind::ImplDeclaration);
    }
    if (keyword.is("mod") && tokenAt(keywordIndex + 1).isIdentifier() &&
        tokenAt(keywordIndex + 2).kind == TokenKind::OpenBrace) {
        return parseItemContainer(children, SyntaxKind::ModuleDeclaration);
    }
    return parseOpaqueItem(children);
}

FunctionDeclarationSyntax* Parser::parseFunction(Children& children, bool inTrait) {
    auto fn = make<FunctionDeclarationSyntax>();
    fn->inTrait = inTrait;
    SmallVector<TokenSyntax*, 4> verusModifiers;

    while (!peekIs("fn")) {
        const Token& token = peek();
        if (token.kind == TokenKind::EndOfFile)
            error(token, "expected 'fn'");
        if (token.is("pub")) {
            fn->isPublic = true;
            children.push_back(consume());
            if (peek().kind == TokenKind::OpenParen)
                children.push_back(parseTokenTree());
        } else if (token.is("spec")) {
            fn->mode = FunctionMode::Specification;
            children.push_back(consume());
            if (peek().kind == TokenKind::OpenParen && peekIs("checked", 1)) {
                fn->mode = FunctionMode::SpecificationChecked;
                children.push_back(consume());
                children.push_back(consume());
                children.push_back(expectKind(TokenKind::CloseParen, "')' after 'spec(checked'"));
            }
        } else if (token.is("proof")) {
            fn->mode = FunctionMode::Proof;
            children.push_back(consume());
        } else if (token.is("axiom")) {
            fn->mode = FunctionMode::ProofAxiom;
            children.push_back(consume());
        } else if (token.is("exec") || token.is("open") || token.is("closed") ||
                   token.is("uninterp") || token.is("broadcast")) {
            auto modifier = consume();
            verusModifiers.push_back(modifier);
            children.push_back(modifier);
        } else {
            children.push_back(consume());
        }
    }

    children.push_back(consume());
    fn->name = expectIdentifier("function name");
    children.push_back(fn->name);
    if (peekIs("<"))
        consumeAngles(children);

    if (peek().kind != TokenKind::OpenParen)
        error(peek(), "expected parameter list of '" + std::string(fn->name->token.text) + "'");
    fn->parameters = parseParameterList();
    children.push_back(fn->parameters);

    if (peekIs("->")) {
        fn->returnType = parseReturnType();
        children.push_back(fn->returnType);
    }
    if (peekIs("where")) {
        consumeBalanced(children, [](const Token& token) {
            return token.kind == TokenKind::OpenBrace || token.is(";") ||
                   (token.isIdentifier() && isContractKeyword(token.text));
        });
    }
    if (isContractStart()) {
        fn->contract = parseContractSpec();
        children.push_back(fn->contract);
    }

    if (peek().kind == TokenKind::OpenBrace) {
        fn->body = parseBlock();
        children.push_back(fn->body);
    } else if (peekIs(";")) {
        fn->semicolon = consume();
        children.push_back(fn->semicolon);
    } else {
        error(peek(), "expected body of function '" + std::string(fn->name->token.text) + "'");
    }

    fn->verusModifiers = verusModifiers.copy(tree.allocator());
    return finish(fn, children);
}

DelimitedListSyntax* Parser::parseParameterList() {
    auto list = make<DelimitedListSyntax>(SyntaxKind::ParameterList);
    SmallVector<SyntaxNode*, 16> children;
    list->open = expectKind(TokenKind::OpenParen, "'('");
    children.push_back(list->open);
    while (peek().kind != TokenKind::CloseParen) {
        if (atEnd() || peek().isCloseDelimiter())
            error(peek(), "unclosed parameter list");
        children.push_back(parseParameter());
        if (!peekIs(","))
            break;
        children.push_back(consume());
    }
    list->close = expectKind(TokenKind::CloseParen, "')' closing parameter list");
    children.push_back(list->close);
    return finish(list, children);
}

ParameterSyntax* Parser::parseParameter() {
    auto param = make<ParameterSyntax>();
    SmallVector<SyntaxNode*, 16> children;
    parseAttributes(children);

    if ((peekIs("tracked") || peekIs("ghost")) && peek(1).isIdentifier()) {
        param->qualifier = peekIs("tracked") ? Qualifier::Tracked : Qualifier::Ghost;
        children.push_back(consume());
    }

    size_t patternStart = children.size();
    consumeBalanced(children, [](const Token& token) { return token.is(":") || token.is(","); });
    if (children.size() == patternStart)
        error(peek(), "expected parameter");
    for (size_t i = patternStart; i < children.size(); i++) {
        if (children[i]->kind == SyntaxKind::Token && children[i]->as<TokenSyntax>().is("self"))
            param->isSelf = true;
    }

    if (peekIs(":")) {
        children.push_back(consume());
        size_t typeStart = children.size();
        if (consumeType(children, [](const Token& token) { return token.is(","); }) == 0)
            error(peek(), "expected parameter type");
        if (param->qualifier == Qualifier::Executable) {
            param->qualifier = qualifierFromType(
                std::span<SyntaxNode* const>(children.data() + typeStart, children.size() - typeStart));
        }
    }
    return finish(param, children);
}

ReturnTypeSyntax* Parser::parseReturnType() {
    auto returnType = make<ReturnTypeSyntax>();
    SmallVector<SyntaxNode*, 8> children;
    children.push_back(expect("->", "before return type"));

    bool named = peek().kind == TokenKind::OpenParen &&
                 ((peek(1).isIdentifier() && peekIs(":", 2)) ||
                  (peekIs("tracked", 1) && peek(2).isIdentifier() && peekIs(":", 3)));
    if (named) {
        SmallVector<TokenSyntax*, 4> binding;
        returnType->isNamed = true;
        binding.push_back(consume());
        if (peekIs("tracked") && peek(1).isIdentifier())
            binding.push_back(consume());
        binding.push_back(consume());
        binding.push_back(consume());
        for (auto token : binding)
            children.push_back(token);
        if (consumeType(children, [](const Token&) { return false; }) == 0)
            error(peek(), "expected return type");
        returnType->closeParen = expectKind(TokenKind::CloseParen, "')' after named return type");
        children.push_back(returnType->closeParen);
        returnType->binding = binding.copy(tree.allocator());
    } else {
        auto stop = [](const Token& token) {
            return token.kind == TokenKind::OpenBrace || token.is(";") || token.is("where") ||
                   (token.isIdentifier() && isContractKeyword(token.text));
        };
        if (consumeType(children, stop) == 0)
            error(peek(), "expected return type");
    }
    return finish(returnType, children);
}

ContractSpecSyntax* Parser::parseContractSpec() {
    auto spec = make<ContractSpecSyntax>();
    SmallVector<SyntaxNode*, 8> children;
    while (isContractStart())
        children.push_back(parseContractClause());
    return finish(spec, children);
}

bool Parser::atClauseEnd() const {
    const Token& token = peek();
    return token.kind == TokenKind::EndOfFile || token.kind == TokenKind::OpenBrace ||
           token.isCloseDelimiter() || token.is(";") ||
           (token.isIdentifier() && isContractKeyword(token.text));
}

static ContractClauseKind clauseKindFor(std::string_view keyword) {
    if (keyword == "requires")
        return ContractClauseKind::Requires;
    if (keyword == "recommends")
        return ContractClauseKind::Recommends;
    if (keyword == "ensures")
        return ContractClauseKind::Ensures;
    if (keyword == "default_ensures")
        return ContractClauseKind::DefaultEnsures;
    if (keyword == "returns")
        return ContractClauseKind::Returns;
    if (keyword == "opens_invariants")
        return ContractClauseKind::Invariants;
    if (keyword == "no_unwind")
        return ContractClauseKind::Unwind;
    return ContractClauseKind::Decreases;
}

ContractClauseSyntax* Parser::parseContractClause() {
    auto clause = make<ContractClauseSyntax>(clauseKindFor(peek().text));
    SmallVector<SyntaxNode*, 16> children;
    SmallVector<ExpressionSyntax*, 4> expressions;
    clause->keyword = consume();
    children.push_back(clause->keyword);

    const uint32_t flags = StopAtComma | StopAtSemicolon | StopAtContract | StopAtBody;
    switch (clause->clauseKind) {
        case ContractClauseKind::Invariants:
            if (peekIs("any")) {
                clause->invariantKind = InvariantKind::Any;
                children.push_back(consume());
            } else if (peekIs("none")) {
                clause->invariantKind = InvariantKind::None;
                children.push_back(consume());
            } else if (peek().kind == TokenKind::OpenBracket) {
                clause->invariantKind = InvariantKind::List;
                clause->invariantList = parseGroup();
                children.push_back(clause->invariantList);
            } else {
                clause->invariantKind = InvariantKind::Set;
                auto expression = parseExpression(flags);
                expressions.push_back(expression);
                children.push_back(expression);
            }
            break;
        case ContractClauseKind::Unwind:
            if (peekIs("when")) {
                children.push_back(consume());
                clause->auxiliary = parseExpression(flags);
                children.push_back(clause->auxiliary);
            }
            break;
        default: {
            uint32_t exprFlags = flags;
            if (clause->clauseKind == ContractClauseKind::Recommends)
                exprFlags |= StopAtVia;
            if (clause->clauseKind == ContractClauseKind::Decreases)
                exprFlags |= StopAtVia | StopAtWhen;
            while (!atClauseEnd() && !peekIs("via") && !peekIs("when")) {
                auto expression = parseExpression(exprFlags);
                expressions.push_back(expression);
                children.push_back(expression);
                if (!peekIs(","))
                    break;
                children.push_back(consume());
            }
            if (clause->clauseKind == ContractClauseKind::Recommends && peekIs("via")) {
                children.push_back(consume());
                clause->auxiliary = parseExpression(flags);
                children.push_back(clause->auxiliary);
            }
            if (clause->clauseKind == ContractClauseKind::Decreases) {
                while (peekIs("when") || peekIs("via")) {
                    children.push_back(consume());
                    children.push_back(parseExpression(exprFlags));
                }
            }
            break;
        }
    }

    // `via f,` / `when c,` / `any,`
    if (peekIs(","))
        children.push_back(consume());

    clause->expressions = expressions.copy(tree.allocator());
    return finish(clause, children);
}

StructDeclarationSyntax* Parser::parseStruct(Children& children) {
    auto decl = make<StructDeclarationSyntax>();
    children.push_back(expect("struct", "to start a struct"));
    decl->name = expectIdentifier("struct name");
    children.push_back(decl->name);
    if (peekIs("<"))
        consumeAngles(children);
    if (peekIs("where")) {
        consumeBalanced(children, [](const Token& token) {
            return token.kind == TokenKind::OpenBrace || token.is(";");
        });
    }

    if (peek().kind == TokenKind::OpenBrace) {
        decl->fields = parseFieldList(true);
        children.push_back(decl->fields);
    } else if (peek().kind == TokenKind::OpenParen) {
        decl->fields = parseFieldList(false);
        children.push_back(decl->fields);
        if (peekIs("where"))
            consumeBalanced(children, [](const Token& token) { return token.is(";"); });
        children.push_back(expect(";", "after tuple struct"));
    } else {
        children.push_back(expect(";", "after unit struct"));
    }
    return finish(decl, children);
}

EnumDeclarationSyntax* Parser::parseEnum(Children& children) {
    auto decl = make<EnumDeclarationSyntax>();
    children.push_back(expect("enum", "to start an enum"));
    decl->name = expectIdentifier("enum name");
    children.push_back(decl->name);
    if (peekIs("<"))
        consumeAngles(children);
    if (peekIs("where")) {
        consumeBalanced(children,
                        [](const Token& token) { return token.kind == TokenKind::OpenBrace; });
    }

    auto variants = make<DelimitedListSyntax>(SyntaxKind::VariantList);
    SmallVector<SyntaxNode*, 16> variantChildren;
    variants->open = expectKind(TokenKind::OpenBrace, "'{' opening enum body");
    variantChildren.push_back(variants->open);
    while (peek().kind != TokenKind::CloseBrace) {
        if (atEnd() || peek().isCloseDelimiter())
            error(peek(), "unclosed enum body");
        variantChildren.push_back(parseVariant());
        if (!peekIs(","))
            break;
        variantChildren.push_back(consume());
    }
    variants->close = expectKind(TokenKind::CloseBrace, "'}' closing enum body");
    variantChildren.push_back(variants->close);

    decl->variants = finish(variants, variantChildren);
    children.push_back(decl->variants);
    return finish(decl, children);
}

EnumVariantSyntax* Parser::parseVariant() {
    auto variant = make<EnumVariantSyntax>();
    SmallVector<SyntaxNode*, 8> children;
    parseAttributes(children);
    variant->name = expectIdentifier("variant name");
    children.push_back(variant->name);
    if (peek().kind == TokenKind::OpenBrace) {
        variant->fields = parseFieldList(true);
        children.push_back(variant->fields);
    } else if (peek().kind == TokenKind::OpenParen) {
        variant->fields = parseFieldList(false);
        children.push_back(variant->fields);
    }
    if (peekIs("=")) {
        children.push_back(consume());
        children.push_back(parseExpression(StopAtComma));
    }
    return finish(variant, children);
}

DelimitedListSyntax* Parser::parseFieldList(bool named) {
    auto list = make<DelimitedListSyntax>(SyntaxKind::FieldList);
    SmallVector<SyntaxNode*, 16> children;
    list->open = consume();
    children.push_back(list->open);
    TokenKind closeKind = closingDelimiterFor(list->open->token.kind);
    while (peek().kind != closeKind) {
        if (atEnd() || peek().isCloseDelimiter())
            error(peek(), "unclosed field list");
        children.push_back(named ? parseNamedField() : parseTupleField());
        if (!peekIs(","))
            break;
        children.push_back(consume());
    }
    list->close = expectKind(closeKind, "end of field list");
    children.push_back(list->close);
    return finish(list, children);
}

FieldSyntax* Parser::parseNamedField() {
    auto field = make<FieldSyntax>();
    SmallVector<SyntaxNode*, 16> children;
    parseAttributes(children);
    if (peekIs("pub")) {
        children.push_back(consume());
        if (peek().kind == TokenKind::OpenParen)
            children.push_back(parseTokenTree());
    }
    if ((peekIs("ghost") || peekIs("tracked")) && peek(1).isIdentifier() && peekIs(":", 2)) {
        field->qualifier = peekIs("tracked") ? Qualifier::Tracked : Qualifier::Ghost;
        children.push_back(consume());
    }
    field->name = expectIdentifier("field name");
    children.push_back(field->name);
    children.push_back(expect(":", "after field name"));

    size_t typeStart = children.size();
    if (consumeType(children, [](const Token& token) { return token.is(","); }) == 0)
        error(peek(), "expected field type");
    if (field->qualifier == Qualifier::Executable) {
        field->qualifier = qualifierFromType(
            std::span<SyntaxNode* const>(children.data() + typeStart, children.size() - typeStart));
    }
    return finish(field, children);
}

FieldSyntax* Parser::parseTupleField() {
    auto field = make<FieldSyntax>();
    SmallVector<SyntaxNode*, 16> children;
    parseAttributes(children);
    if (peekIs("pub")) {
        children.push_back(consume());
        if (peek().kind == TokenKind::OpenParen && peek(1).isIdentifier() &&
            (peekIs("crate", 1) || peekIs("super", 1) || peekIs("self", 1) || peekIs("in", 1)))
            children.push_back(parseTokenTree());
    }
    if ((peekIs("ghost") || peekIs("tracked")) && !peekIs(",", 1) &&
        peek(1).kind != TokenKind::CloseParen) {
        field->qualifier = peekIs("tracked") ? Qualifier::Tracked : Qualifier::Ghost;
        children.push_back(consume());
    }

    size_t typeStart = children.size();
    if (consumeType(children, [](const Token& token) { return token.is(","); }) == 0)
        error(peek(), "expected field type");
    if (field->qualifier == Qualifier::Executable) {
        field->qualifier = qualifierFromType(
            std::span<SyntaxNode* const>(children.data() + typeStart, children.size() - typeStart));
    }
    return finish(field, children);
}

ItemContainerSyntax* Parser::parseItemContainer(Children& children, SyntaxKind kind) {
    auto container = make<ItemContainerSyntax>(kind);
    consumeBalanced(children,
                    [](const Token& token) { return token.kind == TokenKind::OpenBrace; });
    container->open = expectKind(TokenKind::OpenBrace, "'{' opening item body");
    children.push_back(container->open);
    while (peek().kind != TokenKind::CloseBrace) {
        if (atEnd() || peek().isCloseDelimiter())
            error(peek(), "unclosed item body");
        children.push_back(parseItem(kind == SyntaxKind::TraitDeclaration));
    }
    container->close = consume();
    children.push_back(container->close);
    return finish(container, children);
}

static bool isVerificationImport(const Token& first, const Token& second) {
    const Token& root = first.is("::") ? second : first;
    return root.is("vstd") || root.is("builtin") || root.is("builtin_macros");
}

OpaqueItemSyntax* Parser::parseOpaqueItem(Children& children) {
    auto item = make<OpaqueItemSyntax>();
    size_t keywordIndex = skipModifiers(index);
    const Token& keyword = tokenAt(keywordIndex);

    bool specModifier = false;
    bool broadcast = false;
    for (size_t i = index; i < keywordIndex; i++) {
        const Token& token = tokenAt(i);
        if (token.is("spec") || token.is("proof") || token.is("axiom"))
            specModifier = true;
        if (token.is("broadcast"))
            broadcast = true;
    }

    if (broadcast || specModifier || keyword.is("global"))
        item->verificationOnly = true;
    else if (keyword.is("use"))
        item->verificationOnly =
            isVerificationImport(tokenAt(keywordIndex + 1), tokenAt(keywordIndex + 2));
    else if (keyword.isIdentifier() && !keyword.isKeyword() && !keyword.is("union") &&
             !tokenAt(keywordIndex + 1).is("!"))
        item->unknownVerification = true;

    bool untilSemicolon = keyword.is("use") || keyword.is("const") || keyword.is("static") ||
                          keyword.is("type") || keyword.is("global") || keyword.is("let");
    while (true) {
        const Token& token = peek();
        if (token.kind == TokenKind::EndOfFile)
            error(token, "unexpected end of file inside item");
        if (token.isCloseDelimiter())
            error(token, "unexpected closing delimiter");
        if (token.is(";")) {
            children.push_back(consume());
            break;
        }
        if (token.isOpenDelimiter()) {
            bool brace = token.kind == TokenKind::OpenBrace;
            children.push_back(parseTokenTree());
            if (brace && !untilSemicolon) {
                if (peekIs(";"))
                    children.push_back(consume());
                break;
            }
        } else {
            children.push_back(consume());
        }
    }
    return finish(item, children);
}

Qualifier qualifierFromType(std::span<SyntaxNode* const> typeNodes) {
    std::string_view lastSegment;
    size_t i = 0;
    if (i < typeNodes.size() && typeNodes[i]->kind == SyntaxKind::Token &&
        typeNodes[i]->as<TokenSyntax>().is("::"))
        i++;
    while (i < typeNodes.size()) {
        if (typeNodes[i]->kind != SyntaxKind::Token)
            return Qualifier::Executable;
        const Token& segment = typeNodes[i]->as<TokenSyntax>().token;
        if (!segment.isIdentifier())
            return Qualifier::Executable;
        lastSegment = segment.text;
        i++;
        if (i == typeNodes.size())
            break;
        if (typeNodes[i]->kind != SyntaxKind::Token)
            return Qualifier::Executable;
        const Token& next = typeNodes[i]->as<TokenSyntax>().token;
        if (next.is("<"))
            break;
        if (!next.is("::"))
            return Qualifier::Executable;
        i++;
    }
    if (lastSegment == "Ghost")
        return Qualifier::Ghost;
    if (lastSegment == "Tracked")
        return Qualifier::Tracked;
    return Qualifier::Executable;
}
