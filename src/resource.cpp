/*
 * certrun - Certification Session Engine
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "certrun/resource.hpp"
#include "certrun/logger.hpp"
#include <algorithm>
#include <cctype>
#include <sstream>
#include <stdexcept>

namespace certrun {

struct ResourceExpression::Node {
    enum class Kind : uint8_t { Or, And, Not, Equal, NotEqual, In, Truthy };

    Kind kind = Kind::Truthy;
    std::vector<std::shared_ptr<const Node>> children;
    std::string attribute;
    std::vector<std::string> values;
};

namespace {

using Node = ResourceExpression::Node;

enum class TokenType : uint8_t {
    Identifier,
    String,
    Number,
    Dot,
    Equal,
    NotEqual,
    LParen,
    RParen,
    LBracket,
    RBracket,
    Comma,
    End
};

struct Token {
    TokenType type = TokenType::End;
    std::string text;
    std::size_t offset = 0;
};

std::vector<Token> tokenize(const std::string& text) {
    std::vector<Token> tokens;
    std::size_t i = 0;
    while (i < text.size()) {
        char c = text[i];
        if (std::isspace(static_cast<unsigned char>(c))) {
            ++i;
            continue;
        }
        std::size_t start = i;
        if (std::isalpha(static_cast<unsigned char>(c)) || c == '_') {
            while (i < text.size() && (std::isalnum(static_cast<unsigned char>(text[i])) || text[i] == '_')) {
                ++i;
            }
            tokens.push_back({TokenType::Identifier, text.substr(start, i - start), start});
        } else if (std::isdigit(static_cast<unsigned char>(c)) || c == '-') {
            ++i;
            while (i < text.size() && (std::isalnum(static_cast<unsigned char>(text[i])) || text[i] == '.')) {
                ++i;
            }
            tokens.push_back({TokenType::Number, text.substr(start, i - start), start});
        } else if (c == '"' || c == '\'') {
            ++i;
            std::string value;
            while (i < text.size() && text[i] != c) {
                if (text[i] == '\\' && i + 1 < text.size()) {
                    ++i;
                }
                value += text[i++];
            }
            if (i >= text.size()) {
                throw std::invalid_argument("unterminated string at offset " + std::to_string(start));
            }
            ++i;
            tokens.push_back({TokenType::String, value, start});
        } else if (c == '=' && i + 1 < text.size() && text[i + 1] == '=') {
            i += 2;
            tokens.push_back({TokenType::Equal, "==", start});
        } else if (c == '!' && i + 1 < text.size() && text[i + 1] == '=') {
            i += 2;
            tokens.push_back({TokenType::NotEqual, "!=", start});
        } else {
            TokenType type;
            switch (c) {
                case '.': type = TokenType::Dot; break;
                case '(': type = TokenType::LParen; break;
                case ')': type = TokenType::RParen; break;
                case '[': type = TokenType::LBracket; break;
                case ']': type = TokenType::RBracket; break;
                case ',': type = TokenType::Comma; break;
                default:
                    throw std::invalid_argument(std::string("unexpected character '") + c +
                                                "' at offset " + std::to_string(start));
            }
            ++i;
            tokens.push_back({type, std::string(1, c), start});
        }
    }
    tokens.push_back({TokenType::End, "", text.size()});
    return tokens;
}

// Recursive descent over:
//   expr    := and ('or' and)*
//   and     := not ('and' not)*
//   not     := 'not' not | primary
//   primary := '(' expr ')' | ref [('=='|'!=') literal | ['not'] 'in' '[' literals ']']
class ExpressionParser {
public:
    explicit ExpressionParser(std::vector<Token> tokens) : tokens_(std::move(tokens)) {}

    std::shared_ptr<const Node> parse() {
        auto node = parseOr();
        if (peek().type != TokenType::End) {
            throw std::invalid_argument("unexpected '" + peek().text + "' at offset " +
                                        std::to_string(peek().offset));
        }
        return node;
    }

    [[nodiscard]] const std::set<std::string>& resourceIds() const noexcept { return resourceIds_; }

private:
    const Token& peek() const { return tokens_[pos_]; }
    const Token& advance() { return tokens_[pos_++]; }

    bool acceptKeyword(const char* keyword) {
        if (peek().type == TokenType::Identifier && peek().text == keyword) {
            ++pos_;
            return true;
        }
        return false;
    }

    const Token& expect(TokenType type, const char* what) {
        if (peek().type != type) {
            throw std::invalid_argument(std::string("expected ") + what + " at offset " +
                                        std::to_string(peek().offset));
        }
        return advance();
    }

    std::shared_ptr<const Node> parseOr() {
        auto left = parseAnd();
        while (acceptKeyword("or")) {
            auto node = std::make_shared<Node>();
            node->kind = Node::Kind::Or;
            node->children = {left, parseAnd()};
            left = node;
        }
        return left;
    }

    std::shared_ptr<const Node> parseAnd() {
        auto left = parseNot();
        while (acceptKeyword("and")) {
            auto node = std::make_shared<Node>();
            node->kind = Node::Kind::And;
            node->children = {left, parseNot()};
            left = node;
        }
        return left;
    }

    std::shared_ptr<const Node> parseNot() {
        if (acceptKeyword("not")) {
            auto node = std::make_shared<Node>();
            node->kind = Node::Kind::Not;
            node->children = {parseNot()};
            return node;
        }
        return parsePrimary();
    }

    std::shared_ptr<const Node> parsePrimary() {
        if (peek().type == TokenType::LParen) {
            advance();
            auto inner = parseOr();
            expect(TokenType::RParen, "')'");
            return inner;
        }

        const Token& resource = expect(TokenType::Identifier, "resource reference");
        expect(TokenType::Dot, "'.'");
        const Token& attribute = expect(TokenType::Identifier, "attribute name");
        resourceIds_.insert(resource.text);

        auto node = std::make_shared<Node>();
        node->attribute = attribute.text;

        if (peek().type == TokenType::Equal || peek().type == TokenType::NotEqual) {
            node->kind = advance().type == TokenType::Equal ? Node::Kind::Equal : Node::Kind::NotEqual;
            node->values.push_back(parseLiteral());
            return node;
        }

        bool negated = false;
        if (peek().type == TokenType::Identifier && peek().text == "not" &&
            tokens_[pos_ + 1].type == TokenType::Identifier && tokens_[pos_ + 1].text == "in") {
            ++pos_;
            negated = true;
        }
        if (acceptKeyword("in")) {
            node->kind = Node::Kind::In;
            expect(TokenType::LBracket, "'['");
            if (peek().type != TokenType::RBracket) {
                node->values.push_back(parseLiteral());
                while (peek().type == TokenType::Comma) {
                    advance();
                    node->values.push_back(parseLiteral());
                }
            }
            expect(TokenType::RBracket, "']'");
            if (negated) {
                auto outer = std::make_shared<Node>();
                outer->kind = Node::Kind::Not;
                outer->children = {node};
                return outer;
            }
            return node;
        }

        node->kind = Node::Kind::Truthy;
        return node;
    }

    std::string parseLiteral() {
        const Token& token = advance();
        switch (token.type) {
            case TokenType::String:
            case TokenType::Number:
            case TokenType::Identifier:
                return token.text;
            default:
                throw std::invalid_argument("expected a value at offset " + std::to_string(token.offset));
        }
    }

    std::vector<Token> tokens_;
    std::size_t pos_ = 0;
    std::set<std::string> resourceIds_;
};

bool evaluateNode(const Node& node, const Resource& resource) {
    switch (node.kind) {
        case Node::Kind::Or:
            return evaluateNode(*node.children[0], resource) || evaluateNode(*node.children[1], resource);
        case Node::Kind::And:
            return evaluateNode(*node.children[0], resource) && evaluateNode(*node.children[1], resource);
        case Node::Kind::Not:
            return !evaluateNode(*node.children[0], resource);
        case Node::Kind::Equal:
        case Node::Kind::NotEqual:
        case Node::Kind::In:
        case Node::Kind::Truthy:
            break;
    }

    auto it = resource.find(node.attribute);
    if (it == resource.end()) {
        return false;
    }
    const std::string& actual = it->second;
    switch (node.kind) {
        case Node::Kind::Equal:
            return actual == node.values.front();
        case Node::Kind::NotEqual:
            return actual != node.values.front();
        case Node::Kind::In:
            return std::find(node.values.begin(), node.values.end(), actual) != node.values.end();
        default:
            return !actual.empty();
    }
}

}

ResourceExpression::ResourceExpression(std::string text, JobId resourceId, std::shared_ptr<const Node> root)
    : text_(std::move(text)), resourceId_(std::move(resourceId)), root_(std::move(root)) {
}

std::optional<ResourceExpression> ResourceExpression::compile(const std::string& text, std::string& error) {
    try {
        ExpressionParser parser(tokenize(text));
        auto root = parser.parse();
        const auto& ids = parser.resourceIds();
        if (ids.empty()) {
            error = "expression '" + text + "' does not reference any resource";
            return std::nullopt;
        }
        if (ids.size() > 1) {
            error = "expression '" + text + "' references more than one resource";
            return std::nullopt;
        }
        return ResourceExpression(text, *ids.begin(), std::move(root));
    } catch (const std::invalid_argument& e) {
        error = "cannot parse expression '" + text + "': " + e.what();
        return std::nullopt;
    }
}

bool ResourceExpression::evaluate(const std::vector<Resource>& resources) const {
    for (const auto& resource : resources) {
        if (evaluateNode(*root_, resource)) {
            return true;
        }
    }
    return false;
}

std::optional<ResourceProgram> ResourceProgram::compile(const std::string& text, std::string& error) {
    ResourceProgram program;
    std::istringstream stream(text);
    std::string line;
    while (std::getline(stream, line)) {
        if (line.find_first_not_of(" \t\r") == std::string::npos) {
            continue;
        }
        auto expression = ResourceExpression::compile(line, error);
        if (!expression) {
            return std::nullopt;
        }
        program.expressions_.push_back(std::move(*expression));
    }
    return program;
}

std::set<JobId> ResourceProgram::requiredResources() const {
    std::set<JobId> ids;
    for (const auto& expression : expressions_) {
        ids.insert(expression.resourceId());
    }
    return ids;
}

std::vector<EvaluationResult> ResourceProgram::evaluate(const ResourceMap& resources) const {
    std::vector<EvaluationResult> results;
    results.reserve(expressions_.size());
    for (const auto& expression : expressions_) {
        EvaluationResult result;
        result.expression = &expression;
        auto it = resources.find(expression.resourceId());
        if (it == resources.end()) {
            result.status = EvaluationStatus::CannotEvaluate;
        } else if (!expression.evaluate(it->second)) {
            result.status = EvaluationStatus::Failed;
            LOG_TRACE("Resource expression failed: " + expression.text());
        }
        results.push_back(result);
    }
    return results;
}

}
