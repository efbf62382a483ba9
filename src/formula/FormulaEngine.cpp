/**
 * @file FormulaEngine.cpp
 * @brief Workbook formula parser / evaluator implementation
 *
 * Recursive-descent parser producing an AST which is evaluated against a
 * snapshot of cell values.
 *
 * Grammar (precedence low → high):
 *   comparison  := addSub (('='|'<>'|'<'|'<='|'>'|'>=') addSub)*
 *   addSub      := mulDiv (('+' | '-') mulDiv)*
 *   mulDiv      := power (('*' | '/') power)*
 *   power       := unary ('^' unary)*
 *   unary       := ('-' | '+') unary | primary
 *   primary     := NUMBER | TEXT | BOOLEAN
 *                | CELL
 *                | IDENT '(' argList? ')'    function call
 *                | '(' comparison ')'
 *   argList     := arg (',' arg)*
 *   arg         := CELL ':' CELL | comparison
 */

#include "formula/FormulaEngine.h"
#include <QSet>
#include <algorithm>
#include <cmath>

namespace SheetCalc {

// ═══════════════════════════════════════════════════════════════════
// FUNCTION TABLE
// ═══════════════════════════════════════════════════════════════════

std::optional<FormulaFunction> functionFromName(const QString &name) {
    const QString n = name.toUpper();
    if (n == "IF")   return FormulaFunction::If;
    if (n == "SQRT") return FormulaFunction::Sqrt;
    if (n == "MIN")  return FormulaFunction::Min;
    if (n == "MAX")  return FormulaFunction::Max;
    return std::nullopt;
}

const char *functionName(FormulaFunction fn) {
    switch (fn) {
    case FormulaFunction::If:   return "IF";
    case FormulaFunction::Sqrt: return "SQRT";
    case FormulaFunction::Min:  return "MIN";
    case FormulaFunction::Max:  return "MAX";
    }
    return "?";
}

bool functionAcceptsArgCount(FormulaFunction fn, int count) {
    switch (fn) {
    case FormulaFunction::If:   return count == 3;
    case FormulaFunction::Sqrt: return count == 1;
    case FormulaFunction::Min:
    case FormulaFunction::Max:  return count >= 1;
    }
    return false;
}

static QString expectedArgsText(FormulaFunction fn) {
    switch (fn) {
    case FormulaFunction::If:   return "3 arguments (cond, a, b)";
    case FormulaFunction::Sqrt: return "1 argument";
    case FormulaFunction::Min:
    case FormulaFunction::Max:  return "at least 1 argument";
    }
    return QString();
}

QVector<CellAddress> FormulaReferences::expanded() const {
    QVector<CellAddress> out;
    QSet<CellAddress> seen;
    for (const CellAddress &c : cells) {
        if (!seen.contains(c)) {
            seen.insert(c);
            out.append(c);
        }
    }
    for (const CellRange &r : ranges) {
        for (int row = r.topLeft.row; row <= r.bottomRight.row; ++row) {
            for (int col = r.topLeft.column; col <= r.bottomRight.column; ++col) {
                CellAddress c(col, row);
                if (!seen.contains(c)) {
                    seen.insert(c);
                    out.append(c);
                }
            }
        }
    }
    return out;
}

bool FormulaEngine::isFormulaText(const QString &raw) {
    return raw.trimmed().startsWith('=');
}

// ═══════════════════════════════════════════════════════════════════
// TOKENIZER
// ═══════════════════════════════════════════════════════════════════

QVector<FormulaToken> FormulaEngine::tokenize(const QString &expr,
                                              CalcError &err) const {
    QVector<FormulaToken> tokens;
    int i = 0;
    const int len = expr.length();

    while (i < len) {
        QChar ch = expr[i];

        if (ch.isSpace()) {
            ++i;
            continue;
        }

        // Numbers: 8, 0.5, .5, 1e3, 2.5E-3
        if (ch.isDigit() || (ch == '.' && i + 1 < len && expr[i + 1].isDigit())) {
            int start = i;
            while (i < len && (expr[i].isDigit() || expr[i] == '.'))
                ++i;
            if (i < len && (expr[i] == 'e' || expr[i] == 'E')) {
                int mark = i;
                ++i;
                if (i < len && (expr[i] == '+' || expr[i] == '-'))
                    ++i;
                if (i < len && expr[i].isDigit()) {
                    while (i < len && expr[i].isDigit())
                        ++i;
                } else {
                    i = mark;
                }
            }
            bool ok = false;
            FormulaToken tok;
            tok.type = FormulaToken::Number;
            tok.position = start;
            tok.numVal = expr.mid(start, i - start).toDouble(&ok);
            if (!ok) {
                err = CalcError(ErrorCode::FormulaParse,
                                QString("Malformed number '%1' at position %2")
                                    .arg(expr.mid(start, i - start))
                                    .arg(start));
                return {};
            }
            tokens.append(tok);
            continue;
        }

        // Text: "ADEQUATE", "say ""hi"""
        if (ch == '"') {
            int start = i;
            QString text;
            bool closed = false;
            ++i;
            while (i < len) {
                if (expr[i] == '"') {
                    if (i + 1 < len && expr[i + 1] == '"') {
                        text += '"';
                        i += 2;
                        continue;
                    }
                    closed = true;
                    ++i;
                    break;
                }
                text += expr[i];
                ++i;
            }
            if (!closed) {
                err = CalcError(ErrorCode::FormulaParse,
                                QString("Unterminated text literal at position %1").arg(start));
                return {};
            }
            FormulaToken tok;
            tok.type = FormulaToken::Text;
            tok.strVal = text;
            tok.position = start;
            tokens.append(tok);
            continue;
        }

        // Words: function names, cell references, TRUE / FALSE
        if (ch.isLetter() || ch == '_' || ch == '$') {
            int start = i;
            while (i < len && (expr[i].isLetterOrNumber() || expr[i] == '_' || expr[i] == '$'))
                ++i;
            const QString word = expr.mid(start, i - start);

            int next = i;
            while (next < len && expr[next].isSpace())
                ++next;
            const bool callFollows = next < len && expr[next] == '(';

            FormulaToken tok;
            tok.position = start;
            if (callFollows) {
                tok.type = FormulaToken::Identifier;
                tok.strVal = word.toUpper();
            } else if (auto address = CellAddressing::parse(word)) {
                tok.type = FormulaToken::CellRef;
                tok.cell = *address;
                tok.strVal = address->toString();
            } else if (word.compare("TRUE", Qt::CaseInsensitive) == 0 ||
                       word.compare("FALSE", Qt::CaseInsensitive) == 0) {
                tok.type = FormulaToken::Boolean;
                tok.boolVal = word.compare("TRUE", Qt::CaseInsensitive) == 0;
            } else {
                // Named ranges, sheet-qualified names, constants: not supported
                err = CalcError(ErrorCode::FormulaUnsupported,
                                QString("Unsupported name '%1' at position %2").arg(word).arg(start),
                                {word});
                return {};
            }
            tokens.append(tok);
            continue;
        }

        // Two-character operators
        if (i + 1 < len) {
            const QString two = expr.mid(i, 2);
            if (two == "<=" || two == ">=" || two == "<>") {
                FormulaToken tok;
                tok.type = FormulaToken::Operator;
                tok.strVal = two;
                tok.position = i;
                tokens.append(tok);
                i += 2;
                continue;
            }
        }

        if (ch == '+' || ch == '-' || ch == '*' || ch == '/' || ch == '^' ||
            ch == '=' || ch == '<' || ch == '>') {
            FormulaToken tok;
            tok.type = FormulaToken::Operator;
            tok.strVal = ch;
            tok.position = i;
            tokens.append(tok);
            ++i;
            continue;
        }

        FormulaToken punct;
        punct.position = i;
        if (ch == '(') {
            punct.type = FormulaToken::LParen;
        } else if (ch == ')') {
            punct.type = FormulaToken::RParen;
        } else if (ch == ',') {
            punct.type = FormulaToken::Comma;
        } else if (ch == ':') {
            punct.type = FormulaToken::Colon;
        } else {
            err = CalcError(ErrorCode::FormulaParse,
                            QString("Unexpected character '%1' at position %2").arg(ch).arg(i),
                            {QString(ch)});
            return {};
        }
        tokens.append(punct);
        ++i;
    }

    FormulaToken endTok;
    endTok.type = FormulaToken::End;
    endTok.position = len;
    tokens.append(endTok);
    return tokens;
}

// ═══════════════════════════════════════════════════════════════════
// COMPILE / VALIDATE / REFERENCES
// ═══════════════════════════════════════════════════════════════════

FormulaPtr FormulaEngine::compile(const QString &expression, CalcError *error) const {
    QString body = expression.trimmed();
    if (body.startsWith('='))
        body = body.mid(1);

    if (body.trimmed().isEmpty()) {
        fail(error, ErrorCode::FormulaParse, "Empty formula", {expression});
        return nullptr;
    }
    if (body.size() > kMaxFormulaLength) {
        fail(error, ErrorCode::FormulaParse,
             QString("Formula is %1 characters long; the limit is %2")
                 .arg(body.size())
                 .arg(kMaxFormulaLength));
        return nullptr;
    }

    CalcError err;
    QVector<FormulaToken> tokens = tokenize(body, err);
    if (err.isSet()) {
        if (error)
            *error = err;
        return nullptr;
    }

    int pos = 0;
    ASTNodePtr root = parseComparison(tokens, pos, 0, err);
    if (!err.isSet() && tokens[pos].type != FormulaToken::End) {
        err = CalcError(ErrorCode::FormulaParse,
                        QString("Unexpected token after expression at position %1")
                            .arg(tokens[pos].position));
    }
    if (err.isSet()) {
        if (error)
            *error = err;
        return nullptr;
    }

    auto parsed = std::make_shared<ParsedFormula>();
    parsed->source = expression;
    parsed->root = root;
    collectReferences(root, parsed->references);
    return parsed;
}

bool FormulaEngine::validate(const QString &expression, QString *errorMsg) const {
    CalcError err;
    if (compile(expression, &err))
        return true;
    if (errorMsg)
        *errorMsg = err.toString();
    return false;
}

std::optional<FormulaReferences> FormulaEngine::references(const QString &expression,
                                                           CalcError *error) const {
    FormulaPtr parsed = compile(expression, error);
    if (!parsed)
        return std::nullopt;
    return parsed->references;
}

// ═══════════════════════════════════════════════════════════════════
// PARSER: recursive descent producing AST
// ═══════════════════════════════════════════════════════════════════

static CalcError tooDeep(int limit) {
    return CalcError(ErrorCode::FormulaParse,
                     QString("Formula nests deeper than %1 levels").arg(limit));
}

static ASTNodePtr makeBinary(const QString &op, ASTNodePtr left, ASTNodePtr right,
                             CalcError &err) {
    const int depth = 1 + std::max(left->depth, right->depth);
    if (depth > FormulaEngine::kMaxExpressionDepth) {
        err = tooDeep(FormulaEngine::kMaxExpressionDepth);
        return nullptr;
    }
    auto node = std::make_shared<FormulaASTNode>();
    node->kind = FormulaASTNode::BinaryOp;
    node->op = op;
    node->left = std::move(left);
    node->right = std::move(right);
    node->depth = depth;
    return node;
}

static bool isComparisonOp(const QString &op) {
    return op == "=" || op == "<>" || op == "<" || op == "<=" || op == ">" || op == ">=";
}

ASTNodePtr FormulaEngine::parseComparison(const QVector<FormulaToken> &tokens,
                                          int &pos, int depth, CalcError &err) const {
    if (depth > kMaxNestingDepth) {
        err = tooDeep(kMaxNestingDepth);
        return nullptr;
    }
    ASTNodePtr left = parseAddSub(tokens, pos, depth, err);
    if (err.isSet())
        return nullptr;

    while (tokens[pos].type == FormulaToken::Operator && isComparisonOp(tokens[pos].strVal)) {
        QString op = tokens[pos].strVal;
        ++pos;
        ASTNodePtr right = parseAddSub(tokens, pos, depth, err);
        if (err.isSet())
            return nullptr;
        left = makeBinary(op, left, right, err);
        if (!left)
            return nullptr;
    }
    return left;
}

ASTNodePtr FormulaEngine::parseAddSub(const QVector<FormulaToken> &tokens,
                                      int &pos, int depth, CalcError &err) const {
    ASTNodePtr left = parseMulDiv(tokens, pos, depth, err);
    if (err.isSet())
        return nullptr;

    while (tokens[pos].type == FormulaToken::Operator &&
           (tokens[pos].strVal == "+" || tokens[pos].strVal == "-")) {
        QString op = tokens[pos].strVal;
        ++pos;
        ASTNodePtr right = parseMulDiv(tokens, pos, depth, err);
        if (err.isSet())
            return nullptr;
        left = makeBinary(op, left, right, err);
        if (!left)
            return nullptr;
    }
    return left;
}

ASTNodePtr FormulaEngine::parseMulDiv(const QVector<FormulaToken> &tokens,
                                      int &pos, int depth, CalcError &err) const {
    ASTNodePtr left = parsePower(tokens, pos, depth, err);
    if (err.isSet())
        return nullptr;

    while (tokens[pos].type == FormulaToken::Operator &&
           (tokens[pos].strVal == "*" || tokens[pos].strVal == "/")) {
        QString op = tokens[pos].strVal;
        ++pos;
        ASTNodePtr right = parsePower(tokens, pos, depth, err);
        if (err.isSet())
            return nullptr;
        left = makeBinary(op, left, right, err);
        if (!left)
            return nullptr;
    }
    return left;
}

ASTNodePtr FormulaEngine::parsePower(const QVector<FormulaToken> &tokens,
                                     int &pos, int depth, CalcError &err) const {
    ASTNodePtr left = parseUnary(tokens, pos, depth, err);
    if (err.isSet())
        return nullptr;

    // Spreadsheet convention: 2^3^2 = (2^3)^2
    while (tokens[pos].type == FormulaToken::Operator && tokens[pos].strVal == "^") {
        ++pos;
        ASTNodePtr right = parseUnary(tokens, pos, depth, err);
        if (err.isSet())
            return nullptr;
        left = makeBinary("^", left, right, err);
        if (!left)
            return nullptr;
    }
    return left;
}

ASTNodePtr FormulaEngine::parseUnary(const QVector<FormulaToken> &tokens,
                                     int &pos, int depth, CalcError &err) const {
    if (tokens[pos].type == FormulaToken::Operator &&
        (tokens[pos].strVal == "-" || tokens[pos].strVal == "+")) {
        if (depth >= kMaxNestingDepth) {
            err = tooDeep(kMaxNestingDepth);
            return nullptr;
        }
        QString op = tokens[pos].strVal;
        ++pos;
        ASTNodePtr operand = parseUnary(tokens, pos, depth + 1, err);
        if (err.isSet())
            return nullptr;
        auto node = std::make_shared<FormulaASTNode>();
        node->kind = FormulaASTNode::UnaryOp;
        node->op = op;
        node->left = operand;
        node->depth = operand->depth + 1;
        return node;
    }
    return parsePrimary(tokens, pos, depth, err);
}

ASTNodePtr FormulaEngine::parsePrimary(const QVector<FormulaToken> &tokens,
                                       int &pos, int depth, CalcError &err) const {
    const FormulaToken &tok = tokens[pos];

    switch (tok.type) {
    case FormulaToken::Number: {
        ++pos;
        auto node = std::make_shared<FormulaASTNode>();
        node->kind = FormulaASTNode::Literal;
        node->value = CellValue::number(tok.numVal);
        return node;
    }
    case FormulaToken::Text: {
        ++pos;
        auto node = std::make_shared<FormulaASTNode>();
        node->kind = FormulaASTNode::Literal;
        node->value = CellValue::text(tok.strVal);
        return node;
    }
    case FormulaToken::Boolean: {
        ++pos;
        auto node = std::make_shared<FormulaASTNode>();
        node->kind = FormulaASTNode::Literal;
        node->value = CellValue::boolean(tok.boolVal);
        return node;
    }
    case FormulaToken::CellRef: {
        if (tokens[pos + 1].type == FormulaToken::Colon) {
            err = CalcError(ErrorCode::FormulaUnsupported,
                            QString("Range starting at %1 is only allowed as a MIN/MAX argument")
                                .arg(tok.strVal),
                            {tok.strVal});
            return nullptr;
        }
        ++pos;
        auto node = std::make_shared<FormulaASTNode>();
        node->kind = FormulaASTNode::CellRef;
        node->cell = tok.cell;
        return node;
    }
    case FormulaToken::LParen: {
        ++pos; // consume '('
        ASTNodePtr inner = parseComparison(tokens, pos, depth + 1, err);
        if (err.isSet())
            return nullptr;
        if (tokens[pos].type != FormulaToken::RParen) {
            err = CalcError(ErrorCode::FormulaParse,
                            QString("Expected ')' at position %1").arg(tokens[pos].position));
            return nullptr;
        }
        ++pos; // consume ')'
        return inner;
    }
    case FormulaToken::Identifier: {
        const QString name = tok.strVal;
        auto fn = functionFromName(name);
        if (!fn) {
            err = CalcError(ErrorCode::FormulaUnsupported,
                            QString("Unsupported function '%1'").arg(name), {name});
            return nullptr;
        }
        ++pos; // identifier
        ++pos; // '(', guaranteed by the tokenizer

        QVector<ASTNodePtr> args;
        if (tokens[pos].type != FormulaToken::RParen) {
            args.append(parseFunctionArg(tokens, pos, depth + 1, err));
            if (err.isSet())
                return nullptr;
            while (tokens[pos].type == FormulaToken::Comma) {
                ++pos; // consume ','
                args.append(parseFunctionArg(tokens, pos, depth + 1, err));
                if (err.isSet())
                    return nullptr;
            }
        }

        if (tokens[pos].type != FormulaToken::RParen) {
            err = CalcError(ErrorCode::FormulaParse,
                            QString("Expected ')' after function arguments for '%1'").arg(name));
            return nullptr;
        }
        ++pos; // consume ')'

        if (!functionAcceptsArgCount(*fn, args.size())) {
            err = CalcError(ErrorCode::FormulaUnsupported,
                            QString("%1() expects %2, got %3")
                                .arg(name, expectedArgsText(*fn))
                                .arg(args.size()),
                            {name});
            return nullptr;
        }
        if (*fn != FormulaFunction::Min && *fn != FormulaFunction::Max) {
            for (const auto &arg : args) {
                if (arg->kind == FormulaASTNode::RangeRef) {
                    err = CalcError(ErrorCode::FormulaUnsupported,
                                    QString("%1() does not accept a range argument").arg(name),
                                    {name});
                    return nullptr;
                }
            }
        }

        auto node = std::make_shared<FormulaASTNode>();
        node->kind = FormulaASTNode::FunctionCall;
        node->function = *fn;
        node->args = args;
        for (const auto &arg : args)
            node->depth = std::max(node->depth, arg->depth + 1);
        if (node->depth > kMaxExpressionDepth) {
            err = tooDeep(kMaxExpressionDepth);
            return nullptr;
        }
        return node;
    }
    case FormulaToken::Operator:
    case FormulaToken::RParen:
    case FormulaToken::Comma:
    case FormulaToken::Colon:
    case FormulaToken::End:
        break;
    }

    err = CalcError(ErrorCode::FormulaParse,
                    tok.type == FormulaToken::End
                        ? QString("Unexpected end of formula")
                        : QString("Unexpected token at position %1").arg(tok.position));
    return nullptr;
}

ASTNodePtr FormulaEngine::parseFunctionArg(const QVector<FormulaToken> &tokens,
                                           int &pos, int depth, CalcError &err) const {
    if (tokens[pos].type == FormulaToken::CellRef &&
        tokens[pos + 1].type == FormulaToken::Colon) {
        if (tokens[pos + 2].type != FormulaToken::CellRef) {
            err = CalcError(ErrorCode::FormulaParse,
                            QString("Expected cell after ':' at position %1")
                                .arg(tokens[pos + 1].position));
            return nullptr;
        }
        CellRange range(tokens[pos].cell, tokens[pos + 2].cell);
        if (range.cellCount() > kMaxRangeCells) {
            err = CalcError(ErrorCode::FormulaUnsupported,
                            QString("Range %1 spans more than %2 cells")
                                .arg(range.toString())
                                .arg(kMaxRangeCells),
                            {range.toString()});
            return nullptr;
        }
        pos += 3;
        auto node = std::make_shared<FormulaASTNode>();
        node->kind = FormulaASTNode::RangeRef;
        node->range = range;
        return node;
    }
    return parseComparison(tokens, pos, depth, err);
}

// ═══════════════════════════════════════════════════════════════════
// AST EVALUATOR
// ═══════════════════════════════════════════════════════════════════

CellValue FormulaEngine::evaluate(const ParsedFormula &formula,
                                  const CellSnapshot &snapshot) const {
    return eval(formula.root, snapshot);
}

std::optional<CellValue> FormulaEngine::evaluate(const QString &expression,
                                                 const CellSnapshot &snapshot,
                                                 CalcError *error) const {
    FormulaPtr parsed = compile(expression, error);
    if (!parsed)
        return std::nullopt;
    return eval(parsed->root, snapshot);
}

static CellValue valueError() { return CellValue::error(CellErrorKind::Value); }

// Blank compares as 0, "" or FALSE depending on the other operand
static CellValue blankLike(const CellValue &other) {
    switch (other.type()) {
    case CellValue::Type::Text:    return CellValue::text(QString());
    case CellValue::Type::Boolean: return CellValue::boolean(false);
    case CellValue::Type::Empty:
    case CellValue::Type::Number:
    case CellValue::Type::Error:
        break;
    }
    return CellValue::number(0.0);
}

static int typeRank(const CellValue &v) {
    switch (v.type()) {
    case CellValue::Type::Number:  return 0;
    case CellValue::Type::Text:    return 1;
    case CellValue::Type::Boolean: return 2;
    case CellValue::Type::Empty:
    case CellValue::Type::Error:
        break;
    }
    return 0;
}

// Spreadsheet ordering: numbers < text < booleans; text is case-insensitive
static int compareValues(CellValue a, CellValue b) {
    if (a.isEmpty() && b.isEmpty())
        return 0;
    if (a.isEmpty())
        a = blankLike(b);
    if (b.isEmpty())
        b = blankLike(a);

    int ra = typeRank(a);
    int rb = typeRank(b);
    if (ra != rb)
        return ra < rb ? -1 : 1;

    switch (a.type()) {
    case CellValue::Type::Number:
        return a.asNumber() < b.asNumber() ? -1 : (a.asNumber() > b.asNumber() ? 1 : 0);
    case CellValue::Type::Text: {
        int c = QString::compare(a.asText(), b.asText(), Qt::CaseInsensitive);
        return c < 0 ? -1 : (c > 0 ? 1 : 0);
    }
    case CellValue::Type::Boolean:
        return int(a.asBoolean()) - int(b.asBoolean());
    case CellValue::Type::Empty:
    case CellValue::Type::Error:
        break;
    }
    return 0;
}

CellValue FormulaEngine::eval(const ASTNodePtr &node, const CellSnapshot &snapshot) const {
    if (!node)
        return valueError();

    switch (node->kind) {
    case FormulaASTNode::Literal:
        return node->value;

    case FormulaASTNode::CellRef:
        return snapshot.value(node->cell);

    case FormulaASTNode::RangeRef:
        // Only reachable through MIN/MAX, which iterate the range themselves
        return valueError();

    case FormulaASTNode::UnaryOp: {
        CellValue v = eval(node->left, snapshot);
        if (v.isError())
            return v;
        auto n = v.toNumber();
        if (!n)
            return valueError();
        return CellValue::number(node->op == "-" ? -*n : *n);
    }

    case FormulaASTNode::BinaryOp:
        return evalBinary(*node, snapshot);

    case FormulaASTNode::FunctionCall:
        return callFunction(*node, snapshot);
    }

    return valueError();
}

CellValue FormulaEngine::evalBinary(const FormulaASTNode &node,
                                    const CellSnapshot &snapshot) const {
    CellValue l = eval(node.left, snapshot);
    if (l.isError())
        return l;
    CellValue r = eval(node.right, snapshot);
    if (r.isError())
        return r;

    const QString &op = node.op;
    if (isComparisonOp(op)) {
        int c = compareValues(l, r);
        if (op == "=")  return CellValue::boolean(c == 0);
        if (op == "<>") return CellValue::boolean(c != 0);
        if (op == "<")  return CellValue::boolean(c < 0);
        if (op == "<=") return CellValue::boolean(c <= 0);
        if (op == ">")  return CellValue::boolean(c > 0);
        return CellValue::boolean(c >= 0);
    }

    auto a = l.toNumber();
    auto b = r.toNumber();
    if (!a || !b)
        return valueError();

    double result = 0.0;
    if (op == "+") {
        result = *a + *b;
    } else if (op == "-") {
        result = *a - *b;
    } else if (op == "*") {
        result = *a * *b;
    } else if (op == "/") {
        if (*b == 0.0)
            return CellValue::error(CellErrorKind::DivisionByZero);
        result = *a / *b;
    } else if (op == "^") {
        if (*a == 0.0 && *b < 0.0)
            return CellValue::error(CellErrorKind::DivisionByZero);
        result = std::pow(*a, *b);
    } else {
        return valueError();
    }

    if (!std::isfinite(result))
        return CellValue::error(CellErrorKind::Num);
    return CellValue::number(result);
}

// ═══════════════════════════════════════════════════════════════════
// FUNCTION CALL DISPATCH
// ═══════════════════════════════════════════════════════════════════

CellValue FormulaEngine::callFunction(const FormulaASTNode &node,
                                      const CellSnapshot &snapshot) const {
    switch (node.function) {
    case FormulaFunction::If: {
        CellValue cond = eval(node.args[0], snapshot);
        if (cond.isError())
            return cond;
        bool truth = false;
        switch (cond.type()) {
        case CellValue::Type::Boolean:
            truth = cond.asBoolean();
            break;
        case CellValue::Type::Number:
            truth = cond.asNumber() != 0.0;
            break;
        case CellValue::Type::Empty:
            truth = false;
            break;
        case CellValue::Type::Text:
            if (cond.asText().compare("TRUE", Qt::CaseInsensitive) == 0)
                truth = true;
            else if (cond.asText().compare("FALSE", Qt::CaseInsensitive) == 0)
                truth = false;
            else
                return valueError();
            break;
        case CellValue::Type::Error:
            return cond;
        }
        // Only the selected branch is evaluated
        return eval(node.args[truth ? 1 : 2], snapshot);
    }

    case FormulaFunction::Sqrt: {
        CellValue v = eval(node.args[0], snapshot);
        if (v.isError())
            return v;
        auto n = v.toNumber();
        if (!n)
            return valueError();
        if (*n < 0.0)
            return CellValue::error(CellErrorKind::Num);
        return CellValue::number(std::sqrt(*n));
    }

    case FormulaFunction::Min:
    case FormulaFunction::Max:
        return evalMinMax(node, snapshot);
    }

    return valueError();
}

CellValue FormulaEngine::evalMinMax(const FormulaASTNode &node,
                                    const CellSnapshot &snapshot) const {
    const bool isMax = node.function == FormulaFunction::Max;
    bool any = false;
    double best = 0.0;

    auto consider = [&](double d) {
        if (!any || (isMax ? d > best : d < best))
            best = d;
        any = true;
    };

    for (const auto &arg : node.args) {
        if (arg->kind == FormulaASTNode::RangeRef) {
            const CellRange &r = arg->range;
            for (int row = r.topLeft.row; row <= r.bottomRight.row; ++row) {
                for (int col = r.topLeft.column; col <= r.bottomRight.column; ++col) {
                    CellValue v = snapshot.value(CellAddress(col, row));
                    if (v.isError())
                        return v;
                    // Text, booleans and blanks inside a range are skipped
                    if (v.isNumber())
                        consider(v.asNumber());
                }
            }
            continue;
        }

        if (arg->kind == FormulaASTNode::CellRef) {
            CellValue v = snapshot.value(arg->cell);
            if (v.isError())
                return v;
            if (v.isNumber())
                consider(v.asNumber());
            continue;
        }

        CellValue v = eval(arg, snapshot);
        if (v.isError())
            return v;
        auto n = v.toNumber();
        if (!n)
            return valueError();
        consider(*n);
    }

    return CellValue::number(any ? best : 0.0);
}

// ═══════════════════════════════════════════════════════════════════
// AST INTROSPECTION
// ═══════════════════════════════════════════════════════════════════

void FormulaEngine::collectReferences(const ASTNodePtr &node, FormulaReferences &out) const {
    if (!node)
        return;
    switch (node->kind) {
    case FormulaASTNode::CellRef:
        if (!out.cells.contains(node->cell))
            out.cells.append(node->cell);
        break;
    case FormulaASTNode::RangeRef:
        if (!out.ranges.contains(node->range))
            out.ranges.append(node->range);
        break;
    case FormulaASTNode::BinaryOp:
        collectReferences(node->left, out);
        collectReferences(node->right, out);
        break;
    case FormulaASTNode::UnaryOp:
        collectReferences(node->left, out);
        break;
    case FormulaASTNode::FunctionCall:
        for (const auto &arg : node->args)
            collectReferences(arg, out);
        break;
    case FormulaASTNode::Literal:
        break;
    }
}

} // namespace SheetCalc
