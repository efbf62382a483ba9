#ifndef FORMULA_ENGINE_H
#define FORMULA_ENGINE_H

/**
 * @file FormulaEngine.h
 * @brief Parser and evaluator for the restricted workbook formula language
 *
 * Engineers keep calculation logic as spreadsheet formulas; this engine
 * evaluates them against a snapshot of already-computed cell values.
 *
 * ═══════════════════════════════════════════════════════════════════
 * FORMULA SYNTAX
 * ═══════════════════════════════════════════════════════════════════
 *
 * ── Literals ──
 *   42, 3.14, 1e3, TRUE, FALSE, "text" ("" escapes a quote)
 *
 * ── Cell references (case-insensitive, $ markers ignored) ──
 *   B4, $B$4, aa12
 *   B2:B9                → range, only as a MIN/MAX argument
 *
 * ── Arithmetic (double precision) ──
 *   +  -  *  /  ^        unary + and -, parentheses
 *
 * ── Comparison (yield TRUE/FALSE) ──
 *   =  <>  <  <=  >  >=
 *
 * ── Functions ──
 *   IF(cond, a, b)   SQRT(x)   MIN(x, ...)   MAX(x, ...)
 *
 * A leading '=' is optional. Anything else (unknown function, wrong argument
 * count) is rejected as FormulaError.Unsupported at compile time; the engine
 * never evaluates part of a formula it does not fully understand.
 *
 * Evaluation is pure: division by zero, bad operands and negative square
 * roots produce error marker values (#DIV/0!, #VALUE!, #NUM!) which
 * propagate through any formula that reads them.
 *
 * ═══════════════════════════════════════════════════════════════════
 * USAGE EXAMPLE
 * ═══════════════════════════════════════════════════════════════════
 *
 *   FormulaEngine engine;
 *   CalcError err;
 *   FormulaPtr f = engine.compile("=B5*B4/8", &err);
 *
 *   CellSnapshot snapshot;
 *   snapshot.insert({2, 4}, CellValue::number(8));
 *   snapshot.insert({2, 5}, CellValue::number(50));
 *   CellValue moment = engine.evaluate(*f, snapshot);   // 50
 */

#include "core/CalcError.h"
#include "core/CellAddress.h"
#include "core/CellValue.h"
#include <QHash>
#include <QString>
#include <QVector>
#include <memory>
#include <optional>

namespace SheetCalc {

using CellSnapshot = QHash<CellAddress, CellValue>;

// ═══════════════════════════════════════════════════════════════════
// SUPPORTED FUNCTIONS (closed set; adding one means extending every switch)
// ═══════════════════════════════════════════════════════════════════

enum class FormulaFunction { If, Sqrt, Min, Max };

std::optional<FormulaFunction> functionFromName(const QString &name);
const char *functionName(FormulaFunction fn);
bool functionAcceptsArgCount(FormulaFunction fn, int count);

// ═══════════════════════════════════════════════════════════════════
// TOKEN
// ═══════════════════════════════════════════════════════════════════

struct FormulaToken {
    enum Type {
        Number,      // 8, 0.5, 1e3
        Text,        // "ADEQUATE"
        Boolean,     // TRUE / FALSE
        Identifier,  // function name
        CellRef,     // B4, $B$4
        Operator,    // + - * / ^ = <> < <= > >=
        LParen,
        RParen,
        Comma,
        Colon,       // range separator
        End
    };

    Type type = End;
    double numVal = 0.0;
    bool boolVal = false;
    QString strVal;
    CellAddress cell;
    int position = 0;
};

// ═══════════════════════════════════════════════════════════════════
// AST
// ═══════════════════════════════════════════════════════════════════

struct FormulaASTNode {
    enum Kind {
        Literal,       // constant value
        CellRef,       // single cell
        RangeRef,      // rectangular range (MIN/MAX argument only)
        BinaryOp,      // left op right
        UnaryOp,       // -expr / +expr
        FunctionCall   // IF / SQRT / MIN / MAX
    };

    Kind kind = Literal;
    CellValue value;                       // Literal
    CellAddress cell;                      // CellRef
    CellRange range;                       // RangeRef
    QString op;                            // BinaryOp / UnaryOp operator
    FormulaFunction function = FormulaFunction::If;
    std::shared_ptr<FormulaASTNode> left;  // BinaryOp left, UnaryOp operand
    std::shared_ptr<FormulaASTNode> right; // BinaryOp right
    QVector<std::shared_ptr<FormulaASTNode>> args;
    int depth = 1;                         // levels below and including this node
};

using ASTNodePtr = std::shared_ptr<FormulaASTNode>;

/**
 * @brief Cells and ranges a formula reads
 */
struct FormulaReferences {
    QVector<CellAddress> cells;
    QVector<CellRange> ranges;

    // Every referenced cell once, ranges expanded, in first-seen order
    QVector<CellAddress> expanded() const;
    bool isEmpty() const { return cells.isEmpty() && ranges.isEmpty(); }
};

/**
 * @brief A compiled formula; immutable and safe to share between threads
 */
struct ParsedFormula {
    QString source;
    ASTNodePtr root;
    FormulaReferences references;
};

using FormulaPtr = std::shared_ptr<const ParsedFormula>;

// ═══════════════════════════════════════════════════════════════════
// FORMULA ENGINE
// ═══════════════════════════════════════════════════════════════════

class FormulaEngine {
public:
    // Largest range a single reference may span
    static constexpr qint64 kMaxRangeCells = 100000;
    // Longest formula body accepted, in characters
    static constexpr int kMaxFormulaLength = 8192;
    // Parentheses, function calls and unary signs nested inside each other
    static constexpr int kMaxNestingDepth = 64;
    // Height of the expression tree (long operator chains)
    static constexpr int kMaxExpressionDepth = 512;

    FormulaEngine() = default;

    // True if raw cell content is a formula ("=...")
    static bool isFormulaText(const QString &raw);

    // ── Compile ──
    // Returns nullptr and fills *error (FormulaParse / FormulaUnsupported)
    FormulaPtr compile(const QString &expression, CalcError *error = nullptr) const;

    // ── Validate (parse-only) ──
    bool validate(const QString &expression, QString *errorMsg = nullptr) const;

    // ── Reference extraction ──
    // Parses the same grammar but needs no cell values
    std::optional<FormulaReferences> references(const QString &expression,
                                                CalcError *error = nullptr) const;

    // ── Evaluate ──
    // Cells missing from the snapshot read as empty
    CellValue evaluate(const ParsedFormula &formula, const CellSnapshot &snapshot) const;
    // Compile + evaluate; std::nullopt if the formula does not compile
    std::optional<CellValue> evaluate(const QString &expression,
                                      const CellSnapshot &snapshot,
                                      CalcError *error = nullptr) const;

private:
    // ── Tokenizer ──
    QVector<FormulaToken> tokenize(const QString &expr, CalcError &err) const;

    // ── Parser (recursive descent; depth counts nesting levels) ──
    ASTNodePtr parseComparison(const QVector<FormulaToken> &tokens, int &pos, int depth, CalcError &err) const;
    ASTNodePtr parseAddSub(const QVector<FormulaToken> &tokens, int &pos, int depth, CalcError &err) const;
    ASTNodePtr parseMulDiv(const QVector<FormulaToken> &tokens, int &pos, int depth, CalcError &err) const;
    ASTNodePtr parsePower(const QVector<FormulaToken> &tokens, int &pos, int depth, CalcError &err) const;
    ASTNodePtr parseUnary(const QVector<FormulaToken> &tokens, int &pos, int depth, CalcError &err) const;
    ASTNodePtr parsePrimary(const QVector<FormulaToken> &tokens, int &pos, int depth, CalcError &err) const;
    ASTNodePtr parseFunctionArg(const QVector<FormulaToken> &tokens, int &pos, int depth, CalcError &err) const;

    // ── AST evaluator ──
    CellValue eval(const ASTNodePtr &node, const CellSnapshot &snapshot) const;
    CellValue evalBinary(const FormulaASTNode &node, const CellSnapshot &snapshot) const;
    CellValue callFunction(const FormulaASTNode &node, const CellSnapshot &snapshot) const;
    CellValue evalMinMax(const FormulaASTNode &node, const CellSnapshot &snapshot) const;

    // ── AST introspection ──
    void collectReferences(const ASTNodePtr &node, FormulaReferences &out) const;
};

} // namespace SheetCalc

#endif // FORMULA_ENGINE_H
