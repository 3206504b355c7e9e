#ifndef MONKEY_MONKEY_HPP
#define MONKEY_MONKEY_HPP

#include "monkey/global.hpp"
#include "monkey/lexer.hpp"
#include "monkey/syntax.hpp"
#include "monkey/parser.hpp"
#include "monkey/object.hpp"
#include "monkey/eval.hpp"

/*!\file monkey/monkey.hpp
 * \brief Main file of the project. You want to include this, nothing else.
 */

/*!\mainpage Monkey
 *
 * Lexer, parser and tree-walking evaluator for a small C-like expression
 * language.
 *
 *     <program> := <statement>*
 *     <statement> := 'let' <id> '=' <expr> [';']
 *                  | 'return' <expr> [';']
 *                  | <expr> [';']
 *     <block> := '{' <statement>* '}'
 *     <expr> := <id>
 *             | <int>
 *             | 'true' | 'false'
 *             | '(' <expr> ')'
 *             | '!' <expr>
 *             | '-' <expr>
 *             | <expr> '==' <expr>
 *             | <expr> '!=' <expr>
 *             | <expr> '<' <expr>
 *             | <expr> '>' <expr>
 *             | <expr> '+' <expr>
 *             | <expr> '-' <expr>
 *             | <expr> '*' <expr>
 *             | <expr> '/' <expr>
 *             | 'if' '(' <expr> ')' <block> [ 'else' <block> ]
 *             | 'fn' '(' [ <id> { ',' <id> } ] ')' <block>
 *
 * Precedence:
 *
 * - '==', '!=': 1
 * - '<', '>': 2
 * - '+', '-': 3
 * - '*', '/': 4
 * - prefix '!', '-': 5
 *
 * All binary operators are left associative.
 *
 * ## Semantics
 *
 *     Only false and null are falsy, every integer (0 too) is truthy.
 *
 *     'return' <expr> stops evaluation of all enclosing blocks, its value
 *     is the value of the program.
 *
 *     'if' evaluates to the value of the chosen block, null if no block
 *     was chosen.
 *
 *     Operators on mismatching types (e.g. 1 + true) are runtime errors.
 */

/*!\brief What interpret does with every program read.
 */
enum Mode {
  mode_eval,   //!< Evaluate and print the result
  mode_parse,  //!< Print canonical rendering of the parsed program
  mode_tokens, //!< Print every token
};

/*!\brief Interpret characters streamed from input.
 * \param input
 * \param mode
 * \param interpret_mode If true, every line is a program and a prompt is
 * printed. Otherwise the whole input is one program.
 * \return Returns true on success, false if error occured.
 */
bool interpret(std::istream &input, Mode mode = mode_eval,
    bool interpret_mode = false) noexcept;

#endif /* MONKEY_MONKEY_HPP */
