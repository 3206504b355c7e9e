#ifndef MONKEY_EVAL_HPP
#define MONKEY_EVAL_HPP

/*!\file monkey/eval.hpp
 * \brief Tree-walking evaluator.
 */

#include "monkey/global.hpp"
#include "monkey/object.hpp"
#include "monkey/syntax.hpp"

/*!\brief Evaluates all statements of program in order.
 * \return Returns value of the last statement, the value of the first
 * return statement reached, or the first runtime error (ErrorObj).
 * NULL_OBJ for an empty program. Never a ReturnObj.
 * \see FnObj::getLiteral for values referring to program
 */
ObjectPtr eval(const Program &program) noexcept;

/*!\brief Evaluates a single statement.
 * \return Returns its value. A return statement yields a ReturnObj, which
 * block statements pass on unchanged.
 */
ObjectPtr eval(const Statement &stmt) noexcept;

//!\return Returns value of expr, an ErrorObj on runtime errors.
ObjectPtr eval(const Expr &expr) noexcept;

#endif /* MONKEY_EVAL_HPP */
