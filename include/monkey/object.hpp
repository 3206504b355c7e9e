#ifndef MONKEY_OBJECT_HPP
#define MONKEY_OBJECT_HPP

/*!\file monkey/object.hpp
 * \brief Runtime values produced by evaluation.
 */

#include "monkey/global.hpp"
#include "monkey/syntax.hpp"

/*!\brief Types of runtime values.
 * \see Object::getObjectType
 */
enum ObjectType : int {
  obj_integer,  //!< 64-bit signed integer
  obj_boolean,  //!< true or false (singletons)
  obj_null,     //!< No value (singleton)
  obj_function, //!< Function value
  obj_return,   //!< Return signal wrapping a value
  obj_error,    //!< Runtime error
};

namespace std {
  std::string to_string(ObjectType type) noexcept;
};

class Object;

typedef std::shared_ptr<const Object> ObjectPtr;

/*!\brief Immutable runtime value (should only be used as parent class).
 */
class Object {
  ObjectType type;
public:
  Object(ObjectType type) : type{type} {}
  virtual ~Object() {}

  ObjectType getObjectType() const noexcept { return type; }

  //!\return Returns textual form for display.
  virtual std::string inspect() const noexcept = 0;
};

class IntObj : public Object {
  std::int64_t num;
public:
  IntObj(std::int64_t num) : Object(obj_integer), num{num} {}
  virtual ~IntObj() {}

  std::int64_t getNumber() const noexcept { return num; }

  virtual std::string inspect() const noexcept override {
    return std::to_string(num);
  }
};

/*!\brief Boolean value. Only TRUE_OBJ and FALSE_OBJ exist.
 */
class BoolObj : public Object {
  bool value;
public:
  BoolObj(bool value) : Object(obj_boolean), value{value} {}
  virtual ~BoolObj() {}

  bool getValue() const noexcept { return value; }

  virtual std::string inspect() const noexcept override {
    return value ? "true" : "false";
  }
};

/*!\brief No value. Only NULL_OBJ exists.
 */
class NullObj : public Object {
public:
  NullObj() : Object(obj_null) {}
  virtual ~NullObj() {}

  virtual std::string inspect() const noexcept override {
    return "null";
  }
};

/*!\brief Value of a function literal. Can't be called.
 *
 * The rendering is taken when the value is created, so inspect() stays
 * valid after the program is gone. getLiteral() doesn't.
 */
class FnObj : public Object {
  const FnExpr *literal;
  std::string text;
public:
  FnObj(const FnExpr *literal)
    : Object(obj_function), literal{literal}, text(literal->toString()) {}
  virtual ~FnObj() {}

  //!\return Returns the literal. Only valid while its program is alive.
  const FnExpr &getLiteral() const noexcept { return *literal; }

  virtual std::string inspect() const noexcept override {
    return text;
  }
};

/*!\brief Return signal. Unwinds through blocks until the program level.
 */
class ReturnObj : public Object {
  ObjectPtr value;
public:
  ReturnObj(ObjectPtr value) : Object(obj_return), value(std::move(value)) {}
  virtual ~ReturnObj() {}

  const ObjectPtr &getValue() const noexcept { return value; }

  virtual std::string inspect() const noexcept override {
    return value->inspect();
  }
};

/*!\brief Runtime error. Unwinds like ReturnObj, but through the program too.
 */
class ErrorObj : public Object {
  std::string msg;
public:
  ErrorObj(const std::string &msg) : Object(obj_error), msg(msg) {}
  virtual ~ErrorObj() {}

  const std::string &getMessage() const noexcept { return msg; }

  virtual std::string inspect() const noexcept override {
    return "ERROR: " + msg;
  }
};

extern const ObjectPtr TRUE_OBJ;
extern const ObjectPtr FALSE_OBJ;
extern const ObjectPtr NULL_OBJ;

//!\return Returns TRUE_OBJ or FALSE_OBJ.
const ObjectPtr &nativeBoolToObj(bool value) noexcept;

/*!\return Returns false for FALSE_OBJ and NULL_OBJ, true for everything
 * else (all integers included).
 */
bool isTruthy(const ObjectPtr &obj) noexcept;

#endif /* MONKEY_OBJECT_HPP */
