#include "monkey/object.hpp"

const ObjectPtr TRUE_OBJ = std::make_shared<BoolObj>(true);
const ObjectPtr FALSE_OBJ = std::make_shared<BoolObj>(false);
const ObjectPtr NULL_OBJ = std::make_shared<NullObj>();

const ObjectPtr &nativeBoolToObj(bool value) noexcept {
  return value ? TRUE_OBJ : FALSE_OBJ;
}

bool isTruthy(const ObjectPtr &obj) noexcept {
  return obj != FALSE_OBJ && obj != NULL_OBJ;
}

std::string std::to_string(ObjectType type) noexcept {
  switch (type) {
  case obj_integer:
    return "INTEGER";
  case obj_boolean:
    return "BOOLEAN";
  case obj_null:
    return "NULL";
  case obj_function:
    return "FUNCTION";
  case obj_return:
    return "RETURN_VALUE";
  case obj_error:
    return "ERROR";
  }

  return ""; // invalid
}
