#ifndef MONKEY_GLOBAL_HPP
#define MONKEY_GLOBAL_HPP

/*!\file monkey/global.hpp
 * \brief File for managing external headers.
 */

#include <cctype>
#include <cstdint>
#include <fstream>
#include <iostream>
#include <map>
#include <memory>
#include <sstream>
#include <string>
#include <vector>

#endif /* MONKEY_GLOBAL_HPP */
