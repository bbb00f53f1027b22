#ifndef SHAPETYPE_SHAPETYPE_HPP
#define SHAPETYPE_SHAPETYPE_HPP

// Umbrella include for shape classification.
//
// Provides: type descriptions and their constructors, structural equality
// and assignability, object shapes and key sets, the mutability, presence,
// value-category and numeric-literal classifiers, key-set extractors,
// convenience aliases, the pretty printer, and the C++ type bridge.

#include <shapetype/aliases.hpp>
#include <shapetype/assign.hpp>
#include <shapetype/category.hpp>
#include <shapetype/equal.hpp>
#include <shapetype/key_set.hpp>
#include <shapetype/keys.hpp>
#include <shapetype/mutability.hpp>
#include <shapetype/numeric.hpp>
#include <shapetype/presence.hpp>
#include <shapetype/pretty.hpp>
#include <shapetype/reflect.hpp>
#include <shapetype/shape.hpp>
#include <shapetype/types.hpp>
#include <shapetype/union.hpp>

#endif // SHAPETYPE_SHAPETYPE_HPP
