#ifndef BONDCPP_BOND_HPP
#define BONDCPP_BOND_HPP

#include "byte_source.hpp"
#include "exception.hpp"
#include "json.hpp"
#include "observability.hpp"
#include "reader.hpp"
#include "types.hpp"
#include "value.hpp"

#endif // BONDCPP_BOND_HPP
