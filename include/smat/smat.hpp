#pragma once

#include "smat/config.hpp"
#include "smat/version.hpp"
#include "smat/core/type.hpp"
#include "smat/core/error.hpp"
#include "smat/core/checked.hpp"
#include "smat/core/sparse.hpp"
#include "smat/threading/scheduler.hpp"
#include "smat/threading/parallel_for.hpp"
#include "smat/kernel/arith.hpp"
#include "smat/io/text.hpp"
#include "smat/app/dispatch.hpp"

// =============================================================================
/// @file smat.hpp
/// @brief Single include for the SMAT C++ API
///
/// @section Usage
///
/// @code{.cpp}
/// auto a = smat::io::load_file("matrix1.txt");
/// auto b = smat::io::load_file("matrix2.txt");
/// smat::io::save_file("product.txt", smat::multiply(a, b));
/// @endcode
///
/// =============================================================================

namespace smat {

using kernel::arith::ArithOptions;
using kernel::arith::add;
using kernel::arith::subtract;
using kernel::arith::multiply;

using io::HeaderMode;
using io::ParseOptions;

} // namespace smat
