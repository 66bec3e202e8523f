#ifndef PILAB_HPP
#define PILAB_HPP

// Include all library headers here
#include "axis_index.hpp"
#include "base_volume.hpp"
#include "field_descriptor.hpp"
#include "field_matcher.hpp"
#include "meta_query.hpp"
#include "meta_table.hpp"
#include "signal_filters.hpp"
#include "table_ops.hpp"
#include "volume_errors.hpp"

// This is the main header file for the pilab library
// Include this single header to access all functionality

#endif // PILAB_HPP
