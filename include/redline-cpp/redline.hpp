/// @file redline.hpp
/// @brief Umbrella header for the redline-cpp library.
///
/// Include this single header for access to the full pipeline:
/// parse_html, inline_diff, diff_trees / diff_html, resolve, and the
/// review helpers. JSON interop lives in redline-cpp/json.hpp.

#pragma once

#include <redline-cpp/html_parser.hpp>
#include <redline-cpp/inline_diff.hpp>
#include <redline-cpp/node.hpp>
#include <redline-cpp/resolve.hpp>
#include <redline-cpp/review.hpp>
#include <redline-cpp/tree_diff.hpp>
#include <redline-cpp/types.hpp>
