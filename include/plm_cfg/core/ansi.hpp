#pragma once

namespace plm_cfg {
namespace ansi {

// Raw SGR sequences.
constexpr const char* kReset  = "\033[0m";
constexpr const char* kBold   = "\033[1m";
constexpr const char* kDim    = "\033[90m";
constexpr const char* kRed    = "\033[1;31m";
constexpr const char* kGreen  = "\033[1;32m";
constexpr const char* kYellow = "\033[33m";
constexpr const char* kCyan   = "\033[36m";

// Styles for product structure output.
constexpr const char* kNodeHidden = kDim;
constexpr const char* kPrTagExpr  = kCyan;

} // namespace ansi
} // namespace plm_cfg
