// return_source.hpp
// Return Source Interface for the Rolling Minimum-Variance Backtester
// Data acquisition happens outside the engine; sources materialize a full ReturnSeries up front

#pragma once

#include <string>
#include <vector>

namespace minvar {

class ReturnSeries;

// ============================================================================
// Return Source Interface
// ============================================================================

class IReturnSource {
public:
    virtual ~IReturnSource() = default;
    virtual ReturnSeries load() = 0;
    virtual std::vector<std::string> getTickers() const = 0;
    virtual std::string describe() const { return "UnnamedSource"; }
};

}  // namespace minvar
