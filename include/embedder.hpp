#pragma once

#include "status.hpp"
#include <string>
#include <vector>

namespace wordclip {

// Text embedding backend. All vectors from one instance have dimension() floats.
class Embedder {
public:
    virtual ~Embedder() = default;

    virtual Status embed(const std::string& text, std::vector<float>& vector) = 0;

    // One vector per input text, in input order
    virtual Status batch_embed(const std::vector<std::string>& texts,
                               std::vector<std::vector<float>>& vectors) = 0;

    virtual size_t dimension() const = 0;
};

} // namespace wordclip
