#pragma once

#include <string>

#include "cvpress/Models.hpp"
#include "cvpress/RenderingConfig.hpp"

namespace cvpress {

// One output format. Bytes are returned in a std::string.
class Renderer {
public:
    virtual ~Renderer() = default;
    virtual std::string render(const ResumeContent& content, const RenderingConfig& config) const = 0;
};

}  // namespace cvpress
