#pragma once

#include <vector>

#include <gl/line_item.pb.h>

namespace gl_anomaly {

// Source accounting system the engine scans. Implementations report failures
// by throwing; the engine does not retry.
class GLDataSource {
public:
    virtual ~GLDataSource() = default;

    virtual std::vector<gl::LineItem> GetGLLineItems(const gl::LineItemFilter& filter) const = 0;
};

}  // namespace gl_anomaly
