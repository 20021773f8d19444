#pragma once

#include <string>
#include <vector>

#include "detection_engine/gl_data_source.hpp"

namespace gl_anomaly {

// Accounts, fiscal year/period and company code must match exactly; the date
// range is inclusive and compared on the YYYY-MM-DD posting date.
bool MatchesFilter(const gl::LineItem& item, const gl::LineItemFilter& filter);

// Reads a gl.LineItemBatch JSON export from disk on every fetch.
class LedgerFileSource final : public GLDataSource {
public:
    explicit LedgerFileSource(std::string path) : path_(std::move(path)) {}

    std::vector<gl::LineItem> GetGLLineItems(const gl::LineItemFilter& filter) const override;

private:
    std::string path_;
};

}  // namespace gl_anomaly
