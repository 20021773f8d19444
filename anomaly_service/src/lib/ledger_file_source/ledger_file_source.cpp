#include "ledger_file_source.hpp"

#include <algorithm>

#include <userver/fs/blocking/read.hpp>
#include <userver/logging/log.hpp>

#include "result_export/result_export.hpp"

namespace gl_anomaly {

bool MatchesFilter(const gl::LineItem& item, const gl::LineItemFilter& filter) {
    if (filter.gl_accounts_size() > 0 &&
        std::find(filter.gl_accounts().begin(), filter.gl_accounts().end(), item.gl_account()) ==
            filter.gl_accounts().end()) {
        return false;
    }
    if (item.fiscal_year() != filter.fiscal_year()) return false;
    if (filter.has_fiscal_period() && item.fiscal_period() != filter.fiscal_period()) return false;
    if (filter.has_company_code() && item.company_code() != filter.company_code()) return false;
    if (filter.has_from_date() && item.posting_date() < filter.from_date()) return false;
    if (filter.has_to_date() && item.posting_date() > filter.to_date()) return false;
    return true;
}

std::vector<gl::LineItem> LedgerFileSource::GetGLLineItems(const gl::LineItemFilter& filter) const {
    gl::LineItemBatch batch;
    FromJson(userver::fs::blocking::ReadFileContents(path_), batch);

    std::vector<gl::LineItem> items;
    for (auto& item : *batch.mutable_line_items()) {
        if (MatchesFilter(item, filter)) {
            items.push_back(std::move(item));
        }
    }

    LOG_INFO() << "Loaded " << items.size() << " of " << batch.line_items_size() << " line items from " << path_;
    return items;
}

}  // namespace gl_anomaly
