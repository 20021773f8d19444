#include "account_index.hpp"

namespace gl_anomaly {

AccountIndex AccountIndex::Build(const std::vector<gl::LineItem>& line_items) {
    AccountIndex index;
    for (const auto& item : line_items) {
        auto [it, inserted] = index.positions_.try_emplace(item.gl_account(), index.groups_.size());
        if (inserted) {
            index.groups_.push_back(AccountGroup{item.gl_account(), {}});
        }
        index.groups_[it->second].items.push_back(&item);
    }
    index.total_items_ = line_items.size();
    return index;
}

const AccountGroup* AccountIndex::Find(const std::string& gl_account) const {
    auto it = positions_.find(gl_account);
    if (it == positions_.end()) {
        return nullptr;
    }
    return &groups_[it->second];
}

LineItemRefs ToRefs(const std::vector<gl::LineItem>& line_items) {
    LineItemRefs refs;
    refs.reserve(line_items.size());
    for (const auto& item : line_items) {
        refs.push_back(&item);
    }
    return refs;
}

}  // namespace gl_anomaly
