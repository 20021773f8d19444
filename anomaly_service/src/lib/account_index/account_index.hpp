#pragma once

#include <string>
#include <unordered_map>
#include <vector>

#include <gl/line_item.pb.h>

namespace gl_anomaly {

using LineItemRefs = std::vector<const gl::LineItem*>;

struct AccountGroup {
    std::string gl_account;
    LineItemRefs items;
};

// Partition of a fetched batch by GL account, built once per run and shared
// by every detector. Groups keep first-appearance order, items keep batch order.
// Holds pointers into the batch, which must outlive the index.
class AccountIndex {
public:
    static AccountIndex Build(const std::vector<gl::LineItem>& line_items);

    const std::vector<AccountGroup>& Groups() const { return groups_; }
    const AccountGroup* Find(const std::string& gl_account) const;

    std::size_t TotalItems() const { return total_items_; }

private:
    std::vector<AccountGroup> groups_;
    std::unordered_map<std::string, std::size_t> positions_;
    std::size_t total_items_ = 0;
};

LineItemRefs ToRefs(const std::vector<gl::LineItem>& line_items);

}  // namespace gl_anomaly
