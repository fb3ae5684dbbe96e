/**
 * @file    recent_list.cpp
 * @brief   Recently viewed image list
 * @author  AllenK (Kwyshell)
 * @license MIT
 */

#include "io/recent_list.hpp"
#include "utils/path_formatter.hpp"

#include <algorithm>
#include <stdexcept>
#include <system_error>
#include <utility>

namespace loupe {

std::string RecentItem::name() const {
    return filename_utf8(path);
}

RecentList::RecentList(std::size_t capacity)
    : m_capacity(capacity)
{
    if (m_capacity == 0) {
        throw std::invalid_argument("Recent list capacity must be positive");
    }
}

const RecentItem& RecentList::record(
    const std::filesystem::path& path,
    std::chrono::system_clock::time_point when)
{
    std::error_code ec;
    const auto size = std::filesystem::file_size(path, ec);

    auto it = std::find_if(m_items.begin(), m_items.end(),
        [&](const RecentItem& item) { return item.path == path; });

    if (it != m_items.end()) {
        // Revisits keep their slot
        it->last_viewed = when;
        it->view_count += 1;
        it->file_size = ec ? 0 : size;
        return *it;
    }

    RecentItem item;
    item.path = path;
    item.last_viewed = when;
    item.view_count = 1;
    item.file_size = ec ? 0 : size;

    m_items.push_back(std::move(item));
    while (m_items.size() > m_capacity) {
        m_items.pop_front();
    }
    return m_items.back();
}

}  // namespace loupe
