/**
 * @file    recent_list.hpp
 * @brief   Recently viewed image list
 * @author  AllenK (Kwyshell)
 * @license MIT
 */

#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <filesystem>
#include <string>

namespace loupe {

inline constexpr std::size_t kDefaultRecentCapacity = 20;

struct RecentItem {
    std::filesystem::path path;
    std::chrono::system_clock::time_point last_viewed{};
    std::uint32_t view_count{0};
    std::uintmax_t file_size{0};

    [[nodiscard]] std::string name() const;
};

/**
 * Bounded list in insertion order, oldest first. Re-viewing an image bumps
 * its count and timestamp in place; past capacity the oldest-added entry
 * is dropped.
 */
class RecentList {
public:
    explicit RecentList(std::size_t capacity = kDefaultRecentCapacity);

    /**
     * Record a view of a file
     * @return  The stored entry
     */
    const RecentItem& record(
        const std::filesystem::path& path,
        std::chrono::system_clock::time_point when = std::chrono::system_clock::now()
    );

    [[nodiscard]] const std::deque<RecentItem>& items() const noexcept { return m_items; }
    [[nodiscard]] std::size_t size() const noexcept { return m_items.size(); }
    [[nodiscard]] std::size_t capacity() const noexcept { return m_capacity; }
    [[nodiscard]] bool empty() const noexcept { return m_items.empty(); }

    void clear() noexcept { m_items.clear(); }

private:
    std::size_t m_capacity;
    std::deque<RecentItem> m_items;
};

}  // namespace loupe
