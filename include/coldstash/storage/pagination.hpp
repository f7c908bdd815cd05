#pragma once

#include "coldstash/core/context.hpp"
#include "coldstash/storage/backend.hpp"

#include <functional>
#include <string>
#include <vector>

namespace coldstash {

/// One page of a cursor-paged listing.
struct Page {
    Status status;
    std::vector<std::string> names;
    bool truncated = false;
    std::string next_cursor;
};

/// Fetch the page that starts at `cursor` (empty for the first page).
using PageFetcher = std::function<Page(const std::string& cursor)>;

/// Follow cursors until a page is not truncated and return every name in
/// arrival order. Any failed page discards what was collected so far.
ListResult collect_all_pages(const Context& ctx, const PageFetcher& fetch);

} // namespace coldstash
